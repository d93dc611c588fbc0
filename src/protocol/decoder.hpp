/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZXFER_DECODER_HPP_INCLUDED__
#define __ZXFER_DECODER_HPP_INCLUDED__

#include <stddef.h>
#include <string.h>
#include <algorithm>

#include "protocol/i_decoder.hpp"

namespace zxfer
{
//  Helper base class for decoders that know the amount of data to read
//  in advance at any moment. Knowing the amount in advance is a property
//  of the protocol used. The frame protocol qualifies: every field is
//  either fixed-width or preceded by its length. No delimiter scanning
//  ever happens, so file names may contain arbitrary bytes.
//
//  This class implements the state machine that parses the incoming buffer.
//  Derived class should implement individual state machine actions.
//
//  The decoder copies into storage the derived class provides through
//  next_step(). Payload bytes never pass through the decoder: once a frame
//  is complete, decode() returns and the caller takes the remaining input.

template <typename T> class decoder_base_t : public i_decoder
{
  public:
    decoder_base_t () :
        _next (NULL),
        _read_pos (NULL),
        _to_read (0),
        _in_frame (false)
    {
    }

    //  Processes the data in the buffer previously allocated using
    //  get_buffer function. size_ argument specifies the number of bytes
    //  actually filled into the buffer. Function returns 1 when the whole
    //  frame was decoded or -1 on error (errno set); 0 means that more
    //  data is required. bytes_used_ is set to the number of bytes
    //  consumed, which stops right after the end of a complete frame.
    int decode (const unsigned char *data_,
                size_t size_,
                size_t &bytes_used_) ZXFER_FINAL
    {
        bytes_used_ = 0;

        while (bytes_used_ < size_) {
            //  Copy the data from buffer to the frame field being read.
            const size_t to_copy = std::min (_to_read, size_ - bytes_used_);
            if (to_copy > 0) {
                memcpy (_read_pos, data_ + bytes_used_, to_copy);
                _in_frame = true;
            }

            _read_pos += to_copy;
            _to_read -= to_copy;
            bytes_used_ += to_copy;

            //  Try to get more space in the frame to fill in.
            //  If none is available, return.
            while (!_to_read) {
                const int rc =
                  (static_cast<T *> (this)->*_next) (data_ + bytes_used_);
                if (rc == 1)
                    _in_frame = false;
                if (rc != 0)
                    return rc;
            }
        }

        return 0;
    }

    bool in_frame () const ZXFER_FINAL { return _in_frame; }

  protected:
    //  Prototype of state machine action. Action should return 0 if
    //  it is unable to push the data to the upper layers, 1 if a frame is
    //  complete and -1 on a protocol violation.
    typedef int (T::*step_t) (unsigned char const *);

    //  This function should be called from derived class to read data
    //  from the buffer and schedule next state machine action.
    void next_step (void *read_pos_, size_t to_read_, step_t next_)
    {
        _read_pos = static_cast<unsigned char *> (read_pos_);
        _to_read = to_read_;
        _next = next_;
    }

  private:
    //  Next step. If set to NULL, it means that associated data stream
    //  is dead. Note that there can be still data in the process in such
    //  case.
    step_t _next;

    //  Where to store the read data.
    unsigned char *_read_pos;

    //  How much data to read before taking next step.
    size_t _to_read;

    //  True once bytes of the current frame have been consumed.
    bool _in_frame;

    ZXFER_NON_COPYABLE_NOR_MOVABLE (decoder_base_t)
};
}

#endif
