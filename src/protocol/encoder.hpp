/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZXFER_ENCODER_HPP_INCLUDED__
#define __ZXFER_ENCODER_HPP_INCLUDED__

#include <stddef.h>
#include <stdlib.h>
#include <string.h>
#include <algorithm>

#include "utils/err.hpp"
#include "protocol/i_encoder.hpp"

namespace zxfer
{
//  Helper base class for encoders. It implements the state machine that
//  fills the outgoing buffer. Derived classes should implement individual
//  state machine actions.
//
//  The encode() function may return a pointer directly to the frame data
//  (zero-copy path). That pointer stays valid until the next call to
//  encode() or load_frame(), and only as long as the loaded frame lives.
//  The stream write is synchronous, so the engine writes the returned batch
//  before asking for the next one.

template <typename T> class encoder_base_t : public i_encoder
{
  public:
    explicit encoder_base_t (size_t bufsize_) :
        _write_pos (0),
        _to_write (0),
        _next (NULL),
        _new_frame_flag (false),
        _buf_size (bufsize_),
        _buf (static_cast<unsigned char *> (malloc (bufsize_))),
        _in_progress (NULL)
    {
        alloc_assert (_buf);
    }

    ~encoder_base_t () ZXFER_OVERRIDE { free (_buf); }

    //  The function returns a batch of binary data. The data
    //  are filled to a supplied buffer. If no buffer is supplied (data_
    //  points to NULL) encoder object will provide buffer of its own.
    size_t encode (unsigned char **data_, size_t size_) ZXFER_FINAL
    {
        unsigned char *buffer = !*data_ ? _buf : *data_;
        const size_t buffersize = !*data_ ? _buf_size : size_;

        if (in_progress () == NULL)
            return 0;

        size_t pos = 0;
        while (pos < buffersize) {
            //  If there are no more data to return, run the state machine.
            //  If there are still no data, return what we already have
            //  in the buffer.
            if (!_to_write) {
                if (_new_frame_flag) {
                    _in_progress = NULL;
                    break;
                }
                (static_cast<T *> (this)->*_next) ();
                continue;
            }

            //  If there are no data in the buffer yet and we are able to
            //  fill whole buffer in a single go, let's use zero-copy.
            //  Long file names are handed out directly rather than being
            //  copied through the buffer.
            if (!pos && !*data_ && _to_write >= buffersize) {
                *data_ = _write_pos;
                pos = _to_write;
                _write_pos = NULL;
                _to_write = 0;
                return pos;
            }

            //  Copy data to the buffer. If the buffer is full, return.
            const size_t to_copy = std::min (_to_write, buffersize - pos);
            memcpy (buffer + pos, _write_pos, to_copy);
            pos += to_copy;
            _write_pos += to_copy;
            _to_write -= to_copy;
        }

        *data_ = buffer;
        return pos;
    }

    void load_frame (const frame_t *frame_) ZXFER_FINAL
    {
        zxfer_assert (in_progress () == NULL);
        _in_progress = frame_;
        (static_cast<T *> (this)->*_next) ();
    }

  protected:
    //  Prototype of state machine action.
    typedef void (T::*step_t) ();

    //  This function should be called from derived class to write the data
    //  to the buffer and schedule next state machine action.
    void next_step (void *write_pos_,
                    size_t to_write_,
                    step_t next_,
                    bool new_frame_flag_)
    {
        _write_pos = static_cast<unsigned char *> (write_pos_);
        _to_write = to_write_;
        _next = next_;
        _new_frame_flag = new_frame_flag_;
    }

    const frame_t *in_progress () const { return _in_progress; }

  private:
    //  Where to get the data to write from.
    unsigned char *_write_pos;

    //  How much data to write before next step should be executed.
    size_t _to_write;

    //  Next step. If set to NULL, it means that associated data stream
    //  is dead.
    step_t _next;

    bool _new_frame_flag;

    //  The buffer for encoded data.
    const size_t _buf_size;
    unsigned char *const _buf;

    const frame_t *_in_progress;

    ZXFER_NON_COPYABLE_NOR_MOVABLE (encoder_base_t)
};
}

#endif
