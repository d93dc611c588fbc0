/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZXFER_FRAME_DECODER_HPP_INCLUDED__
#define __ZXFER_FRAME_DECODER_HPP_INCLUDED__

#include <vector>

#include "protocol/decoder.hpp"
#include "protocol/frame.hpp"

namespace zxfer
{
//  Decoder for file frames. Rejects names longer than max_name_len_ and
//  sizes above max_file_size_ with EPROTO. After decode() returns 1 the
//  decoded frame is available through frame() until the next call.
class frame_decoder_t ZXFER_FINAL : public decoder_base_t<frame_decoder_t>
{
  public:
    frame_decoder_t (size_t max_name_len_, uint64_t max_file_size_);
    ~frame_decoder_t ();

    const frame_t *frame () const ZXFER_OVERRIDE { return &_frame; }

  private:
    int length_ready (unsigned char const *);
    int name_ready (unsigned char const *);
    int size_ready (unsigned char const *);

    unsigned char _tmpbuf[frame_file_size_size];
    std::vector<unsigned char> _name;
    frame_t _frame;

    const size_t _max_name_len;
    const uint64_t _max_file_size;

    ZXFER_NON_COPYABLE_NOR_MOVABLE (frame_decoder_t)
};
}

#endif
