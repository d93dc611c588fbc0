/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZXFER_FRAME_ENCODER_HPP_INCLUDED__
#define __ZXFER_FRAME_ENCODER_HPP_INCLUDED__

#include "protocol/encoder.hpp"
#include "protocol/frame.hpp"

namespace zxfer
{
//  Encoder for file frames (name length, name, file size).
//  The caller guarantees the name fits into 32 bits of length.
class frame_encoder_t ZXFER_FINAL : public encoder_base_t<frame_encoder_t>
{
  public:
    explicit frame_encoder_t (size_t bufsize_);
    ~frame_encoder_t ();

  private:
    void length_ready ();
    void name_ready ();
    void size_ready ();

    unsigned char _tmp_buf[frame_file_size_size];

    ZXFER_NON_COPYABLE_NOR_MOVABLE (frame_encoder_t)
};
}

#endif
