/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/frame_encoder.hpp"
#include "protocol/wire.hpp"

zxfer::frame_encoder_t::frame_encoder_t (size_t bufsize_) :
    encoder_base_t<frame_encoder_t> (bufsize_)
{
    next_step (NULL, 0, &frame_encoder_t::length_ready, true);
}

zxfer::frame_encoder_t::~frame_encoder_t ()
{
}

void zxfer::frame_encoder_t::length_ready ()
{
    const frame_t *frame = in_progress ();

    put_uint32 (_tmp_buf, static_cast<uint32_t> (frame->name.size ()));
    next_step (_tmp_buf, frame_name_len_size, &frame_encoder_t::name_ready,
               false);
}

void zxfer::frame_encoder_t::name_ready ()
{
    const std::string &name = in_progress ()->name;

    //  The encoder only reads through the pointer.
    next_step (const_cast<char *> (name.data ()), name.size (),
               &frame_encoder_t::size_ready, false);
}

void zxfer::frame_encoder_t::size_ready ()
{
    put_uint64 (_tmp_buf, in_progress ()->size);
    next_step (_tmp_buf, frame_file_size_size, &frame_encoder_t::length_ready,
               true);
}
