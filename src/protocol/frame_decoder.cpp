/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/frame_decoder.hpp"
#include "protocol/wire.hpp"
#include "utils/debug.hpp"

zxfer::frame_decoder_t::frame_decoder_t (size_t max_name_len_,
                                         uint64_t max_file_size_) :
    _max_name_len (max_name_len_),
    _max_file_size (std::min (max_file_size_, frame_max_file_size))
{
    next_step (_tmpbuf, frame_name_len_size, &frame_decoder_t::length_ready);
}

zxfer::frame_decoder_t::~frame_decoder_t ()
{
}

int zxfer::frame_decoder_t::length_ready (unsigned char const *)
{
    const uint32_t name_len = get_uint32 (_tmpbuf);
    if (name_len > _max_name_len) {
        ZXFER_DBG_ENGINE ("name length %u exceeds limit %zu", name_len,
                          _max_name_len);
        errno = EPROTO;
        return -1;
    }

    //  A zero-length name is legal on the wire; the receiver decides
    //  whether it can store it.
    _name.resize (name_len);
    next_step (_name.empty () ? NULL : &_name[0], _name.size (),
               &frame_decoder_t::name_ready);
    return 0;
}

int zxfer::frame_decoder_t::name_ready (unsigned char const *)
{
    next_step (_tmpbuf, frame_file_size_size, &frame_decoder_t::size_ready);
    return 0;
}

int zxfer::frame_decoder_t::size_ready (unsigned char const *)
{
    const uint64_t size = get_uint64 (_tmpbuf);
    if (size > _max_file_size) {
        ZXFER_DBG_ENGINE ("declared size %llu exceeds limit %llu",
                          static_cast<unsigned long long> (size),
                          static_cast<unsigned long long> (_max_file_size));
        errno = EPROTO;
        return -1;
    }

    _frame.name.assign (_name.begin (), _name.end ());
    _frame.size = size;

    next_step (_tmpbuf, frame_name_len_size, &frame_decoder_t::length_ready);
    return 1;
}
