/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZXFER_FRAME_HPP_INCLUDED__
#define __ZXFER_FRAME_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>
#include <string>

namespace zxfer
{
//  Frame layout (all integers in network byte order, no padding):
//
//    +-----------------+------------------+------------------+
//    | name_len uint32 | name (name_len)  | size uint64      |
//    +-----------------+------------------+------------------+
//
//  The frame is followed by exactly 'size' payload bytes. The session ends
//  when the sender closes the stream with no further frame bytes pending.

const size_t frame_name_len_size = 4;
const size_t frame_file_size_size = 8;

//  Largest payload the wire format may declare.
const uint64_t frame_max_file_size = 0x7fffffffffffffffULL;

//  Largest header the codec produces for a name of name_len_ bytes.
inline size_t frame_header_size (size_t name_len_)
{
    return frame_name_len_size + name_len_ + frame_file_size_size;
}

struct frame_t
{
    frame_t () : size (0) {}
    frame_t (const std::string &name_, uint64_t size_) :
        name (name_),
        size (size_)
    {
    }

    //  File name as sent by the peer; may still carry path components.
    std::string name;

    //  Number of payload bytes following the frame.
    uint64_t size;
};
}

#endif
