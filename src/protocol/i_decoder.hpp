/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZXFER_I_DECODER_HPP_INCLUDED__
#define __ZXFER_I_DECODER_HPP_INCLUDED__

#include <stddef.h>

#include "utils/macros.hpp"

namespace zxfer
{
struct frame_t;

//  Interface to be implemented by frame decoder.

class i_decoder
{
  public:
    virtual ~i_decoder () ZXFER_DEFAULT;

    //  Consumes up to size_ bytes of data_. Returns 1 when a frame has been
    //  decoded, 0 when more data is needed and -1 on a protocol violation
    //  (errno set). bytes_used_ receives the number of bytes consumed.
    virtual int
    decode (const unsigned char *data_, size_t size_, size_t &bytes_used_) = 0;

    //  True when part of a frame has been consumed but the frame is not
    //  complete yet.
    virtual bool in_frame () const = 0;

    virtual const frame_t *frame () const = 0;
};
}

#endif
