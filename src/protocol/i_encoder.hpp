/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZXFER_I_ENCODER_HPP_INCLUDED__
#define __ZXFER_I_ENCODER_HPP_INCLUDED__

#include <stddef.h>

#include "utils/macros.hpp"

namespace zxfer
{
//  Forward declaration
struct frame_t;

//  Interface to be implemented by frame encoder.

struct i_encoder
{
    virtual ~i_encoder () ZXFER_DEFAULT;

    //  The function returns a batch of binary data. The data
    //  are filled to a supplied buffer. If no buffer is supplied (data_
    //  is NULL) encoder will provide buffer of its own.
    //  Function returns 0 when a new frame is required.
    virtual size_t encode (unsigned char **data_, size_t size_) = 0;

    //  Load a new frame into encoder.
    virtual void load_frame (const frame_t *frame_) = 0;
};
}

#endif
