/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZXFER_COPY_HPP_INCLUDED__
#define __ZXFER_COPY_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

namespace zxfer
{
class i_stream;

//  Moves exactly n_ bytes from from_ to to_ through buf_ (bufsize_ bytes).
//  Returns 1 when all bytes were moved, 0 if from_ reached end of stream
//  first and -1 on an I/O error (errno set by the failing stream).
//  copied_, if given, receives the number of bytes moved.
int copy_exact (i_stream *from_,
                i_stream *to_,
                uint64_t n_,
                unsigned char *buf_,
                size_t bufsize_,
                uint64_t *copied_ = NULL);
}

#endif
