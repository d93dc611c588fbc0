/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZXFER_I_STREAM_HPP_INCLUDED__
#define __ZXFER_I_STREAM_HPP_INCLUDED__

#include <stddef.h>

#include "utils/macros.hpp"

namespace zxfer
{
//  Blocking byte stream abstraction shared by network connections and
//  local files. Engines move payload between two streams without knowing
//  which kind each one is.

class i_stream
{
  public:
    virtual ~i_stream () ZXFER_DEFAULT;

    //  Check if stream is open and ready for I/O
    virtual bool is_open () const = 0;

    //  Close the stream. Safe to call more than once.
    virtual void close () = 0;

    //  Reads at most size_ bytes into buffer_. Returns the number of bytes
    //  read, 0 at end of stream or -1 on error (errno set).
    virtual int read_some (unsigned char *buffer_, size_t size_) = 0;

    //  Writes all size_ bytes of buffer_. Returns 0 on success or -1 on
    //  error (errno set); a partial write is an error.
    virtual int write_all (const unsigned char *buffer_, size_t size_) = 0;

    //  Get stream name for debugging
    virtual const char *name () const = 0;
};
}

#endif
