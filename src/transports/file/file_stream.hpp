/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZXFER_FILE_STREAM_HPP_INCLUDED__
#define __ZXFER_FILE_STREAM_HPP_INCLUDED__

#include <stdint.h>
#include <string>

#include "transports/i_stream.hpp"

namespace zxfer
{
//  Stream over a local file descriptor. Every failure is reported as
//  EFILEIO; the underlying system error is kept in last_error ().

class file_stream_t ZXFER_FINAL : public i_stream
{
  public:
    file_stream_t ();
    ~file_stream_t () ZXFER_OVERRIDE;

    //  Opens an existing file for reading. Only regular files are
    //  accepted; size_ receives the file length.
    int open_read (const std::string &path_, uint64_t &size_);

    //  Creates or truncates a file for writing.
    int open_write (const std::string &path_);

    //  Creates a new, uniquely named file in dir_ for writing. The name
    //  starts with prefix_ and never matches an existing file; path ()
    //  returns it afterwards.
    int open_temp (const std::string &dir_, const std::string &prefix_);

    //  Closes the file and reports any error the close itself returns.
    int finish ();

    //  System errno of the most recent failure.
    int last_error () const { return _last_error; }

    const std::string &path () const { return _path; }

    //  i_stream implementation
    bool is_open () const ZXFER_OVERRIDE { return _fd != -1; }
    void close () ZXFER_OVERRIDE;
    int read_some (unsigned char *buffer_, size_t size_) ZXFER_OVERRIDE;
    int write_all (const unsigned char *buffer_, size_t size_) ZXFER_OVERRIDE;
    const char *name () const ZXFER_OVERRIDE { return "file"; }

  private:
    int fail (int errno_);

    int _fd;
    std::string _path;
    int _last_error;

    ZXFER_NON_COPYABLE_NOR_MOVABLE (file_stream_t)
};
}

#endif
