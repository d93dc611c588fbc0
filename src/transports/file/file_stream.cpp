/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "transports/file/file_stream.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

#include <fcntl.h>
#include <limits.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <vector>

#if defined ZXFER_HAVE_O_CLOEXEC
#define ZXFER_OPEN_FLAGS O_CLOEXEC
#else
#define ZXFER_OPEN_FLAGS 0
#endif

zxfer::file_stream_t::file_stream_t () : _fd (-1), _last_error (0)
{
}

zxfer::file_stream_t::~file_stream_t ()
{
    close ();
}

int zxfer::file_stream_t::fail (int errno_)
{
    ZXFER_DBG_FILE ("%s: %s", _path.c_str (), strerror (errno_));
    _last_error = errno_;
    errno = EFILEIO;
    return -1;
}

int zxfer::file_stream_t::open_read (const std::string &path_,
                                     uint64_t &size_)
{
    zxfer_assert (_fd == -1);
    _path = path_;

    _fd = ::open (path_.c_str (), O_RDONLY | ZXFER_OPEN_FLAGS);
    if (_fd == -1)
        return fail (errno);

    struct stat st;
    if (fstat (_fd, &st) == -1) {
        const int err = errno;
        close ();
        return fail (err);
    }
    if (!S_ISREG (st.st_mode)) {
        close ();
        return fail (S_ISDIR (st.st_mode) ? EISDIR : EINVAL);
    }

    size_ = static_cast<uint64_t> (st.st_size);
    return 0;
}

int zxfer::file_stream_t::open_write (const std::string &path_)
{
    zxfer_assert (_fd == -1);
    _path = path_;

    _fd = ::open (path_.c_str (), O_WRONLY | O_CREAT | O_TRUNC | ZXFER_OPEN_FLAGS,
                  0644);
    if (_fd == -1)
        return fail (errno);
    return 0;
}

int zxfer::file_stream_t::open_temp (const std::string &dir_,
                                     const std::string &prefix_)
{
    zxfer_assert (_fd == -1);

    std::string pattern = dir_;
    if (!pattern.empty () && pattern[pattern.size () - 1] != '/')
        pattern += '/';
    pattern += prefix_;
    pattern += "XXXXXX";
    _path = pattern;

    std::vector<char> path (pattern.begin (), pattern.end ());
    path.push_back ('\0');

    //  mkstemp opens with O_EXCL, so an existing file is never reused.
    _fd = mkstemp (&path[0]);
    if (_fd == -1)
        return fail (errno);
    _path = &path[0];

    //  mkstemp creates the file private to the owner.
    if (fchmod (_fd, 0644) == -1
        || fcntl (_fd, F_SETFD, FD_CLOEXEC) == -1) {
        const int err = errno;
        close ();
        if (unlink (_path.c_str ()) == -1)
            ZXFER_DBG_FILE ("cannot remove %s: %s", _path.c_str (),
                            strerror (errno));
        return fail (err);
    }
    return 0;
}

int zxfer::file_stream_t::finish ()
{
    if (_fd == -1)
        return 0;
    const int rc = ::close (_fd);
    _fd = -1;
    if (rc == -1)
        return fail (errno);
    return 0;
}

void zxfer::file_stream_t::close ()
{
    if (_fd == -1)
        return;
    if (::close (_fd) == -1)
        _last_error = errno;
    _fd = -1;
}

int zxfer::file_stream_t::read_some (unsigned char *buffer_, size_t size_)
{
    if (_fd == -1)
        return fail (EBADF);
    if (size_ > INT_MAX)
        size_ = INT_MAX;

    ssize_t nbytes;
    do {
        nbytes = ::read (_fd, buffer_, size_);
    } while (nbytes == -1 && errno == EINTR);

    if (nbytes == -1)
        return fail (errno);
    return static_cast<int> (nbytes);
}

int zxfer::file_stream_t::write_all (const unsigned char *buffer_,
                                     size_t size_)
{
    if (_fd == -1)
        return fail (EBADF);

    while (size_ > 0) {
        const ssize_t nbytes = ::write (_fd, buffer_, size_);
        if (nbytes == -1) {
            if (errno == EINTR)
                continue;
            return fail (errno);
        }
        buffer_ += nbytes;
        size_ -= static_cast<size_t> (nbytes);
    }
    return 0;
}
