/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"

#include "sockets/socket_base.hpp"
#include "utils/err.hpp"
#include "utils/macros.hpp"

void zxfer_version (int *major_, int *minor_, int *patch_)
{
    *major_ = ZXFER_VERSION_MAJOR;
    *minor_ = ZXFER_VERSION_MINOR;
    *patch_ = ZXFER_VERSION_PATCH;
}

const char *zxfer_strerror (int errnum_)
{
    return zxfer::errno_to_string (errnum_);
}

int zxfer_errno (void)
{
    return errno;
}

//  Sockets

static zxfer::socket_base_t *as_socket_base_t (void *s_)
{
    zxfer::socket_base_t *s = static_cast<zxfer::socket_base_t *> (s_);
    if (!s_ || !s->check_tag ()) {
        errno = ENOTSOCK;
        return NULL;
    }
    return s;
}

void *zxfer_socket (int type_)
{
    return zxfer::socket_base_t::create (type_);
}

int zxfer_close (void *s_)
{
    zxfer::socket_base_t *s = as_socket_base_t (s_);
    if (!s)
        return -1;
    s->close ();
    LIBZXFER_DELETE (s);
    return 0;
}

int zxfer_setsockopt (void *s_,
                      int option_,
                      const void *optval_,
                      size_t optvallen_)
{
    zxfer::socket_base_t *s = as_socket_base_t (s_);
    if (!s)
        return -1;
    return s->setsockopt (option_, optval_, optvallen_);
}

int zxfer_getsockopt (void *s_, int option_, void *optval_, size_t *optvallen_)
{
    zxfer::socket_base_t *s = as_socket_base_t (s_);
    if (!s)
        return -1;
    if (!optval_ || !optvallen_) {
        errno = EFAULT;
        return -1;
    }
    return s->getsockopt (option_, optval_, optvallen_);
}

int zxfer_monitor (void *s_, zxfer_monitor_fn *monitor_, void *hint_, int events_)
{
    zxfer::socket_base_t *s = as_socket_base_t (s_);
    if (!s)
        return -1;
    return s->monitor (monitor_, hint_, events_);
}

//  Receiver side

int zxfer_bind (void *s_, const char *addr_)
{
    zxfer::socket_base_t *s = as_socket_base_t (s_);
    if (!s)
        return -1;
    if (!addr_) {
        errno = EINVAL;
        return -1;
    }
    return s->bind (addr_);
}

int zxfer_recv_session (void *s_)
{
    zxfer::socket_base_t *s = as_socket_base_t (s_);
    if (!s)
        return -1;
    return s->recv_session ();
}

int zxfer_serve (void *s_, int max_sessions_)
{
    zxfer::socket_base_t *s = as_socket_base_t (s_);
    if (!s)
        return -1;
    return s->serve (max_sessions_);
}

//  Sender side

int zxfer_connect (void *s_, const char *addr_)
{
    zxfer::socket_base_t *s = as_socket_base_t (s_);
    if (!s)
        return -1;
    if (!addr_) {
        errno = EINVAL;
        return -1;
    }
    return s->connect (addr_);
}

int zxfer_send_file (void *s_, const char *path_)
{
    zxfer::socket_base_t *s = as_socket_base_t (s_);
    if (!s)
        return -1;
    if (!path_) {
        errno = EINVAL;
        return -1;
    }
    return s->send_file (path_);
}

int zxfer_disconnect (void *s_)
{
    zxfer::socket_base_t *s = as_socket_base_t (s_);
    if (!s)
        return -1;
    return s->disconnect ();
}
