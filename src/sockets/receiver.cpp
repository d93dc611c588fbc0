/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "sockets/receiver.hpp"
#include "engine/recv_engine.hpp"
#include "transports/tcp/tcp_listener.hpp"
#include "transports/tcp/tcp_stream.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

#include <new>

zxfer::receiver_t::receiver_t () :
    socket_base_t (ZXFER_RECEIVER),
    _listener (NULL)
{
}

zxfer::receiver_t::~receiver_t ()
{
    LIBZXFER_DELETE (_listener);
}

int zxfer::receiver_t::bind (const char *addr_)
{
    if (_listener) {
        errno = EFSM;
        return -1;
    }

    tcp_listener_t *listener =
      new (std::nothrow) tcp_listener_t (_io_context, this, options);
    alloc_assert (listener);

    if (listener->set_local_address (addr_) != 0) {
        const int err = errno;
        LIBZXFER_DELETE (listener);
        errno = err;
        return -1;
    }

    const int rc = listener->get_local_address (_last_endpoint);
    zxfer_assert (rc == 0);
    _listener = listener;
    return 0;
}

int zxfer::receiver_t::recv_session ()
{
    if (!_listener) {
        errno = EFSM;
        return -1;
    }

    tcp_stream_t *stream = _listener->accept ();
    if (!stream)
        return -1;

    recv_engine_t engine (stream, this, options, stream->remote_address ());
    const int rc = engine.run ();
    const int err = errno;
    LIBZXFER_DELETE (stream);
    errno = err;
    return rc;
}

int zxfer::receiver_t::serve (int max_sessions_)
{
    if (!_listener) {
        errno = EFSM;
        return -1;
    }
    if (max_sessions_ < -1) {
        errno = EINVAL;
        return -1;
    }

    int sessions = 0;
    while (max_sessions_ == -1 || sessions < max_sessions_) {
        if (recv_session () == -1) {
            //  Failed sessions were reported through the monitor. A broken
            //  listener cannot serve anybody else.
            if (!_listener->is_open ())
                return -1;
            ZXFER_DBG_LISTENER ("session failed: %s",
                                errno_to_string (errno));
        }
        sessions++;
    }
    return sessions;
}

void zxfer::receiver_t::close ()
{
    LIBZXFER_DELETE (_listener);
    socket_base_t::close ();
}
