/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "sockets/sender.hpp"
#include "engine/send_engine.hpp"
#include "transports/tcp/tcp_connecter.hpp"
#include "transports/tcp/tcp_stream.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

#include <new>

zxfer::sender_t::sender_t () :
    socket_base_t (ZXFER_SENDER),
    _stream (NULL),
    _engine (NULL)
{
}

zxfer::sender_t::~sender_t ()
{
    terminate ();
}

int zxfer::sender_t::connect (const char *addr_)
{
    if (_stream) {
        errno = EFSM;
        return -1;
    }

    tcp_connecter_t connecter (_io_context, this, options);
    _stream = connecter.connect (addr_);
    if (!_stream)
        return -1;

    _last_endpoint = _stream->remote_address ();
    _engine = new (std::nothrow) send_engine_t (_stream, this, options);
    alloc_assert (_engine);
    return 0;
}

int zxfer::sender_t::send_file (const char *path_)
{
    if (!_stream) {
        errno = EFSM;
        return -1;
    }

    if (_engine->send_file (path_) == 0)
        return 0;

    //  No retries: whatever failed, the session is over.
    const int err = errno;
    ZXFER_DBG_CONN ("send of %s failed: %s", path_, errno_to_string (err));
    terminate ();
    errno = err;
    return -1;
}

int zxfer::sender_t::disconnect ()
{
    if (!_stream) {
        errno = EFSM;
        return -1;
    }

    //  Closing the stream between frames is the end-of-session marker.
    terminate ();
    return 0;
}

void zxfer::sender_t::close ()
{
    terminate ();
    socket_base_t::close ();
}

void zxfer::sender_t::terminate ()
{
    LIBZXFER_DELETE (_engine);
    if (_stream)
        _stream->close ();
    LIBZXFER_DELETE (_stream);
}
