/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "transports/tcp/tcp_listener.hpp"
#include "transports/tcp/tcp_stream.hpp"
#include "transports/tcp/tcp.hpp"
#include "engine/asio/asio_error_handler.hpp"
#include "core/options.hpp"
#include "sockets/socket_base.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

#include <new>
#include <vector>

zxfer::tcp_listener_t::tcp_listener_t (boost::asio::io_context &io_context_,
                                       socket_base_t *socket_,
                                       const options_t &options_) :
    _io_context (io_context_),
    _acceptor (io_context_),
    _socket (socket_),
    options (options_)
{
}

zxfer::tcp_listener_t::~tcp_listener_t ()
{
    close ();
}

int zxfer::tcp_listener_t::set_local_address (const char *addr_)
{
    ZXFER_DBG_LISTENER ("set_local_address: addr=%s", addr_);

    //  Parse the address
    if (_address.parse (addr_) != 0)
        return -1;

    std::vector<boost::asio::ip::tcp::endpoint> endpoints;
    if (_address.resolve (_io_context, true, endpoints) != 0)
        return -1;
    const boost::asio::ip::tcp::endpoint &bind_endpoint = endpoints.front ();

    boost::system::error_code ec;

    //  Open the acceptor
    _acceptor.open (bind_endpoint.protocol (), ec);
    if (ec) {
        ZXFER_DBG_LISTENER ("Failed to open acceptor: %s",
                            ec.message ().c_str ());
        return asio_error::set_errno (ec);
    }

    //  Allow reusing of the address (SO_REUSEADDR)
    _acceptor.set_option (boost::asio::socket_base::reuse_address (true), ec);
    if (ec) {
        ZXFER_DBG_LISTENER ("Failed to set reuse_address: %s",
                            ec.message ().c_str ());
        close ();
        return asio_error::set_errno (ec);
    }

    //  Bind the acceptor
    _acceptor.bind (bind_endpoint, ec);
    if (ec) {
        ZXFER_DBG_LISTENER ("Failed to bind: %s", ec.message ().c_str ());
        close ();
        return asio_error::set_errno (ec);
    }

    //  Listen for incoming connections
    _acceptor.listen (options.backlog, ec);
    if (ec) {
        ZXFER_DBG_LISTENER ("Failed to listen: %s", ec.message ().c_str ());
        close ();
        return asio_error::set_errno (ec);
    }

    //  Get endpoint string for events (this resolves wildcard port)
    const boost::asio::ip::tcp::endpoint local = _acceptor.local_endpoint (ec);
    if (ec) {
        close ();
        return asio_error::set_errno (ec);
    }
    _endpoint = endpoint_to_string (local);

    _socket->event_listening (_endpoint);

    ZXFER_DBG_LISTENER ("Listening on %s", _endpoint.c_str ());
    return 0;
}

int zxfer::tcp_listener_t::get_local_address (std::string &addr_) const
{
    if (!_acceptor.is_open ()) {
        errno = EFSM;
        return -1;
    }
    addr_ = _endpoint;
    return 0;
}

zxfer::tcp_stream_t *zxfer::tcp_listener_t::accept ()
{
    if (!_acceptor.is_open ()) {
        errno = EFSM;
        return NULL;
    }

    tcp_stream_t *stream = new (std::nothrow)
      tcp_stream_t (_io_context, options.rcvtimeo, options.sndtimeo);
    alloc_assert (stream);

    boost::system::error_code result;
    _acceptor.async_accept (
      stream->socket (),
      [&result] (const boost::system::error_code &ec) { result = ec; });

    //  Waiting for a peer has no deadline.
    run_with_timeout (_io_context, _acceptor, -1);

    if (result) {
        ZXFER_DBG_LISTENER ("accept failed: %s", result.message ().c_str ());
        const int err = asio_error::classify (result).err;
        LIBZXFER_DELETE (stream);
        _socket->event_accept_failed (_endpoint, err);
        errno = err;
        return NULL;
    }

    tune_tcp_socket (stream->socket ());
    stream->set_connected ();
    _socket->event_accepted (stream->remote_address ());

    ZXFER_DBG_LISTENER ("accepted %s", stream->remote_address ().c_str ());
    return stream;
}

void zxfer::tcp_listener_t::close ()
{
    if (!_acceptor.is_open ())
        return;

    boost::system::error_code ec;
    _acceptor.close (ec);
    if (ec)
        ZXFER_DBG_LISTENER ("close failed: %s", ec.message ().c_str ());
}
