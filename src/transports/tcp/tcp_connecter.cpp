/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "transports/tcp/tcp_connecter.hpp"
#include "transports/tcp/tcp_address.hpp"
#include "transports/tcp/tcp_stream.hpp"
#include "transports/tcp/tcp.hpp"
#include "engine/asio/asio_error_handler.hpp"
#include "core/options.hpp"
#include "sockets/socket_base.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

#include <new>
#include <vector>

zxfer::tcp_connecter_t::tcp_connecter_t (boost::asio::io_context &io_context_,
                                         socket_base_t *socket_,
                                         const options_t &options_) :
    _io_context (io_context_),
    _socket (socket_),
    options (options_)
{
}

zxfer::tcp_connecter_t::~tcp_connecter_t ()
{
}

zxfer::tcp_stream_t *zxfer::tcp_connecter_t::connect (const char *addr_)
{
    ZXFER_DBG_CONN ("connect: endpoint=%s", addr_);

    tcp_address_t address;
    if (address.parse (addr_) != 0)
        return NULL;

    //  Resolve the address
    std::vector<boost::asio::ip::tcp::endpoint> endpoints;
    if (address.resolve (_io_context, false, endpoints) != 0) {
        ZXFER_DBG_CONN ("connect: resolve failed");
        return NULL;
    }

    tcp_stream_t *stream = new (std::nothrow)
      tcp_stream_t (_io_context, options.rcvtimeo, options.sndtimeo);
    alloc_assert (stream);

    boost::system::error_code result;
    boost::asio::async_connect (
      stream->socket (), endpoints,
      [&result] (const boost::system::error_code &ec,
                 const boost::asio::ip::tcp::endpoint &) { result = ec; });

    const int timeout =
      options.connect_timeout > 0 ? options.connect_timeout : -1;
    if (!run_with_timeout (_io_context, stream->socket (), timeout)) {
        ZXFER_DBG_CONN ("connect: timed out after %d ms", timeout);
        LIBZXFER_DELETE (stream);
        errno = ETIMEDOUT;
        return NULL;
    }

    if (result) {
        ZXFER_DBG_CONN ("connect: failed: %s", result.message ().c_str ());
        LIBZXFER_DELETE (stream);
        errno = asio_error::classify (result).err;
        return NULL;
    }

    tune_tcp_socket (stream->socket ());
    stream->set_connected ();
    _socket->event_connected (stream->remote_address ());

    ZXFER_DBG_CONN ("connected to %s", stream->remote_address ().c_str ());
    return stream;
}
