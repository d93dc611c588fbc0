/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "transports/tcp/tcp_stream.hpp"
#include "transports/tcp/tcp.hpp"
#include "engine/asio/asio_error_handler.hpp"
#include "utils/debug.hpp"

#include <limits.h>

zxfer::tcp_stream_t::tcp_stream_t (boost::asio::io_context &io_context_,
                                   int rcvtimeo_,
                                   int sndtimeo_) :
    _io_context (io_context_),
    _socket (io_context_),
    _rcvtimeo (rcvtimeo_),
    _sndtimeo (sndtimeo_)
{
}

zxfer::tcp_stream_t::~tcp_stream_t ()
{
    close ();
}

void zxfer::tcp_stream_t::set_connected ()
{
    boost::system::error_code ec;
    const boost::asio::ip::tcp::endpoint local = _socket.local_endpoint (ec);
    if (!ec)
        _local_address = endpoint_to_string (local);
    const boost::asio::ip::tcp::endpoint remote =
      _socket.remote_endpoint (ec);
    if (!ec)
        _remote_address = endpoint_to_string (remote);
    ZXFER_DBG_STREAM ("connected %s -> %s", _local_address.c_str (),
                      _remote_address.c_str ());
}

bool zxfer::tcp_stream_t::is_open () const
{
    return _socket.is_open ();
}

void zxfer::tcp_stream_t::close ()
{
    if (!_socket.is_open ())
        return;

    ZXFER_DBG_STREAM ("close");

    //  The peer may already be gone; shutdown errors change nothing here.
    boost::system::error_code ec;
    _socket.shutdown (boost::asio::ip::tcp::socket::shutdown_both, ec);
    _socket.close (ec);
    if (ec)
        ZXFER_DBG_STREAM ("close failed: %s", ec.message ().c_str ());
}

int zxfer::tcp_stream_t::read_some (unsigned char *buffer_, size_t size_)
{
    if (!_socket.is_open ()) {
        errno = ENOTCONN;
        return -1;
    }
    if (size_ > INT_MAX)
        size_ = INT_MAX;

    boost::system::error_code result;
    std::size_t bytes = 0;
    _socket.async_read_some (
      boost::asio::buffer (buffer_, size_),
      [&result, &bytes] (const boost::system::error_code &ec,
                         std::size_t bytes_transferred) {
          result = ec;
          bytes = bytes_transferred;
      });

    if (!run_with_timeout (_io_context, _socket, _rcvtimeo)) {
        ZXFER_DBG_STREAM ("read timed out after %d ms", _rcvtimeo);
        errno = ETIMEDOUT;
        return -1;
    }

    if (result == boost::asio::error::eof) {
        ZXFER_DBG_STREAM ("end of stream");
        return 0;
    }
    if (result) {
        ZXFER_DBG_STREAM ("read failed: %s", result.message ().c_str ());
        return asio_error::set_errno (result);
    }
    return static_cast<int> (bytes);
}

int zxfer::tcp_stream_t::write_all (const unsigned char *buffer_,
                                    size_t size_)
{
    if (!_socket.is_open ()) {
        errno = ENOTCONN;
        return -1;
    }

    boost::system::error_code result;
    boost::asio::async_write (
      _socket, boost::asio::buffer (buffer_, size_),
      [&result] (const boost::system::error_code &ec, std::size_t) {
          result = ec;
      });

    if (!run_with_timeout (_io_context, _socket, _sndtimeo)) {
        ZXFER_DBG_STREAM ("write timed out after %d ms", _sndtimeo);
        errno = ETIMEDOUT;
        return -1;
    }

    if (result) {
        ZXFER_DBG_STREAM ("write failed: %s", result.message ().c_str ());
        return asio_error::set_errno (result);
    }
    return 0;
}
