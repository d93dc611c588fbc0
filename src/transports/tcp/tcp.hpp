/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZXFER_TCP_HPP_INCLUDED__
#define __ZXFER_TCP_HPP_INCLUDED__

#include <chrono>
#include <string>
#include <boost/asio.hpp>

namespace zxfer
{
//  Drives io_context_ until every pending operation on io_object_ has
//  completed or timeout_ milliseconds have elapsed (-1 waits forever).
//  On expiry the object is closed, which cancels the operation, and the
//  cancelled handler is drained before returning false.
template <typename T>
bool run_with_timeout (boost::asio::io_context &io_context_,
                       T &io_object_,
                       int timeout_)
{
    io_context_.restart ();

    if (timeout_ < 0) {
        io_context_.run ();
        return true;
    }

    io_context_.run_for (std::chrono::milliseconds (timeout_));
    if (io_context_.stopped ())
        return true;

    boost::system::error_code ec;
    io_object_.close (ec);
    io_context_.run ();
    return false;
}

//  Formats an endpoint as "host:port", IPv6 hosts in brackets.
std::string endpoint_to_string (const boost::asio::ip::tcp::endpoint &endpoint_);

//  Tunes a freshly connected or accepted socket.
void tune_tcp_socket (boost::asio::ip::tcp::socket &socket_);
}

#endif
