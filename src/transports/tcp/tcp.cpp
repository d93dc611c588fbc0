/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "transports/tcp/tcp.hpp"
#include "utils/debug.hpp"

#include <sstream>

std::string
zxfer::endpoint_to_string (const boost::asio::ip::tcp::endpoint &endpoint_)
{
    std::ostringstream os;
    if (endpoint_.address ().is_v6 ())
        os << '[' << endpoint_.address ().to_string () << ']';
    else
        os << endpoint_.address ().to_string ();
    os << ':' << endpoint_.port ();
    return os.str ();
}

void zxfer::tune_tcp_socket (boost::asio::ip::tcp::socket &socket_)
{
    //  Frames are small and written separately from the payload; do not
    //  let Nagle hold a header back waiting for the first chunk.
    boost::system::error_code ec;
    socket_.set_option (boost::asio::ip::tcp::no_delay (true), ec);
    if (ec)
        ZXFER_GLOBAL_DEBUG ("TCP_NODELAY not set: %s", ec.message ().c_str ());
}
