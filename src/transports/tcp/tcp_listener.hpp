/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZXFER_TCP_LISTENER_HPP_INCLUDED__
#define __ZXFER_TCP_LISTENER_HPP_INCLUDED__

#include <boost/asio.hpp>
#include <string>

#include "utils/macros.hpp"
#include "transports/tcp/tcp_address.hpp"

namespace zxfer
{
class socket_base_t;
class tcp_stream_t;
struct options_t;

//  TCP listener accepting one connection at a time. Accepting blocks the
//  calling thread in the socket's io_context.

class tcp_listener_t
{
  public:
    tcp_listener_t (boost::asio::io_context &io_context_,
                    socket_base_t *socket_,
                    const options_t &options_);
    ~tcp_listener_t ();

    //  Set address to listen on.
    int set_local_address (const char *addr_);

    //  Get the bound address for use with wildcards
    int get_local_address (std::string &addr_) const;

    //  Waits for the next connection. Returns a new stream owned by the
    //  caller, or NULL with errno set.
    tcp_stream_t *accept ();

    bool is_open () const { return _acceptor.is_open (); }

    //  Close the listening socket
    void close ();

  private:
    boost::asio::io_context &_io_context;
    boost::asio::ip::tcp::acceptor _acceptor;

    //  Socket the listener belongs to.
    socket_base_t *_socket;

    const options_t &options;

    //  Address to listen on.
    tcp_address_t _address;

    //  String representation of endpoint to bind to
    std::string _endpoint;

    ZXFER_NON_COPYABLE_NOR_MOVABLE (tcp_listener_t)
};
}

#endif
