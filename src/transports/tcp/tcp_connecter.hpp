/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZXFER_TCP_CONNECTER_HPP_INCLUDED__
#define __ZXFER_TCP_CONNECTER_HPP_INCLUDED__

#include <boost/asio.hpp>
#include <string>

#include "utils/macros.hpp"

namespace zxfer
{
class socket_base_t;
class tcp_stream_t;
struct options_t;

//  Resolves a "host:port" address and establishes one TCP connection,
//  trying each resolved endpoint in turn. ZXFER_CONNECT_TIMEOUT bounds the
//  whole attempt.

class tcp_connecter_t
{
  public:
    tcp_connecter_t (boost::asio::io_context &io_context_,
                     socket_base_t *socket_,
                     const options_t &options_);
    ~tcp_connecter_t ();

    //  Returns a connected stream owned by the caller, or NULL with
    //  errno set.
    tcp_stream_t *connect (const char *addr_);

  private:
    boost::asio::io_context &_io_context;

    //  Socket the connecter belongs to.
    socket_base_t *_socket;

    const options_t &options;

    ZXFER_NON_COPYABLE_NOR_MOVABLE (tcp_connecter_t)
};
}

#endif
