/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZXFER_TCP_ADDRESS_HPP_INCLUDED__
#define __ZXFER_TCP_ADDRESS_HPP_INCLUDED__

#include <string>
#include <vector>
#include <boost/asio.hpp>

namespace zxfer
{
//  TCP endpoint given as "[tcp://]host:port". A host of "*" means all
//  interfaces and a port of "*" (or 0) an ephemeral port; both are
//  meaningful only when binding. IPv6 literals are written in brackets.

class tcp_address_t
{
  public:
    tcp_address_t ();

    //  Returns 0 on success or -1 with errno EINVAL.
    int parse (const std::string &addr_);

    //  Resolves the address into one or more endpoints. passive_ selects
    //  addresses suitable for binding. Returns 0 or -1 with errno set.
    int resolve (boost::asio::io_context &io_context_,
                 bool passive_,
                 std::vector<boost::asio::ip::tcp::endpoint> &endpoints_) const;

    const std::string &host () const { return _host; }
    const std::string &port () const { return _port; }

    std::string to_string () const;

  private:
    std::string _host;
    std::string _port;
};
}

#endif
