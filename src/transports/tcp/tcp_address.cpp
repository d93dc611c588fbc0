/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "transports/tcp/tcp_address.hpp"
#include "engine/asio/asio_error_handler.hpp"

static const char tcp_scheme[] = "tcp://";

zxfer::tcp_address_t::tcp_address_t ()
{
}

int zxfer::tcp_address_t::parse (const std::string &addr_)
{
    std::string addr = addr_;
    const size_t scheme_len = sizeof (tcp_scheme) - 1;
    if (addr.compare (0, scheme_len, tcp_scheme) == 0)
        addr = addr.substr (scheme_len);

    //  Find the ':' at end that separates address from the port number.
    const std::string::size_type delimiter = addr.rfind (':');
    if (delimiter == std::string::npos || delimiter == 0) {
        errno = EINVAL;
        return -1;
    }

    std::string host = addr.substr (0, delimiter);
    std::string port = addr.substr (delimiter + 1);

    //  Remove square brackets around the address, if any, as used in IPv6.
    if (host.size () >= 2 && host[0] == '[' && host[host.size () - 1] == ']')
        host = host.substr (1, host.size () - 2);
    if (host.empty () || host.find_first_of ("[]") != std::string::npos) {
        errno = EINVAL;
        return -1;
    }

    //  Allow 0 specifically, to detect invalid port error in atoi if not.
    if (port == "*" || port == "0")
        port = "0";
    else {
        if (port.empty ()
            || port.find_first_not_of ("0123456789") != std::string::npos
            || port.size () > 5 || atoi (port.c_str ()) == 0
            || atoi (port.c_str ()) > 65535) {
            errno = EINVAL;
            return -1;
        }
    }

    _host = host;
    _port = port;
    return 0;
}

int zxfer::tcp_address_t::resolve (
  boost::asio::io_context &io_context_,
  bool passive_,
  std::vector<boost::asio::ip::tcp::endpoint> &endpoints_) const
{
    endpoints_.clear ();
    const unsigned short port =
      static_cast<unsigned short> (atoi (_port.c_str ()));

    if (_host == "*") {
        if (!passive_) {
            errno = EINVAL;
            return -1;
        }
        endpoints_.push_back (
          boost::asio::ip::tcp::endpoint (boost::asio::ip::tcp::v4 (), port));
        return 0;
    }

    //  Numeric addresses need no resolver round trip.
    boost::system::error_code ec;
    const boost::asio::ip::address address =
      boost::asio::ip::make_address (_host, ec);
    if (!ec) {
        endpoints_.push_back (boost::asio::ip::tcp::endpoint (address, port));
        return 0;
    }

    boost::asio::ip::tcp::resolver resolver (io_context_);
    boost::asio::ip::resolver_base::flags flags =
      boost::asio::ip::resolver_base::numeric_service;
    if (passive_)
        flags = flags | boost::asio::ip::resolver_base::passive;

    const boost::asio::ip::tcp::resolver::results_type results =
      resolver.resolve (_host, _port, flags, ec);
    if (ec)
        return asio_error::set_errno (ec);

    for (boost::asio::ip::tcp::resolver::results_type::const_iterator it =
           results.begin ();
         it != results.end (); ++it)
        endpoints_.push_back (it->endpoint ());

    if (endpoints_.empty ()) {
        errno = EHOSTUNREACH;
        return -1;
    }
    return 0;
}

std::string zxfer::tcp_address_t::to_string () const
{
    if (_host.find (':') != std::string::npos)
        return "[" + _host + "]:" + _port;
    return _host + ":" + _port;
}
