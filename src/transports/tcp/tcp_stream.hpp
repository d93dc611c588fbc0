/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZXFER_TCP_STREAM_HPP_INCLUDED__
#define __ZXFER_TCP_STREAM_HPP_INCLUDED__

#include <string>
#include <boost/asio.hpp>

#include "transports/i_stream.hpp"

namespace zxfer
{
//  Blocking stream over a connected TCP socket. Each read and write runs
//  the owning io_context until the operation completes or the direction's
//  timeout (milliseconds, -1 = none) expires; an expired timeout closes
//  the socket and fails with ETIMEDOUT.

class tcp_stream_t ZXFER_FINAL : public i_stream
{
  public:
    tcp_stream_t (boost::asio::io_context &io_context_,
                  int rcvtimeo_,
                  int sndtimeo_);
    ~tcp_stream_t () ZXFER_OVERRIDE;

    boost::asio::ip::tcp::socket &socket () { return _socket; }

    //  Records the endpoint strings once the socket is connected.
    void set_connected ();

    const std::string &local_address () const { return _local_address; }
    const std::string &remote_address () const { return _remote_address; }

    //  i_stream implementation
    bool is_open () const ZXFER_OVERRIDE;
    void close () ZXFER_OVERRIDE;
    int read_some (unsigned char *buffer_, size_t size_) ZXFER_OVERRIDE;
    int write_all (const unsigned char *buffer_, size_t size_) ZXFER_OVERRIDE;
    const char *name () const ZXFER_OVERRIDE { return "tcp"; }

  private:
    boost::asio::io_context &_io_context;
    boost::asio::ip::tcp::socket _socket;

    const int _rcvtimeo;
    const int _sndtimeo;

    std::string _local_address;
    std::string _remote_address;

    ZXFER_NON_COPYABLE_NOR_MOVABLE (tcp_stream_t)
};
}

#endif
