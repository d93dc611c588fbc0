/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZXFER_SENDER_HPP_INCLUDED__
#define __ZXFER_SENDER_HPP_INCLUDED__

#include "sockets/socket_base.hpp"

namespace zxfer
{
class send_engine_t;
class tcp_stream_t;

//  Connects to one receiver and sends files over that connection. The
//  first failure closes the connection; a new connect starts over.

class sender_t ZXFER_FINAL : public socket_base_t
{
  public:
    sender_t ();
    ~sender_t ();

    //  Overrides of functions from socket_base_t.
    int connect (const char *addr_) ZXFER_OVERRIDE;
    int send_file (const char *path_) ZXFER_OVERRIDE;
    int disconnect () ZXFER_OVERRIDE;
    void close () ZXFER_OVERRIDE;

  private:
    //  Drops the connection and the engine bound to it.
    void terminate ();

    tcp_stream_t *_stream;
    send_engine_t *_engine;

    ZXFER_NON_COPYABLE_NOR_MOVABLE (sender_t)
};
}

#endif
