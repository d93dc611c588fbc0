/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZXFER_RECEIVER_HPP_INCLUDED__
#define __ZXFER_RECEIVER_HPP_INCLUDED__

#include "sockets/socket_base.hpp"

namespace zxfer
{
class tcp_listener_t;

//  Listens on one address and serves sending peers one session at a time.

class receiver_t ZXFER_FINAL : public socket_base_t
{
  public:
    receiver_t ();
    ~receiver_t ();

    //  Overrides of functions from socket_base_t.
    int bind (const char *addr_) ZXFER_OVERRIDE;
    int recv_session () ZXFER_OVERRIDE;
    int serve (int max_sessions_) ZXFER_OVERRIDE;
    void close () ZXFER_OVERRIDE;

  private:
    tcp_listener_t *_listener;

    ZXFER_NON_COPYABLE_NOR_MOVABLE (receiver_t)
};
}

#endif
