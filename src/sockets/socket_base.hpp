/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZXFER_SOCKET_BASE_HPP_INCLUDED__
#define __ZXFER_SOCKET_BASE_HPP_INCLUDED__

#include <stdint.h>
#include <string>
#include <boost/asio.hpp>

#include "zxfer.h"
#include "core/options.hpp"
#include "utils/macros.hpp"

namespace zxfer
{
static const uint32_t socket_tag_value = 0x78666572;

//  Common base of the sender and receiver sockets. Owns the options, the
//  io_context all blocking I/O of the socket runs in and the monitor
//  callback. Operations a socket type does not support fail with ENOTSUP.

class socket_base_t
{
  public:
    //  Create a socket of a specified type.
    static socket_base_t *create (int type_);

    virtual ~socket_base_t ();

    //  Returns false if object is not a socket.
    bool check_tag () const;

    //  Interface for communication with the API layer.
    int setsockopt (int option_, const void *optval_, size_t optvallen_);
    int getsockopt (int option_, void *optval_, size_t *optvallen_);
    int monitor (zxfer_monitor_fn *monitor_, void *hint_, int events_);

    //  Receiver side.
    virtual int bind (const char *addr_);
    virtual int recv_session ();
    virtual int serve (int max_sessions_);

    //  Sender side.
    virtual int connect (const char *addr_);
    virtual int send_file (const char *path_);
    virtual int disconnect ();

    //  Releases every resource held by the socket.
    virtual void close ();

    //  Monitor events.
    void event_connected (const std::string &addr_);
    void event_listening (const std::string &addr_);
    void event_accepted (const std::string &addr_);
    void event_accept_failed (const std::string &addr_, int err_);
    void event_file_started (const std::string &path_, uint64_t size_);
    void event_file_sent (const std::string &path_, uint64_t size_);
    void event_file_saved (const std::string &name_, uint64_t size_);
    void event_file_failed (const std::string &name_, int err_);
    void event_session_closed (const std::string &addr_, uint64_t files_);
    void event_session_failed (const std::string &addr_, int err_);

  protected:
    explicit socket_base_t (int type_);

    //  Socket options.
    options_t options;

    //  All stream, listener and connecter I/O of this socket runs here.
    boost::asio::io_context _io_context;

    //  Last socket endpoint resolved URI
    std::string _last_endpoint;

  private:
    void event (int event_, uint64_t value_, const std::string &detail_);

    //  Used to check whether the object is a socket.
    uint32_t _tag;

    zxfer_monitor_fn *_monitor_fn;
    void *_monitor_hint;
    int _monitor_events;

    ZXFER_NON_COPYABLE_NOR_MOVABLE (socket_base_t)
};
}

#endif
