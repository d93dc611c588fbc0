/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "sockets/socket_base.hpp"
#include "sockets/receiver.hpp"
#include "sockets/sender.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

#include <new>

zxfer::socket_base_t *zxfer::socket_base_t::create (int type_)
{
    socket_base_t *s = NULL;
    switch (type_) {
        case ZXFER_SENDER:
            s = new (std::nothrow) sender_t ();
            break;
        case ZXFER_RECEIVER:
            s = new (std::nothrow) receiver_t ();
            break;
        default:
            errno = EINVAL;
            return NULL;
    }

    alloc_assert (s);
    return s;
}

zxfer::socket_base_t::socket_base_t (int type_) :
    _tag (socket_tag_value),
    _monitor_fn (NULL),
    _monitor_hint (NULL),
    _monitor_events (0)
{
    options.type = type_;
}

zxfer::socket_base_t::~socket_base_t ()
{
    _tag = 0xdeadbeef;
}

bool zxfer::socket_base_t::check_tag () const
{
    return _tag == socket_tag_value;
}

int zxfer::socket_base_t::setsockopt (int option_,
                                      const void *optval_,
                                      size_t optvallen_)
{
    if (option_ == ZXFER_LAST_ENDPOINT || option_ == ZXFER_TYPE) {
        errno = EINVAL;
        return -1;
    }
    return options.setsockopt (option_, optval_, optvallen_);
}

int zxfer::socket_base_t::getsockopt (int option_,
                                      void *optval_,
                                      size_t *optvallen_)
{
    if (option_ == ZXFER_LAST_ENDPOINT)
        return do_getsockopt (optval_, optvallen_, _last_endpoint);

    return options.getsockopt (option_, optval_, optvallen_);
}

int zxfer::socket_base_t::monitor (zxfer_monitor_fn *monitor_,
                                   void *hint_,
                                   int events_)
{
    //  A NULL callback stops monitoring.
    _monitor_fn = monitor_;
    _monitor_hint = hint_;
    _monitor_events = monitor_ ? events_ : 0;
    return 0;
}

int zxfer::socket_base_t::bind (const char *)
{
    errno = ENOTSUP;
    return -1;
}

int zxfer::socket_base_t::recv_session ()
{
    errno = ENOTSUP;
    return -1;
}

int zxfer::socket_base_t::serve (int)
{
    errno = ENOTSUP;
    return -1;
}

int zxfer::socket_base_t::connect (const char *)
{
    errno = ENOTSUP;
    return -1;
}

int zxfer::socket_base_t::send_file (const char *)
{
    errno = ENOTSUP;
    return -1;
}

int zxfer::socket_base_t::disconnect ()
{
    errno = ENOTSUP;
    return -1;
}

void zxfer::socket_base_t::close ()
{
    _monitor_fn = NULL;
    _monitor_events = 0;
}

void zxfer::socket_base_t::event_connected (const std::string &addr_)
{
    event (ZXFER_EVENT_CONNECTED, 0, addr_);
}

void zxfer::socket_base_t::event_listening (const std::string &addr_)
{
    event (ZXFER_EVENT_LISTENING, 0, addr_);
}

void zxfer::socket_base_t::event_accepted (const std::string &addr_)
{
    event (ZXFER_EVENT_ACCEPTED, 0, addr_);
}

void zxfer::socket_base_t::event_accept_failed (const std::string &addr_,
                                                int err_)
{
    event (ZXFER_EVENT_ACCEPT_FAILED, static_cast<uint64_t> (err_), addr_);
}

void zxfer::socket_base_t::event_file_started (const std::string &path_,
                                               uint64_t size_)
{
    event (ZXFER_EVENT_FILE_STARTED, size_, path_);
}

void zxfer::socket_base_t::event_file_sent (const std::string &path_,
                                            uint64_t size_)
{
    event (ZXFER_EVENT_FILE_SENT, size_, path_);
}

void zxfer::socket_base_t::event_file_saved (const std::string &name_,
                                             uint64_t size_)
{
    event (ZXFER_EVENT_FILE_SAVED, size_, name_);
}

void zxfer::socket_base_t::event_file_failed (const std::string &name_,
                                              int err_)
{
    event (ZXFER_EVENT_FILE_FAILED, static_cast<uint64_t> (err_), name_);
}

void zxfer::socket_base_t::event_session_closed (const std::string &addr_,
                                                 uint64_t files_)
{
    event (ZXFER_EVENT_SESSION_CLOSED, files_, addr_);
}

void zxfer::socket_base_t::event_session_failed (const std::string &addr_,
                                                 int err_)
{
    event (ZXFER_EVENT_SESSION_FAILED, static_cast<uint64_t> (err_), addr_);
}

void zxfer::socket_base_t::event (int event_,
                                  uint64_t value_,
                                  const std::string &detail_)
{
    if (!_monitor_fn || !(_monitor_events & event_))
        return;

    //  The callback runs on the caller's thread and may touch errno;
    //  keep the value the failing operation set.
    const int saved_errno = errno;
    _monitor_fn (_monitor_hint, event_, value_, detail_.c_str ());
    errno = saved_errno;
}
