/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZXFER_ASIO_ERROR_HANDLER_HPP_INCLUDED__
#define __ZXFER_ASIO_ERROR_HANDLER_HPP_INCLUDED__

#include <errno.h>
#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>

#include "zxfer.h"

namespace zxfer
{
namespace asio_error
{

//  Error severity levels
enum class severity {
    ignore,      //  Operation cancelled, not an error
    normal,      //  Expected condition (EOF, connection reset by peer)
    recoverable, //  Temporary failure, can retry
    fatal        //  Internal error
};

//  Error categories for detailed handling
enum class category {
    cancelled,
    connection_closed,
    connection_refused,
    connection_reset,
    timeout,
    address_in_use,
    resource_exhausted,
    unknown
};

//  Error information structure
struct error_info_t
{
    severity sev;
    category cat;

    //  errno value reported to the caller.
    int err;
};

//  Classify Boost.Asio error codes into severity, category and errno.
inline error_info_t classify (const boost::system::error_code &ec)
{
    //  Operation cancelled (socket closed under a pending operation)
    if (ec == boost::asio::error::operation_aborted)
        return {severity::ignore, category::cancelled, ECANCELED};

    //  Connection closed by peer (normal end of stream)
    if (ec == boost::asio::error::eof)
        return {severity::normal, category::connection_closed, 0};

    //  Connection actively refused
    if (ec == boost::asio::error::connection_refused)
        return {severity::normal, category::connection_refused, ECONNREFUSED};

    //  Connection reset by peer
    if (ec == boost::asio::error::connection_reset)
        return {severity::normal, category::connection_reset, ECONNRESET};

    //  Broken pipe (write to closed connection)
    if (ec == boost::asio::error::broken_pipe)
        return {severity::normal, category::connection_closed, EPIPE};

    //  Timeout
    if (ec == boost::asio::error::timed_out)
        return {severity::recoverable, category::timeout, ETIMEDOUT};

    //  Address already bound by another socket
    if (ec == boost::asio::error::address_in_use)
        return {severity::fatal, category::address_in_use, EADDRINUSE};

    //  Resource exhaustion (too many open files, etc.)
    if (ec == boost::asio::error::no_descriptors)
        return {severity::recoverable, category::resource_exhausted, EMFILE};

    //  Would block (shouldn't happen with completion handlers)
    if (ec == boost::asio::error::would_block
        || ec == boost::asio::error::try_again)
        return {severity::recoverable, category::unknown, EAGAIN};

    //  Network unreachable / host unreachable
    if (ec == boost::asio::error::network_unreachable)
        return {severity::recoverable, category::connection_refused,
                ENETUNREACH};
    if (ec == boost::asio::error::host_unreachable)
        return {severity::recoverable, category::connection_refused,
                EHOSTUNREACH};

    //  Name resolution failures
    if (ec == boost::asio::error::host_not_found
        || ec == boost::asio::error::host_not_found_try_again
        || ec == boost::asio::error::service_not_found)
        return {severity::fatal, category::connection_refused, EHOSTUNREACH};

    //  Unknown error (treat as fatal); system errors carry their errno
    if (ec.category () == boost::system::system_category ()
        || ec.category () == boost::system::generic_category ())
        return {severity::fatal, category::unknown, ec.value ()};
    return {severity::fatal, category::unknown, EPROTO};
}

//  Sets errno from ec and returns -1, for use on error return paths.
inline int set_errno (const boost::system::error_code &ec)
{
    errno = classify (ec).err;
    return -1;
}

} // namespace asio_error
} // namespace zxfer

#endif
