/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZXFER_TRANSFER_ARGS_HPP_INCLUDED__
#define __ZXFER_TRANSFER_ARGS_HPP_INCLUDED__

#include <string>
#include <vector>

namespace transfer
{
struct recv_args_t
{
    recv_args_t ();

    std::string host;
    std::string port;
    std::string dir;
    int timeout;
    int overwrite;
};

struct send_args_t
{
    send_args_t ();

    std::string host;
    std::string port;
    int timeout;
    std::vector<std::string> files;
};

//  Parse the arguments following "recv". Returns false on a usage error.
bool parse_recv_args (int argc_, char *argv_[], recv_args_t &args_);

//  Parse the arguments following "send". "-f" ends option parsing: every
//  argument after it names a file, so names may start with '-'. A "--"
//  directly after "-f" is skipped. Returns false on a usage error or when
//  the host or the file list is missing.
bool parse_send_args (int argc_, char *argv_[], send_args_t &args_);

//  Seconds as given on the command line to milliseconds; 0 disables.
bool parse_timeout (const char *arg_, int &timeout_ms_);

//  "host:port", with IPv6 literals bracketed.
std::string make_address (const std::string &host_, const std::string &port_);
}

#endif
