/* SPDX-License-Identifier: MPL-2.0 */

#include "transfer_args.hpp"

#include <stdlib.h>

transfer::recv_args_t::recv_args_t () :
    host ("0.0.0.0"),
    port ("7070"),
    dir ("."),
    timeout (-1),
    overwrite (1)
{
}

transfer::send_args_t::send_args_t () : timeout (-1)
{
}

bool transfer::parse_recv_args (int argc_, char *argv_[], recv_args_t &args_)
{
    for (int i = 0; i < argc_; i++) {
        const std::string arg = argv_[i];
        if (arg == "--bind" && i + 1 < argc_)
            args_.host = argv_[++i];
        else if (arg == "--port" && i + 1 < argc_)
            args_.port = argv_[++i];
        else if (arg == "--dir" && i + 1 < argc_)
            args_.dir = argv_[++i];
        else if (arg == "--timeout" && i + 1 < argc_) {
            if (!parse_timeout (argv_[++i], args_.timeout))
                return false;
        } else if (arg == "--no-overwrite")
            args_.overwrite = 0;
        else
            return false;
    }
    return true;
}

bool transfer::parse_send_args (int argc_, char *argv_[], send_args_t &args_)
{
    for (int i = 0; i < argc_; i++) {
        const std::string arg = argv_[i];
        if (arg == "--rhost" && i + 2 < argc_) {
            args_.host = argv_[++i];
            args_.port = argv_[++i];
        } else if (arg == "--timeout" && i + 1 < argc_) {
            if (!parse_timeout (argv_[++i], args_.timeout))
                return false;
        } else if (arg == "-f") {
            int first = i + 1;
            if (first < argc_ && std::string (argv_[first]) == "--")
                first++;
            for (int j = first; j < argc_; j++)
                args_.files.push_back (argv_[j]);
            break;
        } else
            return false;
    }

    return !args_.host.empty () && !args_.files.empty ();
}

bool transfer::parse_timeout (const char *arg_, int &timeout_ms_)
{
    char *end = NULL;
    const double secs = strtod (arg_, &end);
    if (end == arg_ || *end != '\0' || secs < 0 || secs > 2000000)
        return false;
    timeout_ms_ = secs > 0 ? static_cast<int> (secs * 1000) : -1;
    if (secs > 0 && timeout_ms_ == 0)
        timeout_ms_ = 1;
    return true;
}

std::string transfer::make_address (const std::string &host_,
                                    const std::string &port_)
{
    if (host_.find (':') != std::string::npos && host_[0] != '[')
        return "[" + host_ + "]:" + port_;
    return host_ + ":" + port_;
}
