/* SPDX-License-Identifier: MPL-2.0 */

//  Command line front end:
//
//    transfer recv [--bind HOST] [--port PORT] [--dir DIR] [--timeout SECS]
//                  [--no-overwrite]
//    transfer send --rhost HOST PORT [--timeout SECS] -f [--] FILE...
//
//  Everything after -f is a file name.

#include <zxfer.h>

#include "transfer_args.hpp"

#include <errno.h>
#include <stdio.h>
#include <string>

namespace
{
enum exit_code_t
{
    exit_ok = 0,
    exit_usage = 1,
    exit_connection = 2,
    exit_file = 3,
    exit_protocol = 4,
    exit_timeout = 5
};

int exit_code_for (int errnum_)
{
    if (errnum_ == EFILEIO)
        return exit_file;
    if (errnum_ == EPROTO)
        return exit_protocol;
    if (errnum_ == ETIMEDOUT)
        return exit_timeout;
    return exit_connection;
}

void usage (const char *prog_)
{
    fprintf (stderr,
             "usage: %s recv [--bind HOST] [--port PORT] [--dir DIR]"
             " [--timeout SECS] [--no-overwrite]\n"
             "       %s send --rhost HOST PORT [--timeout SECS]"
             " -f [--] FILE...\n",
             prog_, prog_);
}

void on_event (void *, int event_, uint64_t value_, const char *detail_)
{
    switch (event_) {
        case ZXFER_EVENT_LISTENING:
            printf ("listening on %s\n", detail_);
            break;
        case ZXFER_EVENT_ACCEPTED:
            printf ("connection from %s\n", detail_);
            break;
        case ZXFER_EVENT_CONNECTED:
            printf ("connected to %s\n", detail_);
            break;
        case ZXFER_EVENT_FILE_STARTED:
            printf ("sending: %s ...\n", detail_);
            break;
        case ZXFER_EVENT_FILE_SENT:
            printf ("%s SENT\n", detail_);
            break;
        case ZXFER_EVENT_FILE_SAVED:
            printf ("%s saved\n", detail_);
            break;
        case ZXFER_EVENT_FILE_FAILED:
            fprintf (stderr, "%s: %s\n", detail_,
                     zxfer_strerror (static_cast<int> (value_)));
            break;
        case ZXFER_EVENT_SESSION_FAILED:
            fprintf (stderr, "session with %s failed: %s\n", detail_,
                     zxfer_strerror (static_cast<int> (value_)));
            break;
        case ZXFER_EVENT_ACCEPT_FAILED:
            fprintf (stderr, "accept on %s failed: %s\n", detail_,
                     zxfer_strerror (static_cast<int> (value_)));
            break;
        default:
            break;
    }
    fflush (stdout);
}

int fail (const char *what_)
{
    const int err = zxfer_errno ();
    fprintf (stderr, "%s: %s\n", what_, zxfer_strerror (err));
    return exit_code_for (err);
}

int run_recv (const char *prog_, int argc_, char *argv_[])
{
    transfer::recv_args_t args;
    if (!transfer::parse_recv_args (argc_, argv_, args)) {
        usage (prog_);
        return exit_usage;
    }

    void *receiver = zxfer_socket (ZXFER_RECEIVER);
    if (!receiver)
        return fail ("socket");

    int rc = zxfer_setsockopt (receiver, ZXFER_DEST_DIR, args.dir.c_str (),
                               args.dir.size ());
    if (rc == 0)
        rc = zxfer_setsockopt (receiver, ZXFER_OVERWRITE, &args.overwrite,
                               sizeof (args.overwrite));
    if (rc == 0)
        rc = zxfer_setsockopt (receiver, ZXFER_RCVTIMEO, &args.timeout,
                               sizeof (args.timeout));
    if (rc == 0)
        rc = zxfer_setsockopt (receiver, ZXFER_SNDTIMEO, &args.timeout,
                               sizeof (args.timeout));
    if (rc == 0)
        rc = zxfer_monitor (receiver, on_event, NULL, ZXFER_EVENT_ALL);
    if (rc != 0) {
        const int code = fail ("invalid option");
        zxfer_close (receiver);
        return code == exit_connection ? exit_usage : code;
    }

    const std::string address = transfer::make_address (args.host, args.port);
    if (zxfer_bind (receiver, address.c_str ()) != 0) {
        const int code = fail (address.c_str ());
        zxfer_close (receiver);
        return code;
    }

    //  Serve until killed; failed sessions are reported by the monitor.
    rc = zxfer_serve (receiver, -1);
    const int code = rc == -1 ? fail ("serve") : exit_ok;
    zxfer_close (receiver);
    return code;
}

int run_send (const char *prog_, int argc_, char *argv_[])
{
    transfer::send_args_t args;
    if (!transfer::parse_send_args (argc_, argv_, args)) {
        usage (prog_);
        return exit_usage;
    }

    void *sender = zxfer_socket (ZXFER_SENDER);
    if (!sender)
        return fail ("socket");

    const int connect_timeout = args.timeout > 0 ? args.timeout : 0;
    int rc = zxfer_setsockopt (sender, ZXFER_RCVTIMEO, &args.timeout,
                               sizeof (args.timeout));
    if (rc == 0)
        rc = zxfer_setsockopt (sender, ZXFER_SNDTIMEO, &args.timeout,
                               sizeof (args.timeout));
    if (rc == 0)
        rc = zxfer_setsockopt (sender, ZXFER_CONNECT_TIMEOUT,
                               &connect_timeout, sizeof (connect_timeout));
    if (rc == 0)
        rc = zxfer_monitor (sender, on_event, NULL, ZXFER_EVENT_ALL);
    if (rc != 0) {
        fail ("invalid option");
        zxfer_close (sender);
        return exit_usage;
    }

    const std::string address = transfer::make_address (args.host, args.port);
    if (zxfer_connect (sender, address.c_str ()) != 0) {
        const int code = fail (address.c_str ());
        zxfer_close (sender);
        return code;
    }

    for (size_t i = 0; i < args.files.size (); i++) {
        if (zxfer_send_file (sender, args.files[i].c_str ()) != 0) {
            const int code = fail (args.files[i].c_str ());
            zxfer_close (sender);
            return code;
        }
    }

    rc = zxfer_disconnect (sender);
    const int code = rc == 0 ? exit_ok : fail ("disconnect");
    zxfer_close (sender);
    return code;
}
}

int main (int argc, char *argv[])
{
    if (argc < 2) {
        usage (argv[0]);
        return exit_usage;
    }

    const std::string command = argv[1];
    if (command == "recv")
        return run_recv (argv[0], argc - 2, argv + 2);
    if (command == "send")
        return run_send (argv[0], argc - 2, argv + 2);

    usage (argv[0]);
    return exit_usage;
}
