/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZXFER_OPTIONS_HPP_INCLUDED__
#define __ZXFER_OPTIONS_HPP_INCLUDED__

#include <string>
#include <stddef.h>
#include <stdint.h>

namespace zxfer
{
//  Default size of the buffers payload bytes are moved through.
const int default_chunk_size = 4096;

//  Largest chunk size accepted by ZXFER_CHUNK_SIZE.
const int max_chunk_size = 16 * 1024 * 1024;

//  Longest file name accepted on the wire unless configured otherwise.
const int default_max_name_len = 65535;

struct options_t
{
    options_t ();

    int setsockopt (int option_, const void *optval_, size_t optvallen_);
    int getsockopt (int option_, void *optval_, size_t *optvallen_) const;

    //  Socket type.
    int type;

    //  Timeouts for blocking stream reads and writes in milliseconds,
    //  -1 waits forever.
    int rcvtimeo;
    int sndtimeo;

    //  Maximum time in milliseconds a connect may take, 0 waits as long
    //  as the operating system does.
    int connect_timeout;

    //  Size of the bounded buffer used for file and frame I/O.
    int chunk_size;

    //  If true, a received file replaces an existing file of the same name.
    bool overwrite;

    //  Limits applied to incoming frames. max_file_size of -1 allows any
    //  size the wire format can express.
    int max_name_len;
    int64_t max_file_size;

    //  Maximum backlog for pending connections.
    int backlog;

    //  Directory received files are stored in.
    std::string dest_dir;
};

int do_getsockopt (void *optval_, size_t *optvallen_, const std::string &value_);
}

#endif
