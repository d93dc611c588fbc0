/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZXFER_SEND_ENGINE_HPP_INCLUDED__
#define __ZXFER_SEND_ENGINE_HPP_INCLUDED__

#include <stddef.h>
#include <vector>

#include "protocol/frame_encoder.hpp"
#include "utils/macros.hpp"

namespace zxfer
{
class i_stream;
class socket_base_t;
struct options_t;

//  Writes files to a connected stream, one frame followed by the file's
//  bytes per call. The engine does not own the stream; the socket closes
//  it once a send fails.

class send_engine_t
{
  public:
    send_engine_t (i_stream *stream_,
                   socket_base_t *socket_,
                   const options_t &options_);
    ~send_engine_t ();

    //  Sends one file. Returns 0 on success or -1 with errno set: EFILEIO
    //  if the local file cannot be used, otherwise the stream's error.
    int send_file (const char *path_);

    //  Number of files sent so far.
    uint64_t files_sent () const { return _files_sent; }

  private:
    //  Pushes the encoded frame to the stream.
    int write_frame (const frame_t &frame_);

    i_stream *const _stream;
    socket_base_t *const _socket;
    const options_t &options;

    frame_encoder_t _encoder;

    //  Bounded buffer the payload is moved through.
    std::vector<unsigned char> _buf;

    uint64_t _files_sent;

    ZXFER_NON_COPYABLE_NOR_MOVABLE (send_engine_t)
};
}

#endif
