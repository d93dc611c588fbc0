/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZXFER_RECV_ENGINE_HPP_INCLUDED__
#define __ZXFER_RECV_ENGINE_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

#include "protocol/frame_decoder.hpp"
#include "utils/macros.hpp"

namespace zxfer
{
class i_stream;
class socket_base_t;
struct options_t;

//  Runs one receiving session over a connected stream:
//
//    await_frame -> receiving_payload -> await_frame ...
//                -> end_of_stream (peer closed between frames)
//                -> failed (protocol, file or stream error)
//
//  Each payload is written to a freshly created "<dest>/.zxfer-XXXXXX"
//  file and renamed to its final name only once every declared byte has
//  arrived. The staging file never replaces an existing file.

class recv_engine_t
{
  public:
    recv_engine_t (i_stream *stream_,
                   socket_base_t *socket_,
                   const options_t &options_,
                   const std::string &peer_);
    ~recv_engine_t ();

    //  Processes frames until the stream ends. Returns the number of files
    //  saved, or -1 with errno set if the session failed.
    int run ();

    uint64_t files_saved () const { return _files_saved; }

  private:
    enum state_t
    {
        await_frame,
        receiving_payload,
        end_of_stream,
        failed
    };

    //  Returns 1 once a frame is decoded, 0 on a clean end of stream and
    //  -1 on error.
    int read_frame ();

    //  Stores the payload of the decoded frame. Returns 0 or -1.
    int receive_payload (const frame_t &frame_);

    //  Moves a completed staging file to its final name. On failure error_
    //  receives the system errno and errno is set to EFILEIO.
    int finalize (const std::string &part_,
                  const std::string &final_,
                  int &error_);

    i_stream *const _stream;
    socket_base_t *const _socket;
    const options_t &options;
    const std::string _peer;

    state_t _state;
    frame_decoder_t _decoder;

    //  Bytes read from the stream but not consumed yet. After a frame is
    //  decoded the remainder belongs to its payload.
    std::vector<unsigned char> _inbuf;
    size_t _inpos;
    size_t _insize;

    uint64_t _files_saved;

    ZXFER_NON_COPYABLE_NOR_MOVABLE (recv_engine_t)
};
}

#endif
