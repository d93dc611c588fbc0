/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "engine/recv_engine.hpp"
#include "engine/copy.hpp"
#include "core/options.hpp"
#include "sockets/socket_base.hpp"
#include "transports/file/file_stream.hpp"
#include "transports/i_stream.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"
#include "utils/path.hpp"

#include <stdio.h>
#include <unistd.h>

//  Received payloads are staged under this prefix in the destination
//  directory until they are complete.
static const char staging_prefix[] = ".zxfer-";

static uint64_t max_file_size (const zxfer::options_t &options_)
{
    if (options_.max_file_size < 0)
        return zxfer::frame_max_file_size;
    return static_cast<uint64_t> (options_.max_file_size);
}

zxfer::recv_engine_t::recv_engine_t (i_stream *stream_,
                                     socket_base_t *socket_,
                                     const options_t &options_,
                                     const std::string &peer_) :
    _stream (stream_),
    _socket (socket_),
    options (options_),
    _peer (peer_),
    _state (await_frame),
    _decoder (static_cast<size_t> (options_.max_name_len),
              max_file_size (options_)),
    _inbuf (static_cast<size_t> (options_.chunk_size)),
    _inpos (0),
    _insize (0),
    _files_saved (0)
{
    zxfer_assert (_stream);
    zxfer_assert (_socket);
}

zxfer::recv_engine_t::~recv_engine_t ()
{
}

int zxfer::recv_engine_t::run ()
{
    while (true) {
        switch (_state) {
            case await_frame: {
                const int rc = read_frame ();
                if (rc == 1)
                    _state = receiving_payload;
                else if (rc == 0)
                    _state = end_of_stream;
                else
                    _state = failed;
                break;
            }

            case receiving_payload:
                if (receive_payload (*_decoder.frame ()) == 0) {
                    _files_saved++;
                    _state = await_frame;
                } else
                    _state = failed;
                break;

            case end_of_stream:
                ZXFER_DBG_ENGINE ("session with %s complete, %llu files",
                                  _peer.c_str (),
                                  static_cast<unsigned long long> (
                                    _files_saved));
                _stream->close ();
                _socket->event_session_closed (_peer, _files_saved);
                return static_cast<int> (_files_saved);

            case failed: {
                const int err = errno;
                ZXFER_DBG_ENGINE ("session with %s failed: %s",
                                  _peer.c_str (), errno_to_string (err));
                _stream->close ();
                _socket->event_session_failed (_peer, err);
                errno = err;
                return -1;
            }
        }
    }
}

int zxfer::recv_engine_t::read_frame ()
{
    while (true) {
        if (_inpos < _insize) {
            size_t used = 0;
            const int rc =
              _decoder.decode (&_inbuf[_inpos], _insize - _inpos, used);
            _inpos += used;
            if (rc != 0)
                return rc;
        }

        const int nbytes = _stream->read_some (&_inbuf[0], _inbuf.size ());
        if (nbytes == -1)
            return -1;
        if (nbytes == 0) {
            //  The peer closed. Between frames this ends the session,
            //  inside a frame header the stream was cut short.
            if (_decoder.in_frame ()) {
                ZXFER_DBG_ENGINE ("stream ended inside a frame header");
                errno = EPROTO;
                return -1;
            }
            return 0;
        }
        _inpos = 0;
        _insize = static_cast<size_t> (nbytes);
    }
}

int zxfer::recv_engine_t::receive_payload (const frame_t &frame_)
{
    std::string name;
    if (sanitize_filename (frame_.name, name) == -1) {
        ZXFER_DBG_ENGINE ("rejected file name of %zu bytes",
                          frame_.name.size ());
        _socket->event_file_failed (frame_.name, EPROTO);
        return -1;
    }

    const std::string final_path = join_path (options.dest_dir, name);

    file_stream_t sink;
    if (sink.open_temp (options.dest_dir, staging_prefix) == -1) {
        _socket->event_file_failed (name, sink.last_error ());
        return -1;
    }
    const std::string staging_path = sink.path ();

    //  Payload bytes that arrived together with the frame come first.
    uint64_t remaining = frame_.size;
    const size_t buffered = static_cast<size_t> (
      std::min (remaining, static_cast<uint64_t> (_insize - _inpos)));
    int rc = 0;
    if (buffered > 0) {
        rc = sink.write_all (&_inbuf[_inpos], buffered);
        _inpos += buffered;
        remaining -= buffered;
    }

    if (rc == 0 && remaining > 0) {
        //  The input buffer is empty at this point and doubles as the
        //  copy buffer.
        zxfer_assert (_inpos == _insize);
        rc = copy_exact (_stream, &sink, remaining, &_inbuf[0],
                         _inbuf.size ());
        _inpos = _insize = 0;
        if (rc == 0) {
            ZXFER_DBG_ENGINE ("stream ended inside the payload of '%s'",
                              name.c_str ());
            errno = EPROTO;
            rc = -1;
        } else if (rc == 1)
            rc = 0;
    }

    //  System errno describing a local file failure.
    int file_error = 0;
    if (rc == -1 && errno == EFILEIO)
        file_error = sink.last_error ();
    if (rc == 0) {
        rc = sink.finish ();
        if (rc == -1)
            file_error = sink.last_error ();
    }
    if (rc == 0)
        rc = finalize (staging_path, final_path, file_error);

    if (rc == -1) {
        const int err = errno;
        sink.close ();
        if (unlink (staging_path.c_str ()) == -1 && errno != ENOENT)
            ZXFER_DBG_ENGINE ("cannot remove %s: %s", staging_path.c_str (),
                              strerror (errno));
        _socket->event_file_failed (name, err == EFILEIO ? file_error : err);
        errno = err;
        return -1;
    }

    ZXFER_DBG_ENGINE ("saved '%s' (%llu bytes)", name.c_str (),
                      static_cast<unsigned long long> (frame_.size));
    _socket->event_file_saved (name, frame_.size);
    return 0;
}

int zxfer::recv_engine_t::finalize (const std::string &staging_,
                                    const std::string &final_,
                                    int &error_)
{
    if (options.overwrite) {
        if (rename (staging_.c_str (), final_.c_str ()) == 0)
            return 0;
    } else {
        //  link() refuses to replace an existing file, which makes the
        //  existence check and the move a single step.
        if (link (staging_.c_str (), final_.c_str ()) == 0) {
            if (unlink (staging_.c_str ()) == -1)
                ZXFER_DBG_ENGINE ("cannot remove %s: %s", staging_.c_str (),
                                  strerror (errno));
            return 0;
        }
    }

    error_ = errno;
    ZXFER_DBG_ENGINE ("cannot store %s: %s", final_.c_str (),
                      strerror (error_));
    errno = EFILEIO;
    return -1;
}
