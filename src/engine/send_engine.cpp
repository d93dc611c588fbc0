/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "engine/send_engine.hpp"
#include "engine/copy.hpp"
#include "core/options.hpp"
#include "sockets/socket_base.hpp"
#include "transports/file/file_stream.hpp"
#include "transports/i_stream.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"
#include "utils/path.hpp"

zxfer::send_engine_t::send_engine_t (i_stream *stream_,
                                     socket_base_t *socket_,
                                     const options_t &options_) :
    _stream (stream_),
    _socket (socket_),
    options (options_),
    _encoder (static_cast<size_t> (options_.chunk_size)),
    _buf (static_cast<size_t> (options_.chunk_size)),
    _files_sent (0)
{
    zxfer_assert (_stream);
    zxfer_assert (_socket);
}

zxfer::send_engine_t::~send_engine_t ()
{
}

int zxfer::send_engine_t::send_file (const char *path_)
{
    const std::string path (path_);

    file_stream_t source;
    uint64_t size = 0;
    if (source.open_read (path, size) == -1) {
        _socket->event_file_failed (path, source.last_error ());
        return -1;
    }

    const frame_t frame (base_name (path), size);
    if (frame.name.size () > static_cast<size_t> (options.max_name_len)) {
        ZXFER_DBG_ENGINE ("name of %s exceeds %d bytes", path_,
                          options.max_name_len);
        _socket->event_file_failed (path, ENAMETOOLONG);
        errno = EFILEIO;
        return -1;
    }

    _socket->event_file_started (path, size);
    ZXFER_DBG_ENGINE ("sending %s as '%s' (%llu bytes)", path_,
                      frame.name.c_str (),
                      static_cast<unsigned long long> (size));

    if (write_frame (frame) == -1) {
        _socket->event_file_failed (path, errno);
        return -1;
    }

    const int rc = copy_exact (&source, _stream, size, &_buf[0], _buf.size ());
    if (rc == 0) {
        //  The file got shorter than it was when the frame went out.
        _socket->event_file_failed (path, EIO);
        errno = EFILEIO;
        return -1;
    }
    if (rc == -1) {
        _socket->event_file_failed (
          path, errno == EFILEIO ? source.last_error () : errno);
        return -1;
    }

    if (source.finish () == -1) {
        _socket->event_file_failed (path, source.last_error ());
        return -1;
    }

    _files_sent++;
    _socket->event_file_sent (path, size);
    return 0;
}

int zxfer::send_engine_t::write_frame (const frame_t &frame_)
{
    _encoder.load_frame (&frame_);

    while (true) {
        unsigned char *data = NULL;
        const size_t size = _encoder.encode (&data, 0);
        if (size == 0)
            break;
        if (_stream->write_all (data, size) == -1)
            return -1;
    }
    return 0;
}
