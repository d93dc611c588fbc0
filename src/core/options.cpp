/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include <string.h>
#include <limits.h>

#include "core/options.hpp"
#include "utils/err.hpp"
#include "utils/macros.hpp"

static int sockopt_invalid ()
{
    errno = EINVAL;
    return -1;
}

int zxfer::do_getsockopt (void *const optval_,
                          size_t *const optvallen_,
                          const std::string &value_)
{
    const size_t value_len = value_.size () + 1;
    if (*optvallen_ < value_len) {
        return sockopt_invalid ();
    }
    memcpy (optval_, value_.c_str (), value_len);
    memset (static_cast<char *> (optval_) + value_len, 0,
            *optvallen_ - value_len);
    *optvallen_ = value_len;
    return 0;
}

template <typename T>
static int do_setsockopt (const void *const optval_,
                          const size_t optvallen_,
                          T *const out_value_)
{
    if (optvallen_ == sizeof (T)) {
        memcpy (out_value_, optval_, sizeof (T));
        return 0;
    }
    return sockopt_invalid ();
}

static int do_setsockopt_int_as_bool_strict (const void *const optval_,
                                             const size_t optvallen_,
                                             bool *const out_value_)
{
    int value = -1;
    if (do_setsockopt (optval_, optvallen_, &value) == -1)
        return -1;
    if (value == 0 || value == 1) {
        *out_value_ = (value != 0);
        return 0;
    }
    return sockopt_invalid ();
}

zxfer::options_t::options_t () :
    type (-1),
    rcvtimeo (-1),
    sndtimeo (-1),
    connect_timeout (0),
    chunk_size (default_chunk_size),
    overwrite (true),
    max_name_len (default_max_name_len),
    max_file_size (-1),
    backlog (16),
    dest_dir (".")
{
}

int zxfer::options_t::setsockopt (int option_,
                                  const void *optval_,
                                  size_t optvallen_)
{
    const bool is_int = (optvallen_ == sizeof (int));
    int value = 0;
    if (is_int)
        memcpy (&value, optval_, sizeof (int));

    switch (option_) {
        case ZXFER_RCVTIMEO:
            if (is_int && (value == -1 || value > 0)) {
                rcvtimeo = value;
                return 0;
            }
            break;

        case ZXFER_SNDTIMEO:
            if (is_int && (value == -1 || value > 0)) {
                sndtimeo = value;
                return 0;
            }
            break;

        case ZXFER_CONNECT_TIMEOUT:
            if (is_int && value >= 0) {
                connect_timeout = value;
                return 0;
            }
            break;

        case ZXFER_CHUNK_SIZE:
            if (is_int && value > 0 && value <= max_chunk_size) {
                chunk_size = value;
                return 0;
            }
            break;

        case ZXFER_OVERWRITE:
            return do_setsockopt_int_as_bool_strict (optval_, optvallen_,
                                                     &overwrite);

        case ZXFER_MAXNAMELEN:
            if (is_int && value > 0) {
                max_name_len = value;
                return 0;
            }
            break;

        case ZXFER_MAXFILESIZE: {
            int64_t limit = 0;
            if (do_setsockopt (optval_, optvallen_, &limit) == -1)
                return -1;
            if (limit >= -1) {
                max_file_size = limit;
                return 0;
            }
            break;
        }

        case ZXFER_BACKLOG:
            if (is_int && value >= 0) {
                backlog = value;
                return 0;
            }
            break;

        case ZXFER_DEST_DIR:
            if (optval_ != NULL && optvallen_ > 0 && optvallen_ <= PATH_MAX) {
                dest_dir.assign (static_cast<const char *> (optval_),
                                 optvallen_);
                //  Tolerate callers passing the terminating NUL.
                if (dest_dir[dest_dir.size () - 1] == '\0')
                    dest_dir.resize (dest_dir.size () - 1);
                if (!dest_dir.empty ())
                    return 0;
            }
            break;

        default:
            break;
    }

    return sockopt_invalid ();
}

int zxfer::options_t::getsockopt (int option_,
                                  void *optval_,
                                  size_t *optvallen_) const
{
    const bool is_int = (*optvallen_ == sizeof (int));
    int *value = static_cast<int *> (optval_);

    switch (option_) {
        case ZXFER_TYPE:
            if (is_int) {
                *value = type;
                return 0;
            }
            break;

        case ZXFER_RCVTIMEO:
            if (is_int) {
                *value = rcvtimeo;
                return 0;
            }
            break;

        case ZXFER_SNDTIMEO:
            if (is_int) {
                *value = sndtimeo;
                return 0;
            }
            break;

        case ZXFER_CONNECT_TIMEOUT:
            if (is_int) {
                *value = connect_timeout;
                return 0;
            }
            break;

        case ZXFER_CHUNK_SIZE:
            if (is_int) {
                *value = chunk_size;
                return 0;
            }
            break;

        case ZXFER_OVERWRITE:
            if (is_int) {
                *value = overwrite ? 1 : 0;
                return 0;
            }
            break;

        case ZXFER_MAXNAMELEN:
            if (is_int) {
                *value = max_name_len;
                return 0;
            }
            break;

        case ZXFER_MAXFILESIZE:
            if (*optvallen_ == sizeof (int64_t)) {
                *(static_cast<int64_t *> (optval_)) = max_file_size;
                return 0;
            }
            break;

        case ZXFER_BACKLOG:
            if (is_int) {
                *value = backlog;
                return 0;
            }
            break;

        case ZXFER_DEST_DIR:
            return do_getsockopt (optval_, optvallen_, dest_dir);

        default:
            break;
    }

    return sockopt_invalid ();
}
