/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "utils/err.hpp"
#include "utils/macros.hpp"

const char *zxfer::errno_to_string (int errno_)
{
    switch (errno_) {
        case EFSM:
            return "Operation cannot be accomplished in current state";
        case EFILEIO:
            return "Local file cannot be opened, created, read or written";
#if EPROTO >= ZXFER_HAUSNUMERO
        case EPROTO:
            return "Protocol error";
#endif
#if ETIMEDOUT >= ZXFER_HAUSNUMERO
        case ETIMEDOUT:
            return "Operation timed out";
#endif
#if ENOTSUP >= ZXFER_HAUSNUMERO
        case ENOTSUP:
            return "Not supported";
#endif
        default:
            return strerror (errno_);
    }
}

void zxfer::zxfer_abort (const char *errmsg_)
{
    LIBZXFER_UNUSED (errmsg_);
    abort ();
}
