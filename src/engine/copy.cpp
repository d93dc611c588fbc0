/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "engine/copy.hpp"
#include "transports/i_stream.hpp"
#include "utils/err.hpp"

int zxfer::copy_exact (i_stream *from_,
                       i_stream *to_,
                       uint64_t n_,
                       unsigned char *buf_,
                       size_t bufsize_,
                       uint64_t *copied_)
{
    zxfer_assert (bufsize_ > 0);

    uint64_t copied = 0;
    int result = 1;
    while (copied < n_) {
        const size_t chunk = static_cast<size_t> (
          std::min (n_ - copied, static_cast<uint64_t> (bufsize_)));

        const int nbytes = from_->read_some (buf_, chunk);
        if (nbytes <= 0) {
            result = nbytes;
            break;
        }
        if (to_->write_all (buf_, static_cast<size_t> (nbytes)) == -1) {
            result = -1;
            break;
        }
        copied += static_cast<uint64_t> (nbytes);
    }

    if (copied_)
        *copied_ = copied;
    return result;
}
