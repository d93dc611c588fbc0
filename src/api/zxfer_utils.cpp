/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"

#include "utils/macros.hpp"
#include "utils/err.hpp"

#include <chrono>
#include <thread>

static uint64_t now_us ()
{
    return static_cast<uint64_t> (
      std::chrono::duration_cast<std::chrono::microseconds> (
        std::chrono::steady_clock::now ().time_since_epoch ())
        .count ());
}

void zxfer_sleep_ms (int msecs_)
{
    std::this_thread::sleep_for (std::chrono::milliseconds (msecs_));
}

void *zxfer_stopwatch_start ()
{
    uint64_t *watch = static_cast<uint64_t *> (malloc (sizeof (uint64_t)));
    alloc_assert (watch);
    *watch = now_us ();
    return static_cast<void *> (watch);
}

unsigned long zxfer_stopwatch_stop (void *watch_)
{
    const uint64_t end = now_us ();
    const uint64_t start = *static_cast<uint64_t *> (watch_);
    free (watch_);
    return static_cast<unsigned long> (end - start);
}
