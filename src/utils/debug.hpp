/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZXFER_DEBUG_HPP_INCLUDED__
#define __ZXFER_DEBUG_HPP_INCLUDED__

#include <cstdio>

//  Unified debug macros for transfer components
//  Enable with -DZXFER_DEBUG=1 during compilation
//
//  Usage:
//    ZXFER_DBG_ENGINE("frame decoded: %s (%llu bytes)", name, size);
//    ZXFER_DBG_STREAM("read completed: %zu bytes", bytes);
//    ZXFER_DBG_LISTENER("accepted %s", peer);

#ifdef ZXFER_DEBUG

#define ZXFER_DBG(category, fmt, ...)                                          \
    do {                                                                       \
        fprintf (stderr, "[ZXFER:" category "] " fmt "\n", ##__VA_ARGS__);     \
    } while (0)

#define ZXFER_DBG_THIS(category, fmt, ...)                                     \
    do {                                                                       \
        fprintf (stderr, "[ZXFER:" category ":%p] " fmt "\n",                  \
                 static_cast<const void *> (this), ##__VA_ARGS__);             \
    } while (0)

#else

#define ZXFER_DBG(category, fmt, ...) ((void) 0)
#define ZXFER_DBG_THIS(category, fmt, ...) ((void) 0)

#endif

//  Component-specific macros
#define ZXFER_DBG_ENGINE(fmt, ...) ZXFER_DBG_THIS ("ENGINE", fmt, ##__VA_ARGS__)
#define ZXFER_DBG_STREAM(fmt, ...) ZXFER_DBG_THIS ("STREAM", fmt, ##__VA_ARGS__)
#define ZXFER_DBG_CONN(fmt, ...) ZXFER_DBG_THIS ("CONN", fmt, ##__VA_ARGS__)
#define ZXFER_DBG_LISTENER(fmt, ...)                                           \
    ZXFER_DBG_THIS ("LISTENER", fmt, ##__VA_ARGS__)
#define ZXFER_DBG_FILE(fmt, ...) ZXFER_DBG_THIS ("FILE", fmt, ##__VA_ARGS__)

//  Global macro (without this pointer)
#define ZXFER_GLOBAL_DEBUG(fmt, ...) ZXFER_DBG ("DEBUG", fmt, ##__VA_ARGS__)

#endif
