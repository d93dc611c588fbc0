/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZXFER_H_INCLUDED__
#define __ZXFER_H_INCLUDED__

/*  Version macros for compile-time API version detection                     */
#define ZXFER_VERSION_MAJOR 0
#define ZXFER_VERSION_MINOR 3
#define ZXFER_VERSION_PATCH 0

#define ZXFER_MAKE_VERSION(major, minor, patch)                                \
    ((major) *10000 + (minor) *100 + (patch))
#define ZXFER_VERSION                                                          \
    ZXFER_MAKE_VERSION (ZXFER_VERSION_MAJOR, ZXFER_VERSION_MINOR,             \
                        ZXFER_VERSION_PATCH)

#ifdef __cplusplus
extern "C" {
#endif

#include <errno.h>
#include <stddef.h>
#include <stdint.h>

/*  Handle DSO symbol visibility                                             */
#if defined ZXFER_NO_EXPORT
#define ZXFER_EXPORT
#else
#if (defined __GNUC__ && __GNUC__ >= 4) || defined __INTEL_COMPILER
#define ZXFER_EXPORT __attribute__ ((visibility ("default")))
#else
#define ZXFER_EXPORT
#endif
#endif

/******************************************************************************/
/*  Errors.                                                                   */
/******************************************************************************/

/*  A number random enough not to collide with different errno ranges on      */
/*  different OSes. The assumption is that error_t is at least 32-bit type.   */
#define ZXFER_HAUSNUMERO 156500000

/*  On platforms lacking the POSIX codes used by the transfer protocol,       */
/*  provide our own definitions.                                              */
#ifndef EPROTO
#define EPROTO (ZXFER_HAUSNUMERO + 1)
#endif
#ifndef ETIMEDOUT
#define ETIMEDOUT (ZXFER_HAUSNUMERO + 2)
#endif
#ifndef ENOTSUP
#define ENOTSUP (ZXFER_HAUSNUMERO + 3)
#endif

/*  Native zxfer error codes.                                                 */
#define EFSM (ZXFER_HAUSNUMERO + 51)
#define EFILEIO (ZXFER_HAUSNUMERO + 52)

/*  This function retrieves the errno as it is known to the library. The idea */
/*  behind it is that on some platforms errno is not shared between the       */
/*  library and the application.                                              */
ZXFER_EXPORT int zxfer_errno (void);

/*  Resolves system errors and zxfer errors to human-readable string.         */
ZXFER_EXPORT const char *zxfer_strerror (int errnum_);

/*  Run-time API version detection                                           */
ZXFER_EXPORT void zxfer_version (int *major_, int *minor_, int *patch_);

/******************************************************************************/
/*  Transfer sockets.                                                         */
/******************************************************************************/

/*  Socket types.                                                             */
#define ZXFER_SENDER 1
#define ZXFER_RECEIVER 2

/*  Socket options.                                                           */
#define ZXFER_RCVTIMEO 1
#define ZXFER_SNDTIMEO 2
#define ZXFER_CONNECT_TIMEOUT 3
#define ZXFER_CHUNK_SIZE 4
#define ZXFER_OVERWRITE 5
#define ZXFER_MAXNAMELEN 6
#define ZXFER_MAXFILESIZE 7
#define ZXFER_BACKLOG 8
#define ZXFER_DEST_DIR 9
#define ZXFER_LAST_ENDPOINT 10
#define ZXFER_TYPE 11

/*  Monitor events. The value passed with each event is given in brackets.    */
#define ZXFER_EVENT_CONNECTED 0x0001       /*  [0] detail: remote address     */
#define ZXFER_EVENT_LISTENING 0x0002       /*  [0] detail: local address      */
#define ZXFER_EVENT_ACCEPTED 0x0004        /*  [0] detail: remote address     */
#define ZXFER_EVENT_ACCEPT_FAILED 0x0008   /*  [errno] detail: local address  */
#define ZXFER_EVENT_FILE_STARTED 0x0010    /*  [size] detail: path            */
#define ZXFER_EVENT_FILE_SENT 0x0020       /*  [size] detail: path            */
#define ZXFER_EVENT_FILE_SAVED 0x0040      /*  [size] detail: stored name     */
#define ZXFER_EVENT_FILE_FAILED 0x0080     /*  [errno] detail: path or name   */
#define ZXFER_EVENT_SESSION_CLOSED 0x0100  /*  [files] detail: remote address */
#define ZXFER_EVENT_SESSION_FAILED 0x0200  /*  [errno] detail: remote address */
#define ZXFER_EVENT_ALL 0xFFFF

typedef void (zxfer_monitor_fn) (void *hint_,
                                 int event_,
                                 uint64_t value_,
                                 const char *detail_);

ZXFER_EXPORT void *zxfer_socket (int type_);
ZXFER_EXPORT int zxfer_close (void *s_);
ZXFER_EXPORT int zxfer_setsockopt (void *s_,
                                   int option_,
                                   const void *optval_,
                                   size_t optvallen_);
ZXFER_EXPORT int
zxfer_getsockopt (void *s_, int option_, void *optval_, size_t *optvallen_);
ZXFER_EXPORT int zxfer_monitor (void *s_,
                                zxfer_monitor_fn *monitor_,
                                void *hint_,
                                int events_);

/*  Receiver side. zxfer_recv_session accepts one connection and processes    */
/*  its session; it returns the number of files saved or -1. zxfer_serve      */
/*  processes max_sessions_ sessions in turn (-1 serves forever); failed      */
/*  sessions are reported through the monitor and serving continues.          */
ZXFER_EXPORT int zxfer_bind (void *s_, const char *addr_);
ZXFER_EXPORT int zxfer_recv_session (void *s_);
ZXFER_EXPORT int zxfer_serve (void *s_, int max_sessions_);

/*  Sender side. zxfer_disconnect ends the session cleanly.                   */
ZXFER_EXPORT int zxfer_connect (void *s_, const char *addr_);
ZXFER_EXPORT int zxfer_send_file (void *s_, const char *path_);
ZXFER_EXPORT int zxfer_disconnect (void *s_);

/******************************************************************************/
/*  Helpers.                                                                  */
/******************************************************************************/

/*  Helper functions are used by perf tests so that they don't have to care   */
/*  about minutiae of time-related functions on different OS platforms.       */

/*  Starts the stopwatch. Returns the handle to the watch.                    */
ZXFER_EXPORT void *zxfer_stopwatch_start (void);

/*  Stops the stopwatch. Returns the number of microseconds elapsed since     */
/*  the stopwatch was started.                                                */
ZXFER_EXPORT unsigned long zxfer_stopwatch_stop (void *watch_);

/*  Sleeps for specified number of milliseconds.                              */
ZXFER_EXPORT void zxfer_sleep_ms (int msecs_);

#undef ZXFER_EXPORT

#ifdef __cplusplus
}
#endif

#endif
