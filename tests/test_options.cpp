/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"
#include "testutil_unity.hpp"

#include <stdlib.h>
#include <string.h>

SETUP_TEARDOWN_TESTDIRS

static int get_int (void *socket_, int option_)
{
    int value = 0;
    size_t size = sizeof (value);
    TEST_ASSERT_SUCCESS_ERRNO (
      zxfer_getsockopt (socket_, option_, &value, &size));
    TEST_ASSERT_EQUAL_INT (sizeof (value), size);
    return value;
}

void test_defaults ()
{
    void *receiver = zxfer_socket (ZXFER_RECEIVER);
    TEST_ASSERT_EQUAL_INT (ZXFER_RECEIVER, get_int (receiver, ZXFER_TYPE));
    TEST_ASSERT_EQUAL_INT (-1, get_int (receiver, ZXFER_RCVTIMEO));
    TEST_ASSERT_EQUAL_INT (-1, get_int (receiver, ZXFER_SNDTIMEO));
    TEST_ASSERT_EQUAL_INT (0, get_int (receiver, ZXFER_CONNECT_TIMEOUT));
    TEST_ASSERT_EQUAL_INT (4096, get_int (receiver, ZXFER_CHUNK_SIZE));
    TEST_ASSERT_EQUAL_INT (1, get_int (receiver, ZXFER_OVERWRITE));
    TEST_ASSERT_EQUAL_INT (65535, get_int (receiver, ZXFER_MAXNAMELEN));
    TEST_ASSERT_EQUAL_INT (16, get_int (receiver, ZXFER_BACKLOG));

    int64_t max_file_size = 0;
    size_t size = sizeof (max_file_size);
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_getsockopt (receiver, ZXFER_MAXFILESIZE,
                                                 &max_file_size, &size));
    TEST_ASSERT_EQUAL_INT64 (-1, max_file_size);

    char dir[64];
    size = sizeof (dir);
    TEST_ASSERT_SUCCESS_ERRNO (
      zxfer_getsockopt (receiver, ZXFER_DEST_DIR, dir, &size));
    TEST_ASSERT_EQUAL_STRING (".", dir);
    TEST_ASSERT_EQUAL_INT (2, size);

    char endpoint[MAX_SOCKET_STRING];
    size = sizeof (endpoint);
    TEST_ASSERT_SUCCESS_ERRNO (
      zxfer_getsockopt (receiver, ZXFER_LAST_ENDPOINT, endpoint, &size));
    TEST_ASSERT_EQUAL_STRING ("", endpoint);

    void *sender = zxfer_socket (ZXFER_SENDER);
    TEST_ASSERT_EQUAL_INT (ZXFER_SENDER, get_int (sender, ZXFER_TYPE));

    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (sender));
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (receiver));
}

void test_set_and_get ()
{
    void *receiver = zxfer_socket (ZXFER_RECEIVER);

    const int timeout = 1500;
    TEST_ASSERT_SUCCESS_ERRNO (
      zxfer_setsockopt (receiver, ZXFER_RCVTIMEO, &timeout, sizeof (timeout)));
    TEST_ASSERT_EQUAL_INT (1500, get_int (receiver, ZXFER_RCVTIMEO));

    const int overwrite = 0;
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_setsockopt (
      receiver, ZXFER_OVERWRITE, &overwrite, sizeof (overwrite)));
    TEST_ASSERT_EQUAL_INT (0, get_int (receiver, ZXFER_OVERWRITE));

    //  The terminating NUL is optional.
    TEST_ASSERT_SUCCESS_ERRNO (
      zxfer_setsockopt (receiver, ZXFER_DEST_DIR, "/tmp/in", 8));
    char dir[64];
    size_t size = sizeof (dir);
    TEST_ASSERT_SUCCESS_ERRNO (
      zxfer_getsockopt (receiver, ZXFER_DEST_DIR, dir, &size));
    TEST_ASSERT_EQUAL_STRING ("/tmp/in", dir);
    TEST_ASSERT_SUCCESS_ERRNO (
      zxfer_setsockopt (receiver, ZXFER_DEST_DIR, "/tmp/out", 8));
    size = sizeof (dir);
    TEST_ASSERT_SUCCESS_ERRNO (
      zxfer_getsockopt (receiver, ZXFER_DEST_DIR, dir, &size));
    TEST_ASSERT_EQUAL_STRING ("/tmp/out", dir);

    //  A buffer too small for the value is rejected.
    char tiny[4];
    size = sizeof (tiny);
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, zxfer_getsockopt (receiver, ZXFER_DEST_DIR, tiny, &size));

    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (receiver));
}

void test_chunk_size_limit ()
{
    void *s = zxfer_socket (ZXFER_SENDER);

    const int largest = 16 * 1024 * 1024;
    TEST_ASSERT_SUCCESS_ERRNO (
      zxfer_setsockopt (s, ZXFER_CHUNK_SIZE, &largest, sizeof (largest)));
    TEST_ASSERT_EQUAL_INT (largest, get_int (s, ZXFER_CHUNK_SIZE));

    const int too_large = largest + 1;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL,
      zxfer_setsockopt (s, ZXFER_CHUNK_SIZE, &too_large, sizeof (too_large)));
    TEST_ASSERT_EQUAL_INT (largest, get_int (s, ZXFER_CHUNK_SIZE));

    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (s));
}

void test_invalid_values ()
{
    void *s = zxfer_socket (ZXFER_RECEIVER);

    const int zero = 0;
    const int minus_two = -2;
    const int two = 2;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, zxfer_setsockopt (s, ZXFER_RCVTIMEO, &zero, sizeof (int)));
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, zxfer_setsockopt (s, ZXFER_SNDTIMEO, &minus_two, sizeof (int)));
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, zxfer_setsockopt (s, ZXFER_CHUNK_SIZE, &zero, sizeof (int)));
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, zxfer_setsockopt (s, ZXFER_OVERWRITE, &two, sizeof (int)));
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, zxfer_setsockopt (s, ZXFER_MAXNAMELEN, &zero, sizeof (int)));
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, zxfer_setsockopt (s, ZXFER_CONNECT_TIMEOUT, &minus_two,
                                sizeof (int)));

    //  Wrong option size.
    const int64_t wide = 5;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, zxfer_setsockopt (s, ZXFER_RCVTIMEO, &wide, sizeof (wide)));
    const int narrow = 5;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, zxfer_setsockopt (s, ZXFER_MAXFILESIZE, &narrow, sizeof (narrow)));

    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, zxfer_setsockopt (s, ZXFER_DEST_DIR, "", 0));
    TEST_ASSERT_FAILURE_ERRNO (EINVAL,
                               zxfer_setsockopt (s, 9999, &two, sizeof (int)));

    //  Read-only options.
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, zxfer_setsockopt (s, ZXFER_LAST_ENDPOINT, "x", 1));
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, zxfer_setsockopt (s, ZXFER_TYPE, &two, sizeof (int)));

    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (s));
}

void test_bind_addresses ()
{
    void *receiver = zxfer_socket (ZXFER_RECEIVER);
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, zxfer_bind (receiver, "no_port"));
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, zxfer_bind (receiver, "127.0.0.1:"));
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, zxfer_bind (receiver, "127.0.0.1:abc"));
    TEST_ASSERT_FAILURE_ERRNO (EINVAL,
                               zxfer_bind (receiver, "127.0.0.1:99999"));
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, zxfer_bind (receiver, ":7070"));

    //  The scheme prefix is accepted and the wildcard port resolved.
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_bind (receiver, "tcp://127.0.0.1:*"));
    char endpoint[MAX_SOCKET_STRING];
    size_t size = sizeof (endpoint);
    TEST_ASSERT_SUCCESS_ERRNO (
      zxfer_getsockopt (receiver, ZXFER_LAST_ENDPOINT, endpoint, &size));
    TEST_ASSERT_EQUAL_INT (0, strncmp (endpoint, "127.0.0.1:", 10));
    TEST_ASSERT_NOT_EQUAL (0, atoi (endpoint + 10));

    //  One listener per socket.
    TEST_ASSERT_FAILURE_ERRNO (EFSM, zxfer_bind (receiver, "127.0.0.1:*"));

    //  The port is taken while the first receiver listens.
    void *second = zxfer_socket (ZXFER_RECEIVER);
    TEST_ASSERT_FAILURE_ERRNO (EADDRINUSE, zxfer_bind (second, endpoint));

    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (second));
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (receiver));
}

void test_listening_event ()
{
    const std::string dest = make_test_dir ();
    void *receiver = zxfer_socket (ZXFER_RECEIVER);
    event_log_t log;
    log.attach (receiver);
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_bind (receiver, "127.0.0.1:*"));

    char endpoint[MAX_SOCKET_STRING];
    size_t size = sizeof (endpoint);
    TEST_ASSERT_SUCCESS_ERRNO (
      zxfer_getsockopt (receiver, ZXFER_LAST_ENDPOINT, endpoint, &size));
    const std::vector<std::string> listening =
      log.details (ZXFER_EVENT_LISTENING);
    TEST_ASSERT_EQUAL_INT (1, listening.size ());
    TEST_ASSERT_EQUAL_STRING (endpoint, listening[0].c_str ());

    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (receiver));
}

void test_invalid_handles ()
{
    TEST_ASSERT_NULL (zxfer_socket (99));
    TEST_ASSERT_EQUAL_INT (EINVAL, zxfer_errno ());

    TEST_ASSERT_FAILURE_ERRNO (ENOTSOCK, zxfer_close (NULL));
    TEST_ASSERT_FAILURE_ERRNO (ENOTSOCK, zxfer_bind (NULL, "127.0.0.1:*"));
}

void test_strerror_and_version ()
{
    TEST_ASSERT_NOT_NULL (zxfer_strerror (EFILEIO));
    TEST_ASSERT_NOT_NULL (zxfer_strerror (EFSM));
    TEST_ASSERT_TRUE (strcmp (zxfer_strerror (EFILEIO), zxfer_strerror (EFSM))
                      != 0);
    TEST_ASSERT_EQUAL_STRING (strerror (ENOENT), zxfer_strerror (ENOENT));

    int major, minor, patch;
    zxfer_version (&major, &minor, &patch);
    TEST_ASSERT_EQUAL_INT (ZXFER_VERSION_MAJOR, major);
    TEST_ASSERT_EQUAL_INT (ZXFER_VERSION_MINOR, minor);
    TEST_ASSERT_EQUAL_INT (ZXFER_VERSION_PATCH, patch);
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_defaults);
    RUN_TEST (test_set_and_get);
    RUN_TEST (test_chunk_size_limit);
    RUN_TEST (test_invalid_values);
    RUN_TEST (test_bind_addresses);
    RUN_TEST (test_listening_event);
    RUN_TEST (test_invalid_handles);
    RUN_TEST (test_strerror_and_version);
    return UNITY_END ();
}
