/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"
#include "testutil_unity.hpp"

#include <stdio.h>

SETUP_TEARDOWN_TESTDIRS

void test_idle_peer_times_out_and_serving_continues ()
{
    const std::string src = make_test_dir ();
    const std::string dest = make_test_dir ();
    write_file (src + "/after.txt", "still serving");

    char endpoint[MAX_SOCKET_STRING];
    void *receiver = create_receiver (dest, endpoint, sizeof (endpoint));
    const int timeout = 250;
    const int jitter = 50;
    TEST_ASSERT_SUCCESS_ERRNO (
      zxfer_setsockopt (receiver, ZXFER_RCVTIMEO, &timeout, sizeof (int)));
    event_log_t log;
    log.attach (receiver);
    async_serve_t serve (receiver, 2);

    //  Connect and send nothing.
    void *stopwatch = zxfer_stopwatch_start ();
    const int fd = connect_raw (endpoint);

    //  Queued behind the idle peer until its session gave up.
    void *sender = create_connected_sender (endpoint);
    TEST_ASSERT_SUCCESS_ERRNO (
      zxfer_send_file (sender, (src + "/after.txt").c_str ()));
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_disconnect (sender));

    TEST_ASSERT_EQUAL_INT (2, serve.wait ());
    const unsigned int elapsed = zxfer_stopwatch_stop (stopwatch) / 1000;
    TEST_ASSERT_GREATER_THAN_INT (timeout - jitter, elapsed);
    if (elapsed >= 10 * timeout) {
        // we cannot assert this on a non-RT system
        fprintf (stderr,
                 "timeout of %i ms took actually %i ms to fire\n", timeout,
                 elapsed);
    }
    close_raw (fd);

    TEST_ASSERT_EQUAL_INT (1, log.count (ZXFER_EVENT_SESSION_FAILED));
    TEST_ASSERT_EQUAL_INT (ETIMEDOUT,
                           log.first_value (ZXFER_EVENT_SESSION_FAILED));
    TEST_ASSERT_EQUAL_INT (1, log.count (ZXFER_EVENT_SESSION_CLOSED));
    TEST_ASSERT_EQUAL_STRING ("still serving",
                              read_file (dest + "/after.txt").c_str ());

    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (sender));
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (receiver));
}

void test_stalled_payload_times_out ()
{
    const std::string dest = make_test_dir ();
    char endpoint[MAX_SOCKET_STRING];
    void *receiver = create_receiver (dest, endpoint, sizeof (endpoint));
    const int timeout = 200;
    TEST_ASSERT_SUCCESS_ERRNO (
      zxfer_setsockopt (receiver, ZXFER_RCVTIMEO, &timeout, sizeof (int)));
    event_log_t log;
    log.attach (receiver);

    int rc = 0;
    int err = 0;
    std::thread session ([receiver, &rc, &err] () {
        rc = zxfer_recv_session (receiver);
        err = zxfer_errno ();
    });

    //  Half of the declared payload, then silence with the stream open.
    const int fd = connect_raw (endpoint);
    const std::string bytes = make_frame ("stalled.bin", 10) + "abcde";
    send_raw (fd, bytes.data (), bytes.size ());
    session.join ();
    close_raw (fd);

    TEST_ASSERT_EQUAL_INT (-1, rc);
    TEST_ASSERT_EQUAL_INT (ETIMEDOUT, err);
    TEST_ASSERT_EQUAL_INT (ETIMEDOUT, log.first_value (ZXFER_EVENT_FILE_FAILED));
    TEST_ASSERT_EQUAL_INT (0, list_dir (dest).size ());

    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (receiver));
}

void test_no_timeout_by_default ()
{
    void *receiver = zxfer_socket (ZXFER_RECEIVER);
    int timeout = 0;
    size_t size = sizeof (timeout);
    TEST_ASSERT_SUCCESS_ERRNO (
      zxfer_getsockopt (receiver, ZXFER_RCVTIMEO, &timeout, &size));
    TEST_ASSERT_EQUAL_INT (-1, timeout);
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (receiver));
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_idle_peer_times_out_and_serving_continues);
    RUN_TEST (test_stalled_payload_times_out);
    RUN_TEST (test_no_timeout_by_default);
    return UNITY_END ();
}
