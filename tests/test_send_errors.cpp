/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"
#include "testutil_unity.hpp"

SETUP_TEARDOWN_TESTDIRS

void test_missing_source_file ()
{
    const std::string dest = make_test_dir ();
    char endpoint[MAX_SOCKET_STRING];
    void *receiver = create_receiver (dest, endpoint, sizeof (endpoint));
    event_log_t receiver_log;
    receiver_log.attach (receiver);
    async_serve_t serve (receiver, 1);

    void *sender = zxfer_socket (ZXFER_SENDER);
    event_log_t log;
    log.attach (sender);
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_connect (sender, endpoint));
    TEST_ASSERT_FAILURE_ERRNO (
      EFILEIO, zxfer_send_file (sender, "/nonexistent/zxfer/missing.bin"));
    TEST_ASSERT_EQUAL_INT (ENOENT, log.first_value (ZXFER_EVENT_FILE_FAILED));
    TEST_ASSERT_EQUAL_INT (0, log.count (ZXFER_EVENT_FILE_STARTED));

    //  The failure ended the session.
    TEST_ASSERT_FAILURE_ERRNO (
      EFSM, zxfer_send_file (sender, "/nonexistent/zxfer/missing.bin"));

    //  No frame was written, so the receiver saw a clean, empty session.
    TEST_ASSERT_EQUAL_INT (1, serve.wait ());
    TEST_ASSERT_EQUAL_INT (1,
                           receiver_log.count (ZXFER_EVENT_SESSION_CLOSED));
    TEST_ASSERT_EQUAL_INT (
      0, receiver_log.first_value (ZXFER_EVENT_SESSION_CLOSED));
    TEST_ASSERT_EQUAL_INT (0, list_dir (dest).size ());

    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (sender));
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (receiver));
}

void test_directory_is_not_a_file ()
{
    const std::string src = make_test_dir ();
    const std::string dest = make_test_dir ();
    char endpoint[MAX_SOCKET_STRING];
    void *receiver = create_receiver (dest, endpoint, sizeof (endpoint));
    async_serve_t serve (receiver, 1);

    void *sender = zxfer_socket (ZXFER_SENDER);
    event_log_t log;
    log.attach (sender);
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_connect (sender, endpoint));
    TEST_ASSERT_FAILURE_ERRNO (EFILEIO, zxfer_send_file (sender, src.c_str ()));
    TEST_ASSERT_EQUAL_INT (EISDIR, log.first_value (ZXFER_EVENT_FILE_FAILED));

    TEST_ASSERT_EQUAL_INT (1, serve.wait ());
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (sender));
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (receiver));
}

void test_earlier_files_survive_a_failed_send ()
{
    const std::string src = make_test_dir ();
    const std::string dest = make_test_dir ();
    write_file (src + "/first.txt", "first");

    char endpoint[MAX_SOCKET_STRING];
    void *receiver = create_receiver (dest, endpoint, sizeof (endpoint));
    async_serve_t serve (receiver, 1);

    void *sender = create_connected_sender (endpoint);
    TEST_ASSERT_SUCCESS_ERRNO (
      zxfer_send_file (sender, (src + "/first.txt").c_str ()));
    TEST_ASSERT_FAILURE_ERRNO (
      EFILEIO, zxfer_send_file (sender, (src + "/second.txt").c_str ()));
    TEST_ASSERT_EQUAL_INT (1, serve.wait ());

    const std::vector<std::string> names = list_dir (dest);
    TEST_ASSERT_EQUAL_INT (1, names.size ());
    TEST_ASSERT_EQUAL_STRING ("first.txt", names[0].c_str ());

    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (sender));
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (receiver));
}

void test_connection_refused ()
{
    const std::string dest = make_test_dir ();
    char endpoint[MAX_SOCKET_STRING];
    void *receiver = create_receiver (dest, endpoint, sizeof (endpoint));
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (receiver));

    void *sender = zxfer_socket (ZXFER_SENDER);
    TEST_ASSERT_FAILURE_ERRNO (ECONNREFUSED, zxfer_connect (sender, endpoint));
    TEST_ASSERT_FAILURE_ERRNO (EFSM, zxfer_disconnect (sender));
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (sender));
}

void test_calls_in_wrong_state ()
{
    void *sender = zxfer_socket (ZXFER_SENDER);
    TEST_ASSERT_FAILURE_ERRNO (EFSM, zxfer_send_file (sender, "any"));
    TEST_ASSERT_FAILURE_ERRNO (EFSM, zxfer_disconnect (sender));

    void *receiver = zxfer_socket (ZXFER_RECEIVER);
    TEST_ASSERT_FAILURE_ERRNO (EFSM, zxfer_recv_session (receiver));
    TEST_ASSERT_FAILURE_ERRNO (EFSM, zxfer_serve (receiver, 1));

    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (receiver));
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (sender));
}

void test_operations_of_other_socket_type ()
{
    void *sender = zxfer_socket (ZXFER_SENDER);
    TEST_ASSERT_FAILURE_ERRNO (ENOTSUP, zxfer_bind (sender, "127.0.0.1:*"));
    TEST_ASSERT_FAILURE_ERRNO (ENOTSUP, zxfer_recv_session (sender));
    TEST_ASSERT_FAILURE_ERRNO (ENOTSUP, zxfer_serve (sender, 1));

    void *receiver = zxfer_socket (ZXFER_RECEIVER);
    TEST_ASSERT_FAILURE_ERRNO (ENOTSUP,
                               zxfer_connect (receiver, "127.0.0.1:7070"));
    TEST_ASSERT_FAILURE_ERRNO (ENOTSUP, zxfer_send_file (receiver, "any"));
    TEST_ASSERT_FAILURE_ERRNO (ENOTSUP, zxfer_disconnect (receiver));

    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (receiver));
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (sender));
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_missing_source_file);
    RUN_TEST (test_directory_is_not_a_file);
    RUN_TEST (test_earlier_files_survive_a_failed_send);
    RUN_TEST (test_connection_refused);
    RUN_TEST (test_calls_in_wrong_state);
    RUN_TEST (test_operations_of_other_socket_type);
    return UNITY_END ();
}
