/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"
#include "testutil_unity.hpp"

SETUP_TEARDOWN_TESTDIRS

static void send_one (const char *endpoint_, const std::string &path_)
{
    void *sender = create_connected_sender (endpoint_);
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_send_file (sender, path_.c_str ()));
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_disconnect (sender));
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (sender));
}

void test_existing_file_replaced_by_default ()
{
    const std::string src = make_test_dir ();
    const std::string dest = make_test_dir ();
    write_file (src + "/dup.txt", "new");
    write_file (dest + "/dup.txt", "old contents");

    char endpoint[MAX_SOCKET_STRING];
    void *receiver = create_receiver (dest, endpoint, sizeof (endpoint));
    async_serve_t serve (receiver, 1);
    send_one (endpoint, src + "/dup.txt");
    TEST_ASSERT_EQUAL_INT (1, serve.wait ());

    TEST_ASSERT_EQUAL_STRING ("new", read_file (dest + "/dup.txt").c_str ());
    TEST_ASSERT_EQUAL_INT (1, list_dir (dest).size ());

    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (receiver));
}

void test_same_name_twice_in_one_session ()
{
    const std::string src_a = make_test_dir ();
    const std::string src_b = make_test_dir ();
    const std::string dest = make_test_dir ();
    write_file (src_a + "/same.txt", "first");
    write_file (src_b + "/same.txt", "second");

    char endpoint[MAX_SOCKET_STRING];
    void *receiver = create_receiver (dest, endpoint, sizeof (endpoint));
    event_log_t log;
    log.attach (receiver);
    async_serve_t serve (receiver, 1);

    void *sender = create_connected_sender (endpoint);
    TEST_ASSERT_SUCCESS_ERRNO (
      zxfer_send_file (sender, (src_a + "/same.txt").c_str ()));
    TEST_ASSERT_SUCCESS_ERRNO (
      zxfer_send_file (sender, (src_b + "/same.txt").c_str ()));
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_disconnect (sender));
    TEST_ASSERT_EQUAL_INT (1, serve.wait ());

    TEST_ASSERT_EQUAL_INT (2, log.count (ZXFER_EVENT_FILE_SAVED));
    TEST_ASSERT_EQUAL_STRING ("second",
                              read_file (dest + "/same.txt").c_str ());

    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (sender));
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (receiver));
}

void test_existing_file_kept_without_overwrite ()
{
    const std::string src = make_test_dir ();
    const std::string dest = make_test_dir ();
    write_file (src + "/dup.txt", "new");
    write_file (dest + "/dup.txt", "old contents");

    char endpoint[MAX_SOCKET_STRING];
    void *receiver = create_receiver (dest, endpoint, sizeof (endpoint));
    const int overwrite = 0;
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_setsockopt (
      receiver, ZXFER_OVERWRITE, &overwrite, sizeof (overwrite)));
    event_log_t log;
    log.attach (receiver);
    async_serve_t serve (receiver, 1);
    send_one (endpoint, src + "/dup.txt");
    TEST_ASSERT_EQUAL_INT (1, serve.wait ());

    TEST_ASSERT_EQUAL_INT (EFILEIO,
                           log.first_value (ZXFER_EVENT_SESSION_FAILED));
    TEST_ASSERT_EQUAL_INT (EEXIST, log.first_value (ZXFER_EVENT_FILE_FAILED));
    TEST_ASSERT_EQUAL_STRING ("old contents",
                              read_file (dest + "/dup.txt").c_str ());

    //  The rejected payload does not linger as a staging file.
    TEST_ASSERT_EQUAL_INT (1, list_dir (dest).size ());

    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (receiver));
}

void test_new_file_stored_without_overwrite ()
{
    const std::string src = make_test_dir ();
    const std::string dest = make_test_dir ();
    write_file (src + "/fresh.txt", "fresh");

    char endpoint[MAX_SOCKET_STRING];
    void *receiver = create_receiver (dest, endpoint, sizeof (endpoint));
    const int overwrite = 0;
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_setsockopt (
      receiver, ZXFER_OVERWRITE, &overwrite, sizeof (overwrite)));
    async_serve_t serve (receiver, 1);
    send_one (endpoint, src + "/fresh.txt");
    TEST_ASSERT_EQUAL_INT (1, serve.wait ());

    TEST_ASSERT_EQUAL_STRING ("fresh",
                              read_file (dest + "/fresh.txt").c_str ());
    TEST_ASSERT_EQUAL_INT (1, list_dir (dest).size ());

    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (receiver));
}

void test_staging_name_cannot_collide ()
{
    const std::string src = make_test_dir ();
    const std::string dest = make_test_dir ();
    write_file (src + "/x.part", "draft");
    write_file (src + "/x", "final");

    char endpoint[MAX_SOCKET_STRING];
    void *receiver = create_receiver (dest, endpoint, sizeof (endpoint));
    event_log_t log;
    log.attach (receiver);
    async_serve_t serve (receiver, 1);

    void *sender = create_connected_sender (endpoint);
    TEST_ASSERT_SUCCESS_ERRNO (
      zxfer_send_file (sender, (src + "/x.part").c_str ()));
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_send_file (sender, (src + "/x").c_str ()));
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_disconnect (sender));
    TEST_ASSERT_EQUAL_INT (1, serve.wait ());

    TEST_ASSERT_EQUAL_INT (2, log.count (ZXFER_EVENT_FILE_SAVED));
    TEST_ASSERT_EQUAL_INT (0, log.count (ZXFER_EVENT_FILE_FAILED));
    TEST_ASSERT_EQUAL_STRING ("draft", read_file (dest + "/x.part").c_str ());
    TEST_ASSERT_EQUAL_STRING ("final", read_file (dest + "/x").c_str ());
    TEST_ASSERT_EQUAL_INT (2, list_dir (dest).size ());

    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (sender));
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (receiver));
}

void test_existing_part_file_kept_without_overwrite ()
{
    const std::string src = make_test_dir ();
    const std::string dest = make_test_dir ();
    write_file (src + "/keep", "payload");
    write_file (dest + "/keep.part", "unrelated");

    char endpoint[MAX_SOCKET_STRING];
    void *receiver = create_receiver (dest, endpoint, sizeof (endpoint));
    const int overwrite = 0;
    TEST_ASSERT_SUCCESS_ERRNO (zxfer_setsockopt (
      receiver, ZXFER_OVERWRITE, &overwrite, sizeof (overwrite)));
    event_log_t log;
    log.attach (receiver);
    async_serve_t serve (receiver, 1);
    send_one (endpoint, src + "/keep");
    TEST_ASSERT_EQUAL_INT (1, serve.wait ());

    TEST_ASSERT_EQUAL_INT (1, log.count (ZXFER_EVENT_FILE_SAVED));
    TEST_ASSERT_EQUAL_STRING ("unrelated",
                              read_file (dest + "/keep.part").c_str ());
    TEST_ASSERT_EQUAL_STRING ("payload", read_file (dest + "/keep").c_str ());
    TEST_ASSERT_EQUAL_INT (2, list_dir (dest).size ());

    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (receiver));
}

void test_missing_destination_directory ()
{
    const std::string dest = make_test_dir () + "/does_not_exist";

    char endpoint[MAX_SOCKET_STRING];
    void *receiver = create_receiver (dest, endpoint, sizeof (endpoint));
    event_log_t log;
    log.attach (receiver);
    async_serve_t serve (receiver, 1);

    //  Written in one piece; the receiver gives up before reading the
    //  payload.
    const int fd = connect_raw (endpoint);
    const std::string bytes = make_frame ("lost.txt", 4) + "lost";
    send_raw (fd, bytes.data (), bytes.size ());
    close_raw (fd);
    TEST_ASSERT_EQUAL_INT (1, serve.wait ());

    TEST_ASSERT_EQUAL_INT (EFILEIO,
                           log.first_value (ZXFER_EVENT_SESSION_FAILED));
    TEST_ASSERT_EQUAL_INT (ENOENT, log.first_value (ZXFER_EVENT_FILE_FAILED));

    TEST_ASSERT_SUCCESS_ERRNO (zxfer_close (receiver));
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_existing_file_replaced_by_default);
    RUN_TEST (test_same_name_twice_in_one_session);
    RUN_TEST (test_existing_file_kept_without_overwrite);
    RUN_TEST (test_new_file_stored_without_overwrite);
    RUN_TEST (test_staging_name_cannot_collide);
    RUN_TEST (test_existing_part_file_kept_without_overwrite);
    RUN_TEST (test_missing_destination_directory);
    return UNITY_END ();
}
