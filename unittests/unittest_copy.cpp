/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"
#include "utils/precompiled.hpp"
#include "../tests/testutil_unity.hpp"

#include "engine/copy.hpp"
#include "transports/file/file_stream.hpp"

#include <string>

SETUP_TEARDOWN_TESTDIRS

static std::string pattern (size_t size_)
{
    std::string s (size_, '\0');
    for (size_t i = 0; i < size_; i++)
        s[i] = static_cast<char> ('a' + i % 26);
    return s;
}

void test_copy_exact_moves_all_bytes ()
{
    const std::string dir = make_test_dir ();
    const std::string content = pattern (10000);
    write_file (dir + "/src", content);

    zxfer::file_stream_t from;
    zxfer::file_stream_t to;
    uint64_t size = 0;
    TEST_ASSERT_SUCCESS_ERRNO (from.open_read (dir + "/src", size));
    TEST_ASSERT_EQUAL_UINT64 (content.size (), size);
    TEST_ASSERT_SUCCESS_ERRNO (to.open_write (dir + "/dst"));

    //  A buffer that does not divide the size evenly.
    unsigned char buf[333];
    uint64_t copied = 0;
    TEST_ASSERT_EQUAL_INT (
      1, zxfer::copy_exact (&from, &to, size, buf, sizeof (buf), &copied));
    TEST_ASSERT_EQUAL_UINT64 (content.size (), copied);
    TEST_ASSERT_SUCCESS_ERRNO (to.finish ());

    TEST_ASSERT_TRUE (read_file (dir + "/dst") == content);
}

void test_copy_exact_stops_at_count ()
{
    const std::string dir = make_test_dir ();
    write_file (dir + "/src", "0123456789");

    zxfer::file_stream_t from;
    zxfer::file_stream_t to;
    uint64_t size = 0;
    TEST_ASSERT_SUCCESS_ERRNO (from.open_read (dir + "/src", size));
    TEST_ASSERT_SUCCESS_ERRNO (to.open_write (dir + "/dst"));

    unsigned char buf[64];
    TEST_ASSERT_EQUAL_INT (1, zxfer::copy_exact (&from, &to, 4, buf,
                                                 sizeof (buf)));
    TEST_ASSERT_SUCCESS_ERRNO (to.finish ());
    TEST_ASSERT_EQUAL_STRING ("0123", read_file (dir + "/dst").c_str ());

    //  The rest stays in the source stream.
    TEST_ASSERT_EQUAL_INT (6, from.read_some (buf, sizeof (buf)));
}

void test_copy_exact_zero_bytes ()
{
    const std::string dir = make_test_dir ();
    write_file (dir + "/src", "data");

    zxfer::file_stream_t from;
    zxfer::file_stream_t to;
    uint64_t size = 0;
    TEST_ASSERT_SUCCESS_ERRNO (from.open_read (dir + "/src", size));
    TEST_ASSERT_SUCCESS_ERRNO (to.open_write (dir + "/dst"));

    unsigned char buf[16];
    uint64_t copied = 99;
    TEST_ASSERT_EQUAL_INT (
      1, zxfer::copy_exact (&from, &to, 0, buf, sizeof (buf), &copied));
    TEST_ASSERT_EQUAL_UINT64 (0, copied);
}

void test_copy_exact_short_source ()
{
    const std::string dir = make_test_dir ();
    write_file (dir + "/src", "short");

    zxfer::file_stream_t from;
    zxfer::file_stream_t to;
    uint64_t size = 0;
    TEST_ASSERT_SUCCESS_ERRNO (from.open_read (dir + "/src", size));
    TEST_ASSERT_SUCCESS_ERRNO (to.open_write (dir + "/dst"));

    unsigned char buf[2];
    uint64_t copied = 0;
    TEST_ASSERT_EQUAL_INT (
      0, zxfer::copy_exact (&from, &to, 100, buf, sizeof (buf), &copied));
    TEST_ASSERT_EQUAL_UINT64 (5, copied);
}

void test_copy_exact_write_failure ()
{
    const std::string dir = make_test_dir ();
    write_file (dir + "/src", "payload");

    zxfer::file_stream_t from;
    zxfer::file_stream_t to;
    uint64_t size = 0;
    TEST_ASSERT_SUCCESS_ERRNO (from.open_read (dir + "/src", size));

    //  Writing to a stream that is not open fails.
    unsigned char buf[16];
    TEST_ASSERT_EQUAL_INT (-1, zxfer::copy_exact (&from, &to, size, buf,
                                                  sizeof (buf)));
    TEST_ASSERT_EQUAL_INT (EFILEIO, errno);
    TEST_ASSERT_EQUAL_INT (EBADF, to.last_error ());
}

void test_open_read_missing_file ()
{
    const std::string dir = make_test_dir ();
    zxfer::file_stream_t stream;
    uint64_t size = 0;
    TEST_ASSERT_FAILURE_ERRNO (EFILEIO,
                               stream.open_read (dir + "/missing", size));
    TEST_ASSERT_EQUAL_INT (ENOENT, stream.last_error ());
    TEST_ASSERT_FALSE (stream.is_open ());
}

void test_open_read_directory ()
{
    const std::string dir = make_test_dir ();
    zxfer::file_stream_t stream;
    uint64_t size = 0;
    TEST_ASSERT_FAILURE_ERRNO (EFILEIO, stream.open_read (dir, size));
    TEST_ASSERT_EQUAL_INT (EISDIR, stream.last_error ());
    TEST_ASSERT_FALSE (stream.is_open ());
}

void test_open_write_missing_directory ()
{
    const std::string dir = make_test_dir ();
    zxfer::file_stream_t stream;
    TEST_ASSERT_FAILURE_ERRNO (EFILEIO,
                               stream.open_write (dir + "/no/such/file"));
    TEST_ASSERT_EQUAL_INT (ENOENT, stream.last_error ());
}

void test_open_write_truncates ()
{
    const std::string dir = make_test_dir ();
    write_file (dir + "/f", "old contents");

    zxfer::file_stream_t stream;
    TEST_ASSERT_SUCCESS_ERRNO (stream.open_write (dir + "/f"));
    const unsigned char data[] = {'n', 'e', 'w'};
    TEST_ASSERT_SUCCESS_ERRNO (stream.write_all (data, sizeof (data)));
    TEST_ASSERT_SUCCESS_ERRNO (stream.finish ());
    TEST_ASSERT_EQUAL_STRING ("new", read_file (dir + "/f").c_str ());
}

void test_open_temp_creates_unique_files ()
{
    const std::string dir = make_test_dir ();
    write_file (dir + "/.t-", "existing");

    zxfer::file_stream_t first;
    zxfer::file_stream_t second;
    TEST_ASSERT_SUCCESS_ERRNO (first.open_temp (dir, ".t-"));
    TEST_ASSERT_SUCCESS_ERRNO (second.open_temp (dir, ".t-"));
    TEST_ASSERT_TRUE (first.path () != second.path ());
    TEST_ASSERT_EQUAL_INT (0, first.path ().compare (0, dir.size () + 4,
                                                     dir + "/.t-"));
    TEST_ASSERT_EQUAL_INT (dir.size () + 10, first.path ().size ());

    const unsigned char data[] = {'t', 'm', 'p'};
    TEST_ASSERT_SUCCESS_ERRNO (first.write_all (data, sizeof (data)));
    TEST_ASSERT_SUCCESS_ERRNO (first.finish ());
    TEST_ASSERT_SUCCESS_ERRNO (second.finish ());

    TEST_ASSERT_EQUAL_STRING ("tmp", read_file (first.path ()).c_str ());
    TEST_ASSERT_EQUAL_STRING ("existing", read_file (dir + "/.t-").c_str ());
    TEST_ASSERT_EQUAL_INT (3, list_dir (dir).size ());
}

void test_open_temp_missing_directory ()
{
    const std::string dir = make_test_dir ();
    zxfer::file_stream_t stream;
    TEST_ASSERT_FAILURE_ERRNO (EFILEIO,
                               stream.open_temp (dir + "/no/such", ".t-"));
    TEST_ASSERT_EQUAL_INT (ENOENT, stream.last_error ());
    TEST_ASSERT_FALSE (stream.is_open ());
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_copy_exact_moves_all_bytes);
    RUN_TEST (test_copy_exact_stops_at_count);
    RUN_TEST (test_copy_exact_zero_bytes);
    RUN_TEST (test_copy_exact_short_source);
    RUN_TEST (test_copy_exact_write_failure);
    RUN_TEST (test_open_read_missing_file);
    RUN_TEST (test_open_read_directory);
    RUN_TEST (test_open_write_missing_directory);
    RUN_TEST (test_open_write_truncates);
    RUN_TEST (test_open_temp_creates_unique_files);
    RUN_TEST (test_open_temp_missing_directory);
    return UNITY_END ();
}
