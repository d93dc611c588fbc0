/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"
#include "utils/precompiled.hpp"

#include "utils/path.hpp"

#include <unity.h>
#include <string>

void setUp ()
{
}

void tearDown ()
{
}

static void check_sanitized (const char *name_, const char *expected_)
{
    std::string out;
    TEST_ASSERT_EQUAL_INT (0, zxfer::sanitize_filename (name_, out));
    TEST_ASSERT_EQUAL_STRING (expected_, out.c_str ());
}

static void check_rejected (const std::string &name_)
{
    std::string out = "unchanged";
    errno = 0;
    TEST_ASSERT_EQUAL_INT (-1, zxfer::sanitize_filename (name_, out));
    TEST_ASSERT_EQUAL_INT (EPROTO, errno);
    TEST_ASSERT_EQUAL_STRING ("unchanged", out.c_str ());
}

void test_plain_names_pass ()
{
    check_sanitized ("a.bin", "a.bin");
    check_sanitized ("..hidden", "..hidden");
    check_sanitized ("name with spaces", "name with spaces");
    check_sanitized ("...", "...");
}

void test_directories_are_stripped ()
{
    check_sanitized ("dir/a.bin", "a.bin");
    check_sanitized ("/etc/passwd", "passwd");
    check_sanitized ("../../escape.txt", "escape.txt");
    check_sanitized ("C:\\Windows\\evil.dll", "evil.dll");
    check_sanitized ("mixed/dir\\file", "file");
}

void test_unusable_names_are_rejected ()
{
    check_rejected ("");
    check_rejected (".");
    check_rejected ("..");
    check_rejected ("dir/");
    check_rejected ("dir/..");
    check_rejected ("dir\\.");
    check_rejected (std::string ("a\0b", 3));
}

void test_base_name ()
{
    TEST_ASSERT_EQUAL_STRING ("a.bin", zxfer::base_name ("a.bin").c_str ());
    TEST_ASSERT_EQUAL_STRING ("a.bin",
                              zxfer::base_name ("/tmp/x/a.bin").c_str ());
    TEST_ASSERT_EQUAL_STRING ("", zxfer::base_name ("dir/").c_str ());
}

void test_join_path ()
{
    TEST_ASSERT_EQUAL_STRING ("dir/a", zxfer::join_path ("dir", "a").c_str ());
    TEST_ASSERT_EQUAL_STRING ("dir/a", zxfer::join_path ("dir/", "a").c_str ());
    TEST_ASSERT_EQUAL_STRING ("/a", zxfer::join_path ("/", "a").c_str ());
    TEST_ASSERT_EQUAL_STRING ("a", zxfer::join_path ("", "a").c_str ());
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_plain_names_pass);
    RUN_TEST (test_directories_are_stripped);
    RUN_TEST (test_unusable_names_are_rejected);
    RUN_TEST (test_base_name);
    RUN_TEST (test_join_path);
    return UNITY_END ();
}
