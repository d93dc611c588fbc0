/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"
#include "transfer_args.hpp"

#include <unity.h>
#include <string>
#include <vector>

void setUp ()
{
}

void tearDown ()
{
}

//  Builds a mutable argv from string literals.
class argv_t
{
  public:
    argv_t (const char *const *args_, int argc_)
    {
        for (int i = 0; i < argc_; i++)
            _storage.push_back (std::string (args_[i]));
        for (size_t i = 0; i < _storage.size (); i++)
            _argv.push_back (&_storage[i][0]);
        _argv.push_back (NULL);
    }

    int argc () const { return static_cast<int> (_storage.size ()); }
    char **argv () { return &_argv[0]; }

  private:
    std::vector<std::string> _storage;
    std::vector<char *> _argv;
};

#define ARGV(...)                                                              \
    static const char *const args_list[] = {__VA_ARGS__};                      \
    argv_t args (args_list, sizeof (args_list) / sizeof (args_list[0]))

void test_send_files_may_start_with_dash ()
{
    ARGV ("--rhost", "localhost", "7070", "-f", "a.txt", "-data.bin",
          "--timeout");
    transfer::send_args_t parsed;
    TEST_ASSERT_TRUE (
      transfer::parse_send_args (args.argc (), args.argv (), parsed));

    TEST_ASSERT_EQUAL_STRING ("localhost", parsed.host.c_str ());
    TEST_ASSERT_EQUAL_STRING ("7070", parsed.port.c_str ());
    TEST_ASSERT_EQUAL_INT (-1, parsed.timeout);
    TEST_ASSERT_EQUAL_INT (3, parsed.files.size ());
    TEST_ASSERT_EQUAL_STRING ("a.txt", parsed.files[0].c_str ());
    TEST_ASSERT_EQUAL_STRING ("-data.bin", parsed.files[1].c_str ());
    TEST_ASSERT_EQUAL_STRING ("--timeout", parsed.files[2].c_str ());
}

void test_send_double_dash_after_f ()
{
    ARGV ("--timeout", "2", "--rhost", "::1", "9000", "-f", "--", "-x", "--");
    transfer::send_args_t parsed;
    TEST_ASSERT_TRUE (
      transfer::parse_send_args (args.argc (), args.argv (), parsed));

    TEST_ASSERT_EQUAL_INT (2000, parsed.timeout);
    TEST_ASSERT_EQUAL_INT (2, parsed.files.size ());
    TEST_ASSERT_EQUAL_STRING ("-x", parsed.files[0].c_str ());
    TEST_ASSERT_EQUAL_STRING ("--", parsed.files[1].c_str ());
    TEST_ASSERT_EQUAL_STRING (
      "[::1]:9000",
      transfer::make_address (parsed.host, parsed.port).c_str ());
}

void test_send_requires_host_and_files ()
{
    {
        ARGV ("-f", "a.txt");
        transfer::send_args_t parsed;
        TEST_ASSERT_FALSE (
          transfer::parse_send_args (args.argc (), args.argv (), parsed));
    }
    {
        ARGV ("--rhost", "localhost", "7070", "-f", "--");
        transfer::send_args_t parsed;
        TEST_ASSERT_FALSE (
          transfer::parse_send_args (args.argc (), args.argv (), parsed));
    }
    {
        ARGV ("--rhost", "localhost", "-f", "a.txt");
        transfer::send_args_t parsed;
        TEST_ASSERT_FALSE (
          transfer::parse_send_args (args.argc (), args.argv (), parsed));
    }
}

void test_recv_options ()
{
    ARGV ("--bind", "127.0.0.1", "--port", "0", "--dir", "/tmp/in",
          "--timeout", "0.0001", "--no-overwrite");
    transfer::recv_args_t parsed;
    TEST_ASSERT_TRUE (
      transfer::parse_recv_args (args.argc (), args.argv (), parsed));

    TEST_ASSERT_EQUAL_STRING ("127.0.0.1", parsed.host.c_str ());
    TEST_ASSERT_EQUAL_STRING ("0", parsed.port.c_str ());
    TEST_ASSERT_EQUAL_STRING ("/tmp/in", parsed.dir.c_str ());
    TEST_ASSERT_EQUAL_INT (1, parsed.timeout);
    TEST_ASSERT_EQUAL_INT (0, parsed.overwrite);
}

void test_recv_defaults_and_errors ()
{
    transfer::recv_args_t defaults;
    TEST_ASSERT_TRUE (transfer::parse_recv_args (0, NULL, defaults));
    TEST_ASSERT_EQUAL_STRING ("0.0.0.0:7070",
                              transfer::make_address (defaults.host,
                                                      defaults.port)
                                .c_str ());
    TEST_ASSERT_EQUAL_STRING (".", defaults.dir.c_str ());
    TEST_ASSERT_EQUAL_INT (-1, defaults.timeout);
    TEST_ASSERT_EQUAL_INT (1, defaults.overwrite);

    {
        ARGV ("--timeout", "soon");
        transfer::recv_args_t parsed;
        TEST_ASSERT_FALSE (
          transfer::parse_recv_args (args.argc (), args.argv (), parsed));
    }
    {
        ARGV ("--port");
        transfer::recv_args_t parsed;
        TEST_ASSERT_FALSE (
          transfer::parse_recv_args (args.argc (), args.argv (), parsed));
    }
}

void test_parse_timeout ()
{
    int ms = 7;
    TEST_ASSERT_TRUE (transfer::parse_timeout ("0", ms));
    TEST_ASSERT_EQUAL_INT (-1, ms);
    TEST_ASSERT_TRUE (transfer::parse_timeout ("1.5", ms));
    TEST_ASSERT_EQUAL_INT (1500, ms);
    TEST_ASSERT_FALSE (transfer::parse_timeout ("-1", ms));
    TEST_ASSERT_FALSE (transfer::parse_timeout ("", ms));
    TEST_ASSERT_FALSE (transfer::parse_timeout ("3s", ms));
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_send_files_may_start_with_dash);
    RUN_TEST (test_send_double_dash_after_f);
    RUN_TEST (test_send_requires_host_and_files);
    RUN_TEST (test_recv_options);
    RUN_TEST (test_recv_defaults_and_errors);
    RUN_TEST (test_parse_timeout);
    return UNITY_END ();
}
