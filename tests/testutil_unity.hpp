/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TESTUTIL_UNITY_HPP_INCLUDED__
#define __TESTUTIL_UNITY_HPP_INCLUDED__

#include "../include/zxfer.h"

#include <unity.h>

//  Internal helper functions that are not intended to be directly called from
//  tests. They must be declared in the header since they are used by macros.

int test_assert_success_message_errno_helper (int rc_,
                                              const char *msg_,
                                              const char *expr_,
                                              int line_);

//  Asserts that the call returned a non-negative value (success or a count).
//  The message includes the expression and zxfer_strerror of errno on
//  failure.
#define TEST_ASSERT_SUCCESS_MESSAGE_ERRNO(expr, msg)                           \
    test_assert_success_message_errno_helper (expr, msg, #expr, __LINE__)

#define TEST_ASSERT_SUCCESS_ERRNO(expr)                                        \
    test_assert_success_message_errno_helper (expr, NULL, #expr, __LINE__)

//  Asserts that the call failed with -1 and errno set to error_code.
#define TEST_ASSERT_FAILURE_ERRNO(error_code, expr)                            \
    {                                                                          \
        int _rc = (expr);                                                      \
        TEST_ASSERT_EQUAL_INT (-1, _rc);                                       \
        TEST_ASSERT_EQUAL_INT (error_code, errno);                             \
    }

//  Removes the scratch directories after every test.
#define SETUP_TEARDOWN_TESTDIRS                                                \
    void setUp ()                                                              \
    {                                                                          \
    }                                                                          \
    void tearDown ()                                                           \
    {                                                                          \
        remove_test_dirs ();                                                   \
    }

#endif
