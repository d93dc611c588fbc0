/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil_unity.hpp"

#include <errno.h>
#include <stdio.h>

int test_assert_success_message_errno_helper (int rc_,
                                              const char *msg_,
                                              const char *expr_,
                                              int line_)
{
    if (rc_ == -1) {
        char buffer[512];
        buffer[sizeof (buffer) - 1] =
          0; // to ensure defined behavior with VC++ <= 2013
        snprintf (buffer, sizeof (buffer) - 1,
                  "%s failed%s%s%s, errno = %i (%s)", expr_,
                  msg_ ? " (additional info: " : "", msg_ ? msg_ : "",
                  msg_ ? ")" : "", zxfer_errno (),
                  zxfer_strerror (zxfer_errno ()));
        UNITY_TEST_FAIL (line_, buffer);
    }
    return rc_;
}
