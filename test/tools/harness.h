#ifndef BIRCH_TEST_TOOLS_HARNESS_H
#define BIRCH_TEST_TOOLS_HARNESS_H

#include <gtest/gtest.h>
#include "birch/status.h"

namespace Birch {

#define ASSERT_OK(s) ASSERT_PRED_FORMAT1(check_status, s)
#define ASSERT_NOK(s) ASSERT_FALSE((s).is_ok())
#define EXPECT_OK(s) EXPECT_PRED_FORMAT1(check_status, s)
#define EXPECT_NOK(s) EXPECT_FALSE((s).is_ok())

auto check_status(const char *expr, const Status &s) -> testing::AssertionResult;

} // namespace Birch

#endif // BIRCH_TEST_TOOLS_HARNESS_H
