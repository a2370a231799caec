// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <gtest/gtest.h>

#include <eva/core/assert.h>
#include <eva/core/test_util/gtest_logging_environment.hpp> // NOLINT

namespace
{
    int checked_div(int a, int b)
    {
        EVA_ASSERT(b != 0);
        return a / b;
    }

    int debug_checked_neg(int a)
    {
        EVA_DEBUG_ASSERT(a >= 0);
        return -a;
    }
}

TEST(AssertTest, passing_assertion)
{
    EXPECT_EQ(checked_div(6, 3), 2);
    EXPECT_EQ(debug_checked_neg(4), -4);
}

TEST(AssertDeathTest, failing_assertion_aborts)
{
    testing::FLAGS_gtest_death_test_style = "threadsafe";
    EXPECT_DEATH(checked_div(1, 0), "Assertion 'b != 0' failed");
}

TEST(AssertDeathTest, failing_debug_assertion_aborts)
{
    testing::FLAGS_gtest_death_test_style = "threadsafe";
    // Tests build with EVA_TESTING, which keeps debug assertions live
    EXPECT_DEATH(debug_checked_neg(-1), "Assertion 'a >= 0' failed");
}
