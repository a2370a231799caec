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

#include <eva/core/log.hpp>
#include <eva/core/test_util/gtest_logging_environment.hpp> // NOLINT

#include <quill/Quill.h>

TEST(LogTest, start_logging_is_idempotent)
{
    eva::start_logging(quill::LogLevel::Info);
    EXPECT_EQ(quill::get_root_logger()->log_level(), quill::LogLevel::Info);

    eva::start_logging(quill::LogLevel::Debug);
    EXPECT_EQ(quill::get_root_logger()->log_level(), quill::LogLevel::Debug);

    LOG_DEBUG("logging started at level {}", "debug");
    quill::flush();
}
