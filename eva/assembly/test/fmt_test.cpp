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

#include <eva/assembly/disassembler.hpp>
#include <eva/assembly/fmt/assembly_module_fmt.hpp>
#include <eva/assembly/fmt/instruction_fmt.hpp>
#include <eva/core/hex_literal.hpp>
#include <eva/core/test_util/gtest_logging_environment.hpp> // NOLINT

#include <evmc/evmc.h>

#include <gtest/gtest.h>

#include <quill/Quill.h>

using namespace eva;
using namespace eva::assembly;
using namespace eva::literals;

TEST(Formatter, instruction)
{
    auto const m = disassemble<EVMC_CANCUN>(0x600100_hex);

    EXPECT_EQ(fmt::format("{}", m[0]), "0x0000: PUSH1 0x01");
    EXPECT_EQ(fmt::format("{}", m[1]), "0x0002: STOP");
}

TEST(Formatter, truncated_and_unknown)
{
    auto const m = disassemble<EVMC_CANCUN>(0x0c7f0102_hex);

    EXPECT_EQ(fmt::format("{}", m[0]), "0x0000: UNKNOWN");
    EXPECT_EQ(fmt::format("{}", m[1]), "0x0001: PUSH32 0x0102");
}

TEST(Formatter, module)
{
    auto const m = disassemble<EVMC_CANCUN>(0x5b61abcd56_hex);

    EXPECT_EQ(
        fmt::format("{}", m),
        "0x0000: JUMPDEST\n"
        "0x0001: PUSH2 0xabcd\n"
        "0x0004: JUMP");
    EXPECT_EQ(fmt::format("{}", disassemble(byte_string_view{})), "");
}

TEST(Formatter, log_instruction)
{
    auto const m = disassemble<EVMC_CANCUN>(0x6001_hex);
    auto const copy = m[0];

    // Logged instructions are copied to the backend and formatted there
    static_assert(quill::copy_loggable<eva::assembly::Instruction>::value);
    EXPECT_EQ(copy, m[0]);
    EXPECT_EQ(fmt::format("{}", copy), "0x0000: PUSH1 0x01");

    LOG_INFO("decoded {}", copy);
    quill::flush();
}
