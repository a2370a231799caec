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

#include <eva/assembly/decode.hpp>
#include <eva/assembly/instruction.hpp>
#include <eva/core/byte_string.hpp>
#include <eva/core/hex_literal.hpp>
#include <eva/core/test_util/gtest_logging_environment.hpp> // NOLINT
#include <eva/evm/opcodes.hpp>

#include <evmc/evmc.h>
#include <intx/intx.hpp>

#include <gtest/gtest.h>

using namespace eva;
using namespace eva::assembly;
using namespace eva::literals;
using namespace intx;

TEST(Decode, reads_immediate)
{
    auto const code = 0x00610102ff_hex;

    auto const stop = decode(code, 0);
    EXPECT_EQ(stop.name(), "STOP");
    EXPECT_EQ(stop.size(), 1);
    EXPECT_TRUE(stop.immediate().empty());
    EXPECT_TRUE(stop.is_terminator());

    auto const push = decode(code, 1);
    EXPECT_EQ(push.offset(), 1);
    EXPECT_EQ(push.name(), "PUSH2");
    EXPECT_EQ(push.immediate(), 0x0102_hex);
    EXPECT_EQ(push.size(), 3);
    EXPECT_FALSE(push.is_truncated());
    EXPECT_EQ(push.index(), 2);
    EXPECT_EQ(&push.info(), &evm::describe(evm::PUSH2));

    // Decoding may start inside an immediate
    auto const inner = decode(code, 2);
    EXPECT_EQ(inner.opcode(), 0x01);
    EXPECT_EQ(inner.name(), "ADD");
}

TEST(Decode, truncated_push)
{
    auto const code = 0x6a01_hex;

    auto const push = decode(code, 0);
    EXPECT_EQ(push.name(), "PUSH11");
    EXPECT_EQ(push.size(), 2);
    EXPECT_TRUE(push.is_truncated());
    EXPECT_TRUE(push.is_size_consistent());

    auto const empty = decode(0x60_hex, 0);
    EXPECT_EQ(empty.size(), 1);
    EXPECT_TRUE(empty.immediate().empty());
    EXPECT_TRUE(empty.is_truncated());
}

TEST(Decode, runtime_revision)
{
    auto const code = 0x1e_hex;

    EXPECT_FALSE(decode(code, 0, EVMC_PRAGUE).is_valid());
    EXPECT_EQ(decode(code, 0, EVMC_PRAGUE).name(), "UNKNOWN");
    EXPECT_TRUE(decode(code, 0, EVMC_OSAKA).is_valid());
    EXPECT_EQ(decode(code, 0, EVMC_OSAKA).name(), "CLZ");
    EXPECT_EQ(decode<EVMC_OSAKA>(code, 0), decode(code, 0, EVMC_OSAKA));
}

TEST(DecodeDeathTest, offset_out_of_range)
{
    testing::FLAGS_gtest_death_test_style = "threadsafe";
    auto const code = 0x00_hex;
    EXPECT_DEATH(decode(code, 1), "offset < code.size");
}

TEST(Instruction, push_value)
{
    auto const code = 0x61ffee7f0102_hex;

    EXPECT_EQ(decode(code, 0).push_value(), 0xffee_u256);

    // Missing trailing bytes read as zero
    auto const truncated = decode(code, 3);
    EXPECT_EQ(truncated.immediate(), 0x0102_hex);
    EXPECT_EQ(truncated.push_value(), uint256{0x0102} << 240);

    EXPECT_EQ(decode<EVMC_SHANGHAI>(0x5f_hex, 0).push_value(), 0);
}

TEST(Instruction, predicates)
{
    auto const code = 0x80905b56a2fe_hex;

    auto const dup = decode(code, 0);
    EXPECT_TRUE(dup.is_dup());
    EXPECT_EQ(dup.index(), 1);

    auto const swap = decode(code, 1);
    EXPECT_TRUE(swap.is_swap());
    EXPECT_EQ(swap.index(), 1);

    auto const jumpdest = decode(code, 2);
    EXPECT_TRUE(jumpdest.is_jumpdest());
    EXPECT_TRUE(jumpdest.is_control_flow());
    EXPECT_EQ(jumpdest.category(), evm::OpCodeCategory::JumpDest);

    auto const jump = decode(code, 3);
    EXPECT_TRUE(jump.is_control_flow());
    EXPECT_FALSE(jump.is_terminator());

    auto const log = decode(code, 4);
    EXPECT_TRUE(log.is_log());
    EXPECT_EQ(log.index(), 2);

    auto const invalid = decode(code, 5);
    EXPECT_EQ(invalid.name(), "INVALID");
    EXPECT_FALSE(invalid.is_valid());
    EXPECT_TRUE(invalid.is_terminator());
}

TEST(Instruction, terminators_follow_revision)
{
    // REVERT only exists from Byzantium
    EXPECT_FALSE(decode<EVMC_HOMESTEAD>(0xfd_hex, 0).is_terminator());
    EXPECT_TRUE(decode<EVMC_BYZANTIUM>(0xfd_hex, 0).is_terminator());
}

TEST(Instruction, declared_size)
{
    auto const &info = evm::describe(evm::PUSH2);

    Instruction const consistent{4, info, 0x0102_hex, 3};
    EXPECT_TRUE(consistent.is_size_consistent());
    EXPECT_EQ(consistent.offset(), 4);

    Instruction const inconsistent{4, info, 0x0102_hex, 5};
    EXPECT_FALSE(inconsistent.is_size_consistent());
    EXPECT_EQ(inconsistent.size(), 5);
    EXPECT_NE(consistent, inconsistent);
}
