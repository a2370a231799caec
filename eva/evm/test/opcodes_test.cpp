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

#include <eva/core/test_util/gtest_logging_environment.hpp> // NOLINT
#include <eva/evm/opcodes.hpp>

#include <evmc/evmc.h>

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <string>

using namespace eva::evm;

namespace
{
    template <evmc_revision Rev>
    void check_table_shape()
    {
        for (std::size_t i = 0; i < 256; ++i) {
            auto const opcode = static_cast<std::uint8_t>(i);
            auto const &info = describe<Rev>(opcode);

            ASSERT_EQ(info.opcode, opcode);
            ASSERT_FALSE(info.name.empty());

            if (info.category == OpCodeCategory::Invalid) {
                ASSERT_EQ(info.num_args, 0);
                ASSERT_EQ(info.index, 0);
                ASSERT_EQ(info.name, i == INVALID ? "INVALID" : "UNKNOWN");
            }
            else if (is_push_opcode(opcode)) {
                ASSERT_EQ(info.num_args, opcode - PUSH0);
                ASSERT_EQ(info.index, opcode - PUSH0);
                ASSERT_EQ(info.name, "PUSH" + std::to_string(opcode - PUSH0));
            }
            else {
                ASSERT_EQ(info.num_args, 0);
            }
        }
    }

    template <evmc_revision Rev>
    std::size_t count_known()
    {
        std::size_t n = 0;
        for (std::size_t i = 0; i < 256; ++i) {
            if (!is_unknown_opcode_info(
                    describe<Rev>(static_cast<std::uint8_t>(i)))) {
                ++n;
            }
        }
        return n;
    }
}

TEST(OpCodeTable, entries_match_their_byte_value)
{
    check_table_shape<EVMC_FRONTIER>();
    check_table_shape<EVMC_HOMESTEAD>();
    check_table_shape<EVMC_TANGERINE_WHISTLE>();
    check_table_shape<EVMC_SPURIOUS_DRAGON>();
    check_table_shape<EVMC_BYZANTIUM>();
    check_table_shape<EVMC_CONSTANTINOPLE>();
    check_table_shape<EVMC_PETERSBURG>();
    check_table_shape<EVMC_ISTANBUL>();
    check_table_shape<EVMC_BERLIN>();
    check_table_shape<EVMC_LONDON>();
    check_table_shape<EVMC_PARIS>();
    check_table_shape<EVMC_SHANGHAI>();
    check_table_shape<EVMC_CANCUN>();
    check_table_shape<EVMC_PRAGUE>();
    check_table_shape<EVMC_OSAKA>();
}

TEST(OpCodeTable, revisions_only_add_opcodes)
{
    EXPECT_LT(count_known<EVMC_FRONTIER>(), count_known<EVMC_HOMESTEAD>());
    EXPECT_LT(count_known<EVMC_HOMESTEAD>(), count_known<EVMC_BYZANTIUM>());
    EXPECT_LT(
        count_known<EVMC_BYZANTIUM>(), count_known<EVMC_CONSTANTINOPLE>());
    EXPECT_LT(count_known<EVMC_CONSTANTINOPLE>(), count_known<EVMC_ISTANBUL>());
    EXPECT_LT(count_known<EVMC_ISTANBUL>(), count_known<EVMC_LONDON>());
    EXPECT_LT(count_known<EVMC_LONDON>(), count_known<EVMC_SHANGHAI>());
    EXPECT_LT(count_known<EVMC_SHANGHAI>(), count_known<EVMC_CANCUN>());
    EXPECT_EQ(count_known<EVMC_CANCUN>(), count_known<EVMC_PRAGUE>());
    EXPECT_EQ(count_known<EVMC_PRAGUE>() + 1, count_known<EVMC_OSAKA>());
}

TEST(OpCodeTable, push0)
{
    EXPECT_TRUE(is_unknown_opcode_info(describe<EVMC_PARIS>(PUSH0)));
    EXPECT_EQ(describe<EVMC_PARIS>(PUSH0).name, "UNKNOWN");

    auto const &info = describe<EVMC_SHANGHAI>(PUSH0);
    EXPECT_FALSE(is_unknown_opcode_info(info));
    EXPECT_EQ(info.name, "PUSH0");
    EXPECT_EQ(info.num_args, 0);
    EXPECT_EQ(info.category, OpCodeCategory::Stack);
}

TEST(OpCodeTable, prevrandao)
{
    EXPECT_EQ(describe<EVMC_LONDON>(0x44).name, "DIFFICULTY");
    EXPECT_EQ(describe<EVMC_PARIS>(0x44).name, "PREVRANDAO");
    EXPECT_EQ(describe<EVMC_CANCUN>(0x44).name, "PREVRANDAO");
    EXPECT_EQ(describe<EVMC_PARIS>(0x44).category, OpCodeCategory::Block);
}

TEST(OpCodeTable, clz)
{
    EXPECT_TRUE(is_unknown_opcode_info(describe<EVMC_PRAGUE>(CLZ)));

    auto const &info = describe<EVMC_OSAKA>(CLZ);
    EXPECT_EQ(info.name, "CLZ");
    EXPECT_EQ(info.category, OpCodeCategory::Bitwise);
    EXPECT_EQ(info.min_gas, 5);
}

TEST(OpCodeTable, cancun_opcodes)
{
    for (auto const op : {BLOBHASH, BLOBBASEFEE, TLOAD, TSTORE, MCOPY}) {
        EXPECT_TRUE(is_unknown_opcode_info(describe<EVMC_SHANGHAI>(op)));
        EXPECT_FALSE(is_unknown_opcode_info(describe<EVMC_CANCUN>(op)));
    }
}

TEST(OpCodeTable, static_gas_follows_revision)
{
    EXPECT_EQ(describe<EVMC_FRONTIER>(SLOAD).min_gas, 50);
    EXPECT_EQ(describe<EVMC_TANGERINE_WHISTLE>(SLOAD).min_gas, 200);
    EXPECT_EQ(describe<EVMC_ISTANBUL>(SLOAD).min_gas, 800);
    EXPECT_EQ(describe<EVMC_BERLIN>(SLOAD).min_gas, 100);

    EXPECT_EQ(describe<EVMC_CONSTANTINOPLE>(SSTORE).min_gas, 200);
    EXPECT_EQ(describe<EVMC_PETERSBURG>(SSTORE).min_gas, 5000);
}

TEST(OpCodeTable, categories)
{
    EXPECT_EQ(describe(ADD).category, OpCodeCategory::Arithmetic);
    EXPECT_EQ(describe(JUMP).category, OpCodeCategory::ControlFlow);
    EXPECT_EQ(describe(JUMPDEST).category, OpCodeCategory::JumpDest);
    EXPECT_EQ(describe(MSTORE).category, OpCodeCategory::Memory);
    EXPECT_EQ(describe(DUP1).category, OpCodeCategory::Stack);
    EXPECT_EQ(describe(LOG2).category, OpCodeCategory::Logging);
    EXPECT_EQ(describe(INVALID).category, OpCodeCategory::Invalid);
    EXPECT_EQ(describe(0x0C).category, OpCodeCategory::Invalid);

    EXPECT_EQ(category_name(OpCodeCategory::ControlFlow), "control-flow");
    EXPECT_EQ(category_name(OpCodeCategory::JumpDest), "jumpdest");
    EXPECT_EQ(category_name(OpCodeCategory::Invalid), "invalid");
}

TEST(OpCodeTable, runtime_revision)
{
    EXPECT_EQ(&describe(PUSH0, EVMC_PARIS), &describe<EVMC_PARIS>(PUSH0));
    EXPECT_EQ(&describe(CLZ, EVMC_OSAKA), &describe<EVMC_OSAKA>(CLZ));
    EXPECT_EQ(&describe(ADD, EVMC_FRONTIER), &describe<EVMC_FRONTIER>(ADD));

    // Revisions past the newest table use the newest table
    EXPECT_EQ(&describe(CLZ, EVMC_EXPERIMENTAL), &describe<EVMC_OSAKA>(CLZ));
}

TEST(OpCodeTable, family_predicates)
{
    EXPECT_TRUE(is_push_opcode(PUSH0));
    EXPECT_TRUE(is_push_opcode(PUSH32));
    EXPECT_FALSE(is_push_opcode(DUP1));

    EXPECT_TRUE(is_dup_opcode(DUP16));
    EXPECT_FALSE(is_dup_opcode(SWAP1));
    EXPECT_TRUE(is_swap_opcode(SWAP1));
    EXPECT_TRUE(is_log_opcode(LOG4));
    EXPECT_FALSE(is_log_opcode(0xA5));

    for (auto const op : {STOP, RETURN, REVERT, INVALID, SELFDESTRUCT}) {
        EXPECT_TRUE(is_terminator_opcode(op));
    }
    EXPECT_FALSE(is_terminator_opcode(JUMP));

    EXPECT_TRUE(is_control_flow_opcode(JUMP));
    EXPECT_TRUE(is_control_flow_opcode(JUMPI));
    EXPECT_TRUE(is_control_flow_opcode(JUMPDEST));
    EXPECT_FALSE(is_control_flow_opcode(STOP));

    EXPECT_EQ(get_push_opcode_index(PUSH20), 20);
    EXPECT_EQ(get_dup_opcode_index(DUP3), 3);
    EXPECT_EQ(get_swap_opcode_index(SWAP16), 16);
    EXPECT_EQ(get_log_opcode_index(LOG0), 0);
}
