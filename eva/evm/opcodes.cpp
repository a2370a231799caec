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

#include <eva/evm/opcodes.hpp>
#include <eva/evm/switch_revision.hpp>

#include <evmc/evmc.h>

#include <cstdint>
#include <string_view>

namespace eva::evm
{
    OpCodeInfo const &
    describe(std::uint8_t const opcode, evmc_revision const rev) noexcept
    {
        EVA_SWITCH_EVM_REVISION(describe, opcode);
    }

    std::string_view category_name(OpCodeCategory const category) noexcept
    {
        switch (category) {
        case OpCodeCategory::Invalid:
            return "invalid";
        case OpCodeCategory::Arithmetic:
            return "arithmetic";
        case OpCodeCategory::Comparison:
            return "comparison";
        case OpCodeCategory::Bitwise:
            return "bitwise";
        case OpCodeCategory::Keccak:
            return "keccak";
        case OpCodeCategory::Environment:
            return "environment";
        case OpCodeCategory::Block:
            return "block";
        case OpCodeCategory::Stack:
            return "stack";
        case OpCodeCategory::Memory:
            return "memory";
        case OpCodeCategory::Storage:
            return "storage";
        case OpCodeCategory::ControlFlow:
            return "control-flow";
        case OpCodeCategory::JumpDest:
            return "jumpdest";
        case OpCodeCategory::Logging:
            return "logging";
        case OpCodeCategory::System:
            return "system";
        }
        return "invalid";
    }
}
