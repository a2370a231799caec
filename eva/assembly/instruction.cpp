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

#include <eva/assembly/instruction.hpp>
#include <eva/core/assert.h>
#include <eva/core/byte_string.hpp>
#include <eva/evm/opcodes.hpp>

#include <intx/intx.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>

namespace eva::assembly
{
    Instruction::Instruction(
        std::size_t const offset, evm::OpCodeInfo const &info,
        byte_string immediate)
        : info_{&info}
        , offset_{offset}
        , size_{1 + immediate.size()}
        , immediate_{std::move(immediate)}
    {
        EVA_DEBUG_ASSERT(immediate_.size() <= info.num_args);
    }

    Instruction::Instruction(
        std::size_t const offset, evm::OpCodeInfo const &info,
        byte_string immediate, std::size_t const declared_size)
        : info_{&info}
        , offset_{offset}
        , size_{declared_size}
        , immediate_{std::move(immediate)}
    {
    }

    evm::OpCodeInfo const &Instruction::info() const noexcept
    {
        return *info_;
    }

    std::uint8_t Instruction::opcode() const noexcept
    {
        return info_->opcode;
    }

    std::string_view Instruction::name() const noexcept
    {
        return info_->name;
    }

    evm::OpCodeCategory Instruction::category() const noexcept
    {
        return info_->category;
    }

    std::size_t Instruction::offset() const noexcept
    {
        return offset_;
    }

    std::size_t Instruction::size() const noexcept
    {
        return size_;
    }

    byte_string const &Instruction::immediate() const noexcept
    {
        return immediate_;
    }

    bool Instruction::is_size_consistent() const noexcept
    {
        return size_ == 1 + immediate_.size();
    }

    bool Instruction::is_truncated() const noexcept
    {
        return immediate_.size() < info_->num_args;
    }

    bool Instruction::is_valid() const noexcept
    {
        return !evm::is_unknown_opcode_info(*info_);
    }

    bool Instruction::is_push() const noexcept
    {
        return is_valid() && evm::is_push_opcode(opcode());
    }

    bool Instruction::is_dup() const noexcept
    {
        return is_valid() && evm::is_dup_opcode(opcode());
    }

    bool Instruction::is_swap() const noexcept
    {
        return is_valid() && evm::is_swap_opcode(opcode());
    }

    bool Instruction::is_log() const noexcept
    {
        return is_valid() && evm::is_log_opcode(opcode());
    }

    bool Instruction::is_jumpdest() const noexcept
    {
        return opcode() == evm::JUMPDEST;
    }

    bool Instruction::is_terminator() const noexcept
    {
        // 0xFE is in the invalid category but still ends execution.
        return opcode() == evm::INVALID ||
               (is_valid() && evm::is_terminator_opcode(opcode()));
    }

    bool Instruction::is_control_flow() const noexcept
    {
        return is_valid() && evm::is_control_flow_opcode(opcode());
    }

    std::uint8_t Instruction::index() const noexcept
    {
        EVA_DEBUG_ASSERT(is_push() || is_dup() || is_swap() || is_log());
        return info_->index;
    }

    intx::uint256 Instruction::push_value() const noexcept
    {
        EVA_DEBUG_ASSERT(is_push());

        std::uint8_t word[32] = {};
        auto const n = info_->num_args;
        auto const available =
            std::min<std::size_t>(immediate_.size(), std::size_t{n});
        std::copy_n(immediate_.data(), available, &word[32 - n]);

        return intx::be::load<intx::uint256>(word);
    }

    bool operator==(Instruction const &a, Instruction const &b) noexcept
    {
        return a.info_ == b.info_ && a.offset_ == b.offset_ &&
               a.size_ == b.size_ && a.immediate_ == b.immediate_;
    }
}
