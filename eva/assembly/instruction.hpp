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

#pragma once

#include <eva/core/byte_string.hpp>
#include <eva/evm/opcodes.hpp>

#include <intx/intx.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace eva::assembly
{
    /**
     * A single decoded EVM instruction: the descriptor of its opcode, the
     * byte offset it starts at, and the immediate bytes that follow it.
     *
     * The descriptor is a reference into one of the process-wide opcode
     * tables, so copying an instruction never copies table data.
     */
    class Instruction
    {
    public:
        /**
         * An instruction whose size is derived from its payload. This is the
         * only constructor the decoder uses.
         */
        Instruction(
            std::size_t offset, evm::OpCodeInfo const &info,
            byte_string immediate);

        /**
         * An instruction with an explicitly declared size. Only external IR
         * construction uses this; a declared size that disagrees with the
         * payload is caught when the module is reassembled.
         */
        Instruction(
            std::size_t offset, evm::OpCodeInfo const &info,
            byte_string immediate, std::size_t declared_size);

        evm::OpCodeInfo const &info() const noexcept;
        std::uint8_t opcode() const noexcept;
        std::string_view name() const noexcept;
        evm::OpCodeCategory category() const noexcept;

        std::size_t offset() const noexcept;
        std::size_t size() const noexcept;
        byte_string const &immediate() const noexcept;

        /**
         * Returns `true` if the declared size matches the opcode byte plus
         * the payload actually held.
         */
        bool is_size_consistent() const noexcept;

        /**
         * Returns `true` if fewer immediate bytes were available than the
         * opcode calls for (a PUSHN at the end of the code).
         */
        bool is_truncated() const noexcept;

        bool is_valid() const noexcept;
        bool is_push() const noexcept;
        bool is_dup() const noexcept;
        bool is_swap() const noexcept;
        bool is_log() const noexcept;
        bool is_jumpdest() const noexcept;
        bool is_terminator() const noexcept;
        bool is_control_flow() const noexcept;

        /**
         * N for PUSHN, DUPN, SWAPN and LOGN.
         */
        std::uint8_t index() const noexcept;

        /**
         * The word a PUSHN places on the stack. A truncated payload reads as
         * if the missing trailing bytes were zero.
         */
        intx::uint256 push_value() const noexcept;

        friend bool
        operator==(Instruction const &, Instruction const &) noexcept;

    private:
        evm::OpCodeInfo const *info_;
        std::size_t offset_;
        std::size_t size_;
        byte_string immediate_;
    };
}
