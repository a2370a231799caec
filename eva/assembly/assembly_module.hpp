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

#include <eva/assembly/instruction.hpp>
#include <eva/core/byte_string.hpp>
#include <eva/core/result.hpp>

#include <evmc/evmc.h>

#include <cstddef>
#include <limits>
#include <optional>
#include <vector>

namespace eva::assembly
{
    /**
     * The instruction-level representation of a contract's code: its
     * instructions in program order, an index from instruction-start offset
     * to position, and the set of offsets holding a JUMPDEST instruction.
     *
     * A module produced by `disassemble` is contiguous and reassembles to
     * the code it was decoded from. Modules assembled by hand through
     * `append` are checked when converted back to bytes.
     */
    class AssemblyModule
    {
    public:
        using const_iterator = std::vector<Instruction>::const_iterator;

        explicit AssemblyModule(
            evmc_revision rev = EVMC_LATEST_STABLE_REVISION);

        void reserve(std::size_t code_size);

        /**
         * Append an instruction at the end of the program. Its offset is
         * taken as given; no contiguity check happens until `to_bytes`.
         */
        void append(Instruction instr);

        /**
         * The instruction starting exactly at `offset`, or `nullptr` if no
         * instruction starts there (an offset inside an immediate, or past
         * the end of the code).
         */
        Instruction const *instruction_at(std::size_t offset) const noexcept;

        std::optional<std::size_t> index_of(std::size_t offset) const noexcept;

        bool is_valid_jump_dest(std::size_t offset) const noexcept;

        /**
         * Offsets of JUMPDEST instructions, in ascending order.
         */
        std::vector<std::size_t> jump_destinations() const;

        std::vector<Instruction> const &instructions() const noexcept
        {
            return instructions_;
        }

        const_iterator begin() const noexcept
        {
            return instructions_.begin();
        }

        const_iterator end() const noexcept
        {
            return instructions_.end();
        }

        std::size_t size() const noexcept
        {
            return instructions_.size();
        }

        bool empty() const noexcept
        {
            return instructions_.empty();
        }

        Instruction const &operator[](std::size_t i) const noexcept
        {
            return instructions_[i];
        }

        /// Sum of the declared sizes of all instructions.
        std::size_t code_size() const noexcept
        {
            return code_size_;
        }

        evmc_revision revision() const noexcept
        {
            return rev_;
        }

        /**
         * Reassemble the module into bytecode: every opcode byte followed by
         * its immediate payload, in program order.
         *
         * Fails with `AssemblyError::SizeMismatch` if an instruction's size
         * disagrees with its payload, with `AssemblyError::ImmediateMismatch`
         * if a payload is longer than its opcode's immediate or a truncated
         * PUSH is not the last instruction, and with
         * `AssemblyError::OffsetMismatch` if an instruction does not start
         * where its predecessor ends.
         */
        Result<byte_string> to_bytes() const;

    private:
        static constexpr std::size_t no_instruction =
            std::numeric_limits<std::size_t>::max();

        evmc_revision rev_;
        std::size_t code_size_;
        std::vector<Instruction> instructions_;
        std::vector<std::size_t> offset_index_;
        std::vector<bool> jumpdests_;
    };
}
