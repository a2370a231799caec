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

#include <eva/assembly/assembly_error.hpp>
#include <eva/assembly/assembly_module.hpp>
#include <eva/assembly/instruction.hpp>
#include <eva/core/assert.h>
#include <eva/core/byte_string.hpp>
#include <eva/core/result.hpp>

#include <evmc/evmc.h>

#include <quill/Quill.h>

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace eva::assembly
{
    AssemblyModule::AssemblyModule(evmc_revision const rev)
        : rev_{rev}
        , code_size_{0}
    {
    }

    void AssemblyModule::reserve(std::size_t const code_size)
    {
        // At most one instruction per byte.
        instructions_.reserve(code_size);
        offset_index_.reserve(code_size);
        jumpdests_.reserve(code_size);
    }

    void AssemblyModule::append(Instruction instr)
    {
        auto const offset = instr.offset();
        EVA_ASSERT(offset < no_instruction);

        if (offset >= offset_index_.size()) {
            offset_index_.resize(offset + 1, no_instruction);
            jumpdests_.resize(offset + 1, false);
        }

        offset_index_[offset] = instructions_.size();
        jumpdests_[offset] = instr.is_jumpdest();

        code_size_ += instr.size();
        instructions_.push_back(std::move(instr));
    }

    Instruction const *
    AssemblyModule::instruction_at(std::size_t const offset) const noexcept
    {
        auto const i = index_of(offset);
        if (!i) {
            return nullptr;
        }
        return &instructions_[*i];
    }

    std::optional<std::size_t>
    AssemblyModule::index_of(std::size_t const offset) const noexcept
    {
        if (offset >= offset_index_.size() ||
            offset_index_[offset] == no_instruction) {
            return std::nullopt;
        }
        return offset_index_[offset];
    }

    bool AssemblyModule::is_valid_jump_dest(std::size_t const offset) const noexcept
    {
        return offset < jumpdests_.size() && jumpdests_[offset];
    }

    std::vector<std::size_t> AssemblyModule::jump_destinations() const
    {
        std::vector<std::size_t> result;
        for (std::size_t i = 0; i < jumpdests_.size(); ++i) {
            if (jumpdests_[i]) {
                result.push_back(i);
            }
        }
        return result;
    }

    Result<byte_string> AssemblyModule::to_bytes() const
    {
        byte_string out;
        out.reserve(code_size_);

        for (auto const &instr : instructions_) {
            if (!instr.is_size_consistent()) {
                LOG_DEBUG(
                    "instruction {} at offset {} declares size {} but holds "
                    "{} immediate bytes",
                    instr.name(),
                    instr.offset(),
                    instr.size(),
                    instr.immediate().size());
                return AssemblyError::SizeMismatch;
            }
            // Only the last instruction may hold a short PUSH payload, and no
            // payload may be longer than the opcode's immediate.
            if (instr.immediate().size() > instr.info().num_args ||
                (instr.is_truncated() && &instr != &instructions_.back())) {
                LOG_DEBUG(
                    "instruction {} at offset {} holds {} immediate bytes, "
                    "expected {}",
                    instr.name(),
                    instr.offset(),
                    instr.immediate().size(),
                    instr.info().num_args);
                return AssemblyError::ImmediateMismatch;
            }
            if (instr.offset() != out.size()) {
                LOG_DEBUG(
                    "instruction {} at offset {}, expected offset {}",
                    instr.name(),
                    instr.offset(),
                    out.size());
                return AssemblyError::OffsetMismatch;
            }
            out.push_back(instr.opcode());
            out.append(instr.immediate());
        }

        return out;
    }
}
