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
#include <eva/core/assert.h>
#include <eva/core/byte_string.hpp>
#include <eva/evm/opcodes.hpp>

#include <evmc/evmc.h>

#include <algorithm>
#include <cstddef>

namespace eva::assembly
{
    /**
     * Decode the single instruction starting at `offset`, which must lie
     * inside `code`.
     *
     * A PUSHN whose N immediate bytes run past the end of `code` takes only
     * the bytes that are there; the resulting instruction is shorter than
     * 1 + N. Every byte value decodes, unassigned ones as one-byte invalid
     * instructions.
     */
    template <evmc_revision Rev = EVMC_LATEST_STABLE_REVISION>
    Instruction decode(byte_string_view const code, std::size_t const offset)
    {
        EVA_ASSERT(offset < code.size());

        auto const &info = evm::describe<Rev>(code[offset]);
        auto const remaining = code.size() - offset - 1;
        auto const imm_size = std::min<std::size_t>(info.num_args, remaining);

        return Instruction{
            offset, info, byte_string{code.substr(offset + 1, imm_size)}};
    }

    Instruction
    decode(byte_string_view code, std::size_t offset, evmc_revision rev);
}
