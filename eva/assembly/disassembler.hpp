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

#include <eva/assembly/assembly_module.hpp>
#include <eva/core/byte_string.hpp>
#include <eva/core/result.hpp>

#include <evmc/evmc.h>

namespace eva::assembly
{
    /**
     * Decode `code` in a single pass from offset 0 into an assembly module,
     * recording every JUMPDEST instruction start on the way. Total over all
     * inputs: immediates are skipped, unassigned bytes become one-byte
     * invalid instructions and a truncated trailing PUSH keeps whatever
     * bytes remain.
     */
    template <evmc_revision Rev = EVMC_LATEST_STABLE_REVISION>
    AssemblyModule disassemble(byte_string_view code);

    AssemblyModule disassemble(byte_string_view code, evmc_revision rev);

    /**
     * Disassemble `code` and reassemble the result, failing with
     * `AssemblyError::RoundTripMismatch` if the bytes differ.
     */
    Result<void> check_round_trip(byte_string_view code, evmc_revision rev);
}
