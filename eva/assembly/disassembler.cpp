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
#include <eva/assembly/decode.hpp>
#include <eva/assembly/disassembler.hpp>
#include <eva/core/byte_string.hpp>
#include <eva/core/result.hpp>
#include <eva/evm/explicit_revision.hpp>
#include <eva/evm/switch_revision.hpp>

#include <evmc/evmc.h>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <cstddef>
#include <utility>

namespace eva::assembly
{
    template <evmc_revision Rev>
    AssemblyModule disassemble(byte_string_view const code)
    {
        AssemblyModule program{Rev};
        program.reserve(code.size());

        std::size_t offset = 0;
        while (offset < code.size()) {
            auto instr = decode<Rev>(code, offset);
            offset += instr.size();
            program.append(std::move(instr));
        }

        LOG_DEBUG(
            "disassembled {} bytes into {} instructions, {} jumpdests",
            code.size(),
            program.size(),
            program.jump_destinations().size());

        return program;
    }

    EVA_EXPLICIT_EVM_REVISION(disassemble);

    AssemblyModule
    disassemble(byte_string_view const code, evmc_revision const rev)
    {
        EVA_SWITCH_EVM_REVISION(disassemble, code);
    }

    Result<void>
    check_round_trip(byte_string_view const code, evmc_revision const rev)
    {
        auto const program = disassemble(code, rev);
        BOOST_OUTCOME_TRY(auto const bytes, program.to_bytes());
        if (bytes != code) {
            LOG_WARNING(
                "round trip of {} bytes produced {} bytes",
                code.size(),
                bytes.size());
            return AssemblyError::RoundTripMismatch;
        }
        return outcome::success();
    }
}
