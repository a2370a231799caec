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
#include <eva/assembly/instruction.hpp>
#include <eva/core/assert.h>
#include <eva/core/byte_string.hpp>
#include <eva/evm/opcodes.hpp>

#include <evmc/evmc.h>
#include <intx/intx.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <utility>

namespace eva::assembly
{
    /**
     * Programmatic construction of an assembly module. Each inserted
     * instruction starts where the previous one ends according to its
     * declared size, so modules built through `raw_sized` can hold
     * instructions that do not reassemble.
     */
    template <evmc_revision Rev = EVMC_LATEST_STABLE_REVISION>
    class AssemblyBuilder
    {
    public:
        AssemblyBuilder()
            : module_{Rev}
            , offset_{0}
        {
        }

        // Inserts an opcode with no immediate
        AssemblyBuilder &ins(evm::EvmOpCode const opcode)
        {
            return raw(opcode, {});
        }

        AssemblyBuilder &push0()
        {
            return ins(evm::PUSH0);
        }

        AssemblyBuilder &push(std::uint64_t const imm)
        {
            return push(byte_width(imm), intx::uint256{imm});
        }

        /**
         * Inserts `PUSHN imm` with N = `n_bytes`, keeping the low `n_bytes`
         * bytes of `imm`. A zero width becomes `PUSH0` from Shanghai and
         * `PUSH1 0x00` before it.
         */
        AssemblyBuilder &
        push(std::size_t const n_bytes, intx::uint256 const &imm)
        {
            EVA_ASSERT(n_bytes <= 32);

            if (n_bytes == 0) {
                if constexpr (Rev >= EVMC_SHANGHAI) {
                    return push0();
                }
                else {
                    return raw(evm::PUSH1, byte_string(1, 0));
                }
            }

            std::uint8_t word[32];
            intx::be::store(word, imm);

            auto const opcode =
                static_cast<std::uint8_t>(evm::PUSH1 + (n_bytes - 1));
            return raw(opcode, byte_string{&word[32 - n_bytes], n_bytes});
        }

        AssemblyBuilder &jumpdest()
        {
            return ins(evm::JUMPDEST);
        }

        AssemblyBuilder &dup(std::size_t const n)
        {
            EVA_ASSERT(n >= 1 && n <= 16);
            return raw(static_cast<std::uint8_t>(evm::DUP1 + (n - 1)), {});
        }

        AssemblyBuilder &swap(std::size_t const n)
        {
            EVA_ASSERT(n >= 1 && n <= 16);
            return raw(static_cast<std::uint8_t>(evm::SWAP1 + (n - 1)), {});
        }

        /**
         * Inserts `opcode` followed by exactly `payload`, whatever the
         * opcode's immediate length. A short payload gives a truncated
         * instruction, like a PUSH at the end of the code.
         */
        AssemblyBuilder &raw(std::uint8_t const opcode, byte_string payload)
        {
            auto const size = 1 + payload.size();
            return raw_sized(opcode, std::move(payload), size);
        }

        /**
         * Inserts `opcode` with `payload`, claiming it occupies
         * `declared_size` bytes.
         */
        AssemblyBuilder &raw_sized(
            std::uint8_t const opcode, byte_string payload,
            std::size_t const declared_size)
        {
            auto const &info = evm::describe<Rev>(opcode);
            module_.append(
                Instruction{offset_, info, std::move(payload), declared_size});
            advance(declared_size);
            return *this;
        }

        /**
         * Moves the next offset `n` bytes forward without emitting anything, leaving a
         * gap in front of the next instruction.
         */
        AssemblyBuilder &skip(std::size_t const n)
        {
            advance(n);
            return *this;
        }

        std::size_t offset() const noexcept
        {
            return offset_;
        }

        AssemblyModule build() const
        {
            return module_;
        }

    private:
        void advance(std::size_t const n) noexcept
        {
            EVA_ASSERT(n < std::numeric_limits<std::size_t>::max() - offset_);
            offset_ += n;
        }

        static std::size_t byte_width(std::uint64_t x) noexcept
        {
            std::size_t n = 0;
            while (x != 0) {
                ++n;
                x >>= 8;
            }
            return n;
        }

        AssemblyModule module_;
        std::size_t offset_;
    };
}
