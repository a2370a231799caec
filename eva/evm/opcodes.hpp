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

#include <eva/core/assert.h>

#include <evmc/evmc.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <tuple>
#include <utility>

namespace eva::evm
{
    /**
     * Coarse grouping of opcodes, following the sections of the Yellow
     * Paper instruction listing.
     */
    enum class OpCodeCategory : std::uint8_t
    {
        Invalid = 0,
        Arithmetic,
        Comparison,
        Bitwise,
        Keccak,
        Environment,
        Block,
        Stack,
        Memory,
        Storage,
        ControlFlow,
        JumpDest,
        Logging,
        System,
    };

    /**
     * Details of how an individual EVM opcode is encoded and how it affects
     * VM state when executed.
     */
    struct OpCodeInfo
    {
        /**
         * The human-readable (disassembled) form of the opcode.
         */
        std::string_view name;

        /**
         * The number of immediate bytes that follow this opcode in a binary
         * EVM program.
         *
         * This value is 0 for all instructions other than the `PUSHN` family,
         * each of which expects N bytes to follow.
         */
        std::uint8_t num_args;

        /**
         * The minimum EVM stack size required to execute this instruction.
         */
        std::uint8_t min_stack;

        /**
         * The EVM stack size increase after executing this instruction.
         */
        std::uint8_t stack_increase;

        /**
         * Whether the gas cost of this instruction is determined at runtime.
         */
        bool dynamic_gas;

        /**
         * Minimum static gas required to execute this instruction.
         */
        std::uint16_t min_gas;

        OpCodeCategory category;

        /**
         * N for all PUSHN, SWAPN, DUPN and LOGN instructions, and 0
         * otherwise. Filled in when the table is finalized.
         */
        std::uint8_t index;

        /**
         * The byte value this entry describes; always equal to the entry's
         * position in its table. Filled in when the table is finalized.
         */
        std::uint8_t opcode;
    };

    constexpr bool operator==(OpCodeInfo const &a, OpCodeInfo const &b)
    {
        return std::tie(
                   a.name,
                   a.num_args,
                   a.min_stack,
                   a.stack_increase,
                   a.dynamic_gas,
                   a.min_gas,
                   a.category) ==
               std::tie(
                   b.name,
                   b.num_args,
                   b.min_stack,
                   b.stack_increase,
                   b.dynamic_gas,
                   b.min_gas,
                   b.category);
    }

    /**
     * Mnemonic mapping of human-readable opcode names to their underlying
     * byte values.
     */
    enum EvmOpCode : std::uint8_t
    {
        STOP = 0x00,
        ADD = 0x01,
        MUL = 0x02,
        SUB = 0x03,
        DIV = 0x04,
        SDIV = 0x05,
        MOD = 0x06,
        SMOD = 0x07,
        ADDMOD = 0x08,
        MULMOD = 0x09,
        EXP = 0x0A,
        SIGNEXTEND = 0x0B,
        LT = 0x10,
        GT = 0x11,
        SLT = 0x12,
        SGT = 0x13,
        EQ = 0x14,
        ISZERO = 0x15,
        AND = 0x16,
        OR = 0x17,
        XOR = 0x18,
        NOT = 0x19,
        BYTE = 0x1A,
        SHL = 0x1B,
        SHR = 0x1C,
        SAR = 0x1D,
        CLZ = 0x1E,
        SHA3 = 0x20,
        ADDRESS = 0x30,
        BALANCE = 0x31,
        ORIGIN = 0x32,
        CALLER = 0x33,
        CALLVALUE = 0x34,
        CALLDATALOAD = 0x35,
        CALLDATASIZE = 0x36,
        CALLDATACOPY = 0x37,
        CODESIZE = 0x38,
        CODECOPY = 0x39,
        GASPRICE = 0x3A,
        EXTCODESIZE = 0x3B,
        EXTCODECOPY = 0x3C,
        RETURNDATASIZE = 0x3D,
        RETURNDATACOPY = 0x3E,
        EXTCODEHASH = 0x3F,
        BLOCKHASH = 0x40,
        COINBASE = 0x41,
        TIMESTAMP = 0x42,
        NUMBER = 0x43,
        DIFFICULTY = 0x44,
        PREVRANDAO = 0x44,
        GASLIMIT = 0x45,
        CHAINID = 0x46,
        SELFBALANCE = 0x47,
        BASEFEE = 0x48,
        BLOBHASH = 0x49,
        BLOBBASEFEE = 0x4A,
        POP = 0x50,
        MLOAD = 0x51,
        MSTORE = 0x52,
        MSTORE8 = 0x53,
        SLOAD = 0x54,
        SSTORE = 0x55,
        JUMP = 0x56,
        JUMPI = 0x57,
        PC = 0x58,
        MSIZE = 0x59,
        GAS = 0x5A,
        JUMPDEST = 0x5B,
        TLOAD = 0x5C,
        TSTORE = 0x5D,
        MCOPY = 0x5E,
        PUSH0 = 0x5F,
        PUSH1 = 0x60,
        PUSH2 = 0x61,
        PUSH3 = 0x62,
        PUSH4 = 0x63,
        PUSH5 = 0x64,
        PUSH6 = 0x65,
        PUSH7 = 0x66,
        PUSH8 = 0x67,
        PUSH9 = 0x68,
        PUSH10 = 0x69,
        PUSH11 = 0x6A,
        PUSH12 = 0x6B,
        PUSH13 = 0x6C,
        PUSH14 = 0x6D,
        PUSH15 = 0x6E,
        PUSH16 = 0x6F,
        PUSH17 = 0x70,
        PUSH18 = 0x71,
        PUSH19 = 0x72,
        PUSH20 = 0x73,
        PUSH21 = 0x74,
        PUSH22 = 0x75,
        PUSH23 = 0x76,
        PUSH24 = 0x77,
        PUSH25 = 0x78,
        PUSH26 = 0x79,
        PUSH27 = 0x7A,
        PUSH28 = 0x7B,
        PUSH29 = 0x7C,
        PUSH30 = 0x7D,
        PUSH31 = 0x7E,
        PUSH32 = 0x7F,
        DUP1 = 0x80,
        DUP2 = 0x81,
        DUP3 = 0x82,
        DUP4 = 0x83,
        DUP5 = 0x84,
        DUP6 = 0x85,
        DUP7 = 0x86,
        DUP8 = 0x87,
        DUP9 = 0x88,
        DUP10 = 0x89,
        DUP11 = 0x8A,
        DUP12 = 0x8B,
        DUP13 = 0x8C,
        DUP14 = 0x8D,
        DUP15 = 0x8E,
        DUP16 = 0x8F,
        SWAP1 = 0x90,
        SWAP2 = 0x91,
        SWAP3 = 0x92,
        SWAP4 = 0x93,
        SWAP5 = 0x94,
        SWAP6 = 0x95,
        SWAP7 = 0x96,
        SWAP8 = 0x97,
        SWAP9 = 0x98,
        SWAP10 = 0x99,
        SWAP11 = 0x9A,
        SWAP12 = 0x9B,
        SWAP13 = 0x9C,
        SWAP14 = 0x9D,
        SWAP15 = 0x9E,
        SWAP16 = 0x9F,
        LOG0 = 0xA0,
        LOG1 = 0xA1,
        LOG2 = 0xA2,
        LOG3 = 0xA3,
        LOG4 = 0xA4,
        CREATE = 0xF0,
        CALL = 0xF1,
        CALLCODE = 0xF2,
        RETURN = 0xF3,
        DELEGATECALL = 0xF4,
        CREATE2 = 0xF5,
        STATICCALL = 0xFA,
        REVERT = 0xFD,
        INVALID = 0xFE,
        SELFDESTRUCT = 0xFF
    };

    /**
     * Returns `true` if `opcode` belongs to the `PUSHN` family of EVM
     * opcodes (including `PUSH0`).
     */
    constexpr bool is_push_opcode(std::uint8_t const opcode)
    {
        return opcode >= PUSH0 && opcode <= PUSH32;
    }

    /**
     * Returns `true` if `opcode` belongs to the `SWAPN` family of EVM
     * opcodes.
     */
    constexpr bool is_swap_opcode(std::uint8_t const opcode)
    {
        return opcode >= SWAP1 && opcode <= SWAP16;
    }

    /**
     * Returns `true` if `opcode` belongs to the `DUPN` family of EVM opcodes.
     */
    constexpr bool is_dup_opcode(std::uint8_t const opcode)
    {
        return opcode >= DUP1 && opcode <= DUP16;
    }

    /**
     * Returns `true` if `opcode` belongs to the `LOGN` family of EVM opcodes.
     */
    constexpr bool is_log_opcode(std::uint8_t const opcode)
    {
        return opcode >= LOG0 && opcode <= LOG4;
    }

    /**
     * Returns `true` if executing `opcode` always ends the current call
     * frame.
     */
    constexpr bool is_terminator_opcode(std::uint8_t const opcode)
    {
        return opcode == STOP || opcode == RETURN || opcode == REVERT ||
               opcode == INVALID || opcode == SELFDESTRUCT;
    }

    /**
     * Returns `true` for `JUMP`, `JUMPI` and `JUMPDEST`.
     */
    constexpr bool is_control_flow_opcode(std::uint8_t const opcode)
    {
        return opcode == JUMP || opcode == JUMPI || opcode == JUMPDEST;
    }

    /**
     * Opcode must be the opcode of some DUPN instruction.
     * Returns `N`.
     */
    constexpr std::uint8_t get_dup_opcode_index(std::uint8_t const opcode)
    {
        EVA_DEBUG_ASSERT(is_dup_opcode(opcode));
        return static_cast<std::uint8_t>(opcode - DUP1 + 1);
    }

    /**
     * Opcode must be the opcode of some SWAPN instruction.
     * Returns `N`.
     */
    constexpr std::uint8_t get_swap_opcode_index(std::uint8_t const opcode)
    {
        EVA_DEBUG_ASSERT(is_swap_opcode(opcode));
        return static_cast<std::uint8_t>(opcode - SWAP1 + 1);
    }

    /**
     * Opcode must be the opcode of some PUSHN instruction.
     * Returns `N`.
     */
    constexpr std::uint8_t get_push_opcode_index(std::uint8_t const opcode)
    {
        EVA_DEBUG_ASSERT(is_push_opcode(opcode));
        return static_cast<std::uint8_t>(opcode - PUSH0);
    }

    /**
     * Opcode must be the opcode of some LOGN instruction.
     * Returns `N`.
     */
    constexpr std::uint8_t get_log_opcode_index(std::uint8_t const opcode)
    {
        EVA_DEBUG_ASSERT(is_log_opcode(opcode));
        return static_cast<std::uint8_t>(opcode - LOG0);
    }

    /**
     * Returns `N` for DUPN, SWAPN, PUSHN and LOGN, and 0 for anything else.
     */
    constexpr std::uint8_t get_opcode_index(std::uint8_t const opcode)
    {
        if (is_dup_opcode(opcode)) {
            return get_dup_opcode_index(opcode);
        }

        if (is_swap_opcode(opcode)) {
            return get_swap_opcode_index(opcode);
        }

        if (is_push_opcode(opcode)) {
            return get_push_opcode_index(opcode);
        }

        if (is_log_opcode(opcode)) {
            return get_log_opcode_index(opcode);
        }

        return 0;
    }

    consteval evmc_revision previous_evm_revision(evmc_revision rev)
    {
        EVA_DEBUG_ASSERT(rev > EVMC_FRONTIER);
        return evmc_revision(std::to_underlying(rev) - 1);
    }

    using OpCodeTable = std::array<OpCodeInfo, 256>;

    /**
     * Placeholder for an opcode value the EVM does not assign
     * at a given revision. Decoding such a byte still produces a well-formed
     * one-byte instruction.
     */
    constexpr auto unknown_opcode_info = OpCodeInfo{
        "UNKNOWN", 0, 0, 0, false, 0, OpCodeCategory::Invalid, 0, 0};

    /**
     * The designated invalid instruction (EIP-141). Unlike the other
     * unassigned bytes it has a stable mnemonic.
     */
    constexpr auto designated_invalid_opcode_info = OpCodeInfo{
        "INVALID", 0, 0, 0, false, 0, OpCodeCategory::Invalid, 0, 0};

    /**
     * Lookup table of opcode info for each possible 1-byte opcode value,
     * before the per-entry `opcode` and `index` fields are filled in.
     *
     * Each revision is derived from the one before it.
     */
    template <evmc_revision Rev>
    consteval OpCodeTable make_opcode_table() = delete;

    consteval OpCodeTable finalize_opcode_table(OpCodeTable table)
    {
        for (std::size_t i = 0; i < table.size(); ++i) {
            auto const opcode = static_cast<std::uint8_t>(i);
            table[i].opcode = opcode;
            table[i].index = table[i].category == OpCodeCategory::Invalid
                                 ? std::uint8_t{0}
                                 : get_opcode_index(opcode);
        }
        return table;
    }

    template <evmc_revision Rev>
    constexpr OpCodeTable opcode_table =
        finalize_opcode_table(make_opcode_table<Rev>());

    consteval void
    add_opcode(std::uint8_t opcode, OpCodeTable &table, OpCodeInfo info)
    {
        EVA_DEBUG_ASSERT(table[opcode] == unknown_opcode_info);
        table[opcode] = info;
    }

    namespace detail
    {
        using enum OpCodeCategory;

        consteval OpCodeInfo
        push_info(std::string_view name, std::uint8_t n)
        {
            return {name, n, 0, 1, false, 3, Stack, 0, 0};
        }

        consteval OpCodeInfo dup_info(std::string_view name, std::uint8_t n)
        {
            return {
                name,
                0,
                n,
                static_cast<std::uint8_t>(n + 1),
                false,
                3,
                Stack,
                0,
                0};
        }

        consteval OpCodeInfo swap_info(std::string_view name, std::uint8_t n)
        {
            return {
                name,
                0,
                static_cast<std::uint8_t>(n + 1),
                static_cast<std::uint8_t>(n + 1),
                false,
                3,
                Stack,
                0,
                0};
        }

        consteval OpCodeInfo log_info(std::string_view name, std::uint8_t n)
        {
            return {
                name,
                0,
                static_cast<std::uint8_t>(2 + n),
                0,
                true,
                static_cast<std::uint16_t>(375 * (n + 1)),
                Logging,
                0,
                0};
        }
    }

    template <>
    consteval OpCodeTable make_opcode_table<EVMC_FRONTIER>()
    {
        using enum OpCodeCategory;
        using detail::dup_info;
        using detail::log_info;
        using detail::push_info;
        using detail::swap_info;

        OpCodeTable table{};
        table.fill(unknown_opcode_info);

        table[STOP] = {"STOP", 0, 0, 0, false, 0, ControlFlow};
        table[ADD] = {"ADD", 0, 2, 1, false, 3, Arithmetic};
        table[MUL] = {"MUL", 0, 2, 1, false, 5, Arithmetic};
        table[SUB] = {"SUB", 0, 2, 1, false, 3, Arithmetic};
        table[DIV] = {"DIV", 0, 2, 1, false, 5, Arithmetic};
        table[SDIV] = {"SDIV", 0, 2, 1, false, 5, Arithmetic};
        table[MOD] = {"MOD", 0, 2, 1, false, 5, Arithmetic};
        table[SMOD] = {"SMOD", 0, 2, 1, false, 5, Arithmetic};
        table[ADDMOD] = {"ADDMOD", 0, 3, 1, false, 8, Arithmetic};
        table[MULMOD] = {"MULMOD", 0, 3, 1, false, 8, Arithmetic};
        table[EXP] = {"EXP", 0, 2, 1, true, 10, Arithmetic};
        table[SIGNEXTEND] = {"SIGNEXTEND", 0, 2, 1, false, 5, Arithmetic};

        table[LT] = {"LT", 0, 2, 1, false, 3, Comparison};
        table[GT] = {"GT", 0, 2, 1, false, 3, Comparison};
        table[SLT] = {"SLT", 0, 2, 1, false, 3, Comparison};
        table[SGT] = {"SGT", 0, 2, 1, false, 3, Comparison};
        table[EQ] = {"EQ", 0, 2, 1, false, 3, Comparison};
        table[ISZERO] = {"ISZERO", 0, 1, 1, false, 3, Comparison};
        table[AND] = {"AND", 0, 2, 1, false, 3, Bitwise};
        table[OR] = {"OR", 0, 2, 1, false, 3, Bitwise};
        table[XOR] = {"XOR", 0, 2, 1, false, 3, Bitwise};
        table[NOT] = {"NOT", 0, 1, 1, false, 3, Bitwise};
        table[BYTE] = {"BYTE", 0, 2, 1, false, 3, Bitwise};

        table[SHA3] = {"SHA3", 0, 2, 1, true, 30, Keccak};

        table[ADDRESS] = {"ADDRESS", 0, 0, 1, false, 2, Environment};
        table[BALANCE] = {"BALANCE", 0, 1, 1, true, 20, Environment};
        table[ORIGIN] = {"ORIGIN", 0, 0, 1, false, 2, Environment};
        table[CALLER] = {"CALLER", 0, 0, 1, false, 2, Environment};
        table[CALLVALUE] = {"CALLVALUE", 0, 0, 1, false, 2, Environment};
        table[CALLDATALOAD] = {
            "CALLDATALOAD", 0, 1, 1, false, 3, Environment};
        table[CALLDATASIZE] = {
            "CALLDATASIZE", 0, 0, 1, false, 2, Environment};
        table[CALLDATACOPY] = {"CALLDATACOPY", 0, 3, 0, true, 3, Environment};
        table[CODESIZE] = {"CODESIZE", 0, 0, 1, false, 2, Environment};
        table[CODECOPY] = {"CODECOPY", 0, 3, 0, true, 3, Environment};
        table[GASPRICE] = {"GASPRICE", 0, 0, 1, false, 2, Environment};
        table[EXTCODESIZE] = {"EXTCODESIZE", 0, 1, 1, true, 20, Environment};
        table[EXTCODECOPY] = {"EXTCODECOPY", 0, 4, 0, true, 20, Environment};

        table[BLOCKHASH] = {"BLOCKHASH", 0, 1, 1, false, 20, Block};
        table[COINBASE] = {"COINBASE", 0, 0, 1, false, 2, Block};
        table[TIMESTAMP] = {"TIMESTAMP", 0, 0, 1, false, 2, Block};
        table[NUMBER] = {"NUMBER", 0, 0, 1, false, 2, Block};
        table[DIFFICULTY] = {"DIFFICULTY", 0, 0, 1, false, 2, Block};
        table[GASLIMIT] = {"GASLIMIT", 0, 0, 1, false, 2, Block};

        table[POP] = {"POP", 0, 1, 0, false, 2, Stack};
        table[MLOAD] = {"MLOAD", 0, 1, 1, true, 3, Memory};
        table[MSTORE] = {"MSTORE", 0, 2, 0, true, 3, Memory};
        table[MSTORE8] = {"MSTORE8", 0, 2, 0, true, 3, Memory};
        table[SLOAD] = {"SLOAD", 0, 1, 1, true, 50, Storage};
        table[SSTORE] = {"SSTORE", 0, 2, 0, true, 5000, Storage};
        table[JUMP] = {"JUMP", 0, 1, 0, false, 8, ControlFlow};
        table[JUMPI] = {"JUMPI", 0, 2, 0, false, 10, ControlFlow};
        table[PC] = {"PC", 0, 0, 1, false, 2, ControlFlow};
        table[MSIZE] = {"MSIZE", 0, 0, 1, false, 2, Memory};
        table[GAS] = {"GAS", 0, 0, 1, false, 2, ControlFlow};
        table[JUMPDEST] = {"JUMPDEST", 0, 0, 0, false, 1, JumpDest};

        table[PUSH1] = push_info("PUSH1", 1);
        table[PUSH2] = push_info("PUSH2", 2);
        table[PUSH3] = push_info("PUSH3", 3);
        table[PUSH4] = push_info("PUSH4", 4);
        table[PUSH5] = push_info("PUSH5", 5);
        table[PUSH6] = push_info("PUSH6", 6);
        table[PUSH7] = push_info("PUSH7", 7);
        table[PUSH8] = push_info("PUSH8", 8);
        table[PUSH9] = push_info("PUSH9", 9);
        table[PUSH10] = push_info("PUSH10", 10);
        table[PUSH11] = push_info("PUSH11", 11);
        table[PUSH12] = push_info("PUSH12", 12);
        table[PUSH13] = push_info("PUSH13", 13);
        table[PUSH14] = push_info("PUSH14", 14);
        table[PUSH15] = push_info("PUSH15", 15);
        table[PUSH16] = push_info("PUSH16", 16);
        table[PUSH17] = push_info("PUSH17", 17);
        table[PUSH18] = push_info("PUSH18", 18);
        table[PUSH19] = push_info("PUSH19", 19);
        table[PUSH20] = push_info("PUSH20", 20);
        table[PUSH21] = push_info("PUSH21", 21);
        table[PUSH22] = push_info("PUSH22", 22);
        table[PUSH23] = push_info("PUSH23", 23);
        table[PUSH24] = push_info("PUSH24", 24);
        table[PUSH25] = push_info("PUSH25", 25);
        table[PUSH26] = push_info("PUSH26", 26);
        table[PUSH27] = push_info("PUSH27", 27);
        table[PUSH28] = push_info("PUSH28", 28);
        table[PUSH29] = push_info("PUSH29", 29);
        table[PUSH30] = push_info("PUSH30", 30);
        table[PUSH31] = push_info("PUSH31", 31);
        table[PUSH32] = push_info("PUSH32", 32);

        table[DUP1] = dup_info("DUP1", 1);
        table[DUP2] = dup_info("DUP2", 2);
        table[DUP3] = dup_info("DUP3", 3);
        table[DUP4] = dup_info("DUP4", 4);
        table[DUP5] = dup_info("DUP5", 5);
        table[DUP6] = dup_info("DUP6", 6);
        table[DUP7] = dup_info("DUP7", 7);
        table[DUP8] = dup_info("DUP8", 8);
        table[DUP9] = dup_info("DUP9", 9);
        table[DUP10] = dup_info("DUP10", 10);
        table[DUP11] = dup_info("DUP11", 11);
        table[DUP12] = dup_info("DUP12", 12);
        table[DUP13] = dup_info("DUP13", 13);
        table[DUP14] = dup_info("DUP14", 14);
        table[DUP15] = dup_info("DUP15", 15);
        table[DUP16] = dup_info("DUP16", 16);

        table[SWAP1] = swap_info("SWAP1", 1);
        table[SWAP2] = swap_info("SWAP2", 2);
        table[SWAP3] = swap_info("SWAP3", 3);
        table[SWAP4] = swap_info("SWAP4", 4);
        table[SWAP5] = swap_info("SWAP5", 5);
        table[SWAP6] = swap_info("SWAP6", 6);
        table[SWAP7] = swap_info("SWAP7", 7);
        table[SWAP8] = swap_info("SWAP8", 8);
        table[SWAP9] = swap_info("SWAP9", 9);
        table[SWAP10] = swap_info("SWAP10", 10);
        table[SWAP11] = swap_info("SWAP11", 11);
        table[SWAP12] = swap_info("SWAP12", 12);
        table[SWAP13] = swap_info("SWAP13", 13);
        table[SWAP14] = swap_info("SWAP14", 14);
        table[SWAP15] = swap_info("SWAP15", 15);
        table[SWAP16] = swap_info("SWAP16", 16);

        table[LOG0] = log_info("LOG0", 0);
        table[LOG1] = log_info("LOG1", 1);
        table[LOG2] = log_info("LOG2", 2);
        table[LOG3] = log_info("LOG3", 3);
        table[LOG4] = log_info("LOG4", 4);

        table[CREATE] = {"CREATE", 0, 3, 1, true, 32000, System};
        table[CALL] = {"CALL", 0, 7, 1, true, 40, System};
        table[CALLCODE] = {"CALLCODE", 0, 7, 1, true, 40, System};
        table[RETURN] = {"RETURN", 0, 2, 0, true, 0, System};
        table[INVALID] = designated_invalid_opcode_info;
        table[SELFDESTRUCT] = {"SELFDESTRUCT", 0, 1, 0, true, 0, System};

        return table;
    }

    template <>
    consteval OpCodeTable make_opcode_table<EVMC_HOMESTEAD>()
    {
        auto table = make_opcode_table<previous_evm_revision(EVMC_HOMESTEAD)>();

        add_opcode(
            DELEGATECALL,
            table,
            {"DELEGATECALL", 0, 6, 1, true, 40, OpCodeCategory::System});

        return table;
    }

    template <>
    consteval OpCodeTable make_opcode_table<EVMC_TANGERINE_WHISTLE>()
    {
        auto table =
            make_opcode_table<previous_evm_revision(EVMC_TANGERINE_WHISTLE)>();

        // EIP-150
        table[SLOAD].min_gas = 200;
        table[BALANCE].min_gas = 400;
        table[EXTCODECOPY].min_gas = 700;
        table[EXTCODESIZE].min_gas = 700;
        table[CALL].min_gas = 700;
        table[CALLCODE].min_gas = 700;
        table[DELEGATECALL].min_gas = 700;
        table[SELFDESTRUCT].min_gas = 5000;

        return table;
    }

    template <>
    consteval OpCodeTable make_opcode_table<EVMC_SPURIOUS_DRAGON>()
    {
        return make_opcode_table<previous_evm_revision(EVMC_SPURIOUS_DRAGON)>();
    }

    template <>
    consteval OpCodeTable make_opcode_table<EVMC_BYZANTIUM>()
    {
        using enum OpCodeCategory;

        auto table = make_opcode_table<previous_evm_revision(EVMC_BYZANTIUM)>();

        add_opcode(
            RETURNDATASIZE,
            table,
            {"RETURNDATASIZE", 0, 0, 1, false, 2, Environment});
        add_opcode(
            RETURNDATACOPY,
            table,
            {"RETURNDATACOPY", 0, 3, 0, true, 3, Environment});
        add_opcode(
            STATICCALL, table, {"STATICCALL", 0, 6, 1, true, 700, System});
        add_opcode(REVERT, table, {"REVERT", 0, 2, 0, true, 0, System});

        return table;
    }

    template <>
    consteval OpCodeTable make_opcode_table<EVMC_CONSTANTINOPLE>()
    {
        using enum OpCodeCategory;

        auto table =
            make_opcode_table<previous_evm_revision(EVMC_CONSTANTINOPLE)>();

        add_opcode(SHL, table, {"SHL", 0, 2, 1, false, 3, Bitwise});
        add_opcode(SHR, table, {"SHR", 0, 2, 1, false, 3, Bitwise});
        add_opcode(SAR, table, {"SAR", 0, 2, 1, false, 3, Bitwise});
        add_opcode(
            EXTCODEHASH,
            table,
            {"EXTCODEHASH", 0, 1, 1, true, 400, Environment});
        add_opcode(CREATE2, table, {"CREATE2", 0, 4, 1, true, 32000, System});

        // EIP-1283
        table[SSTORE].min_gas = 200;

        return table;
    }

    template <>
    consteval OpCodeTable make_opcode_table<EVMC_PETERSBURG>()
    {
        auto table =
            make_opcode_table<previous_evm_revision(EVMC_PETERSBURG)>();

        // EIP-1283 reverted
        table[SSTORE].min_gas = 5000;

        return table;
    }

    template <>
    consteval OpCodeTable make_opcode_table<EVMC_ISTANBUL>()
    {
        using enum OpCodeCategory;

        auto table = make_opcode_table<previous_evm_revision(EVMC_ISTANBUL)>();

        add_opcode(CHAINID, table, {"CHAINID", 0, 0, 1, false, 2, Block});
        add_opcode(
            SELFBALANCE, table, {"SELFBALANCE", 0, 0, 1, false, 5, Block});

        // EIP-2200
        table[SLOAD].min_gas = 800;
        table[SSTORE].min_gas = 800;

        // EIP-1884
        table[BALANCE].min_gas = 700;
        table[EXTCODEHASH].min_gas = 700;

        return table;
    }

    template <>
    consteval OpCodeTable make_opcode_table<EVMC_BERLIN>()
    {
        auto table = make_opcode_table<previous_evm_revision(EVMC_BERLIN)>();

        // EIP-2929
        table[SLOAD].min_gas = 100;
        table[SSTORE].min_gas = 100;
        table[BALANCE].min_gas = 100;
        table[EXTCODECOPY].min_gas = 100;
        table[EXTCODEHASH].min_gas = 100;
        table[EXTCODESIZE].min_gas = 100;
        table[CALL].min_gas = 100;
        table[CALLCODE].min_gas = 100;
        table[DELEGATECALL].min_gas = 100;
        table[STATICCALL].min_gas = 100;

        return table;
    }

    template <>
    consteval OpCodeTable make_opcode_table<EVMC_LONDON>()
    {
        auto table = make_opcode_table<previous_evm_revision(EVMC_LONDON)>();

        add_opcode(
            BASEFEE,
            table,
            {"BASEFEE", 0, 0, 1, false, 2, OpCodeCategory::Block});

        return table;
    }

    template <>
    consteval OpCodeTable make_opcode_table<EVMC_PARIS>()
    {
        auto table = make_opcode_table<previous_evm_revision(EVMC_PARIS)>();

        // EIP-4399
        table[PREVRANDAO].name = "PREVRANDAO";

        return table;
    }

    template <>
    consteval OpCodeTable make_opcode_table<EVMC_SHANGHAI>()
    {
        auto table = make_opcode_table<previous_evm_revision(EVMC_SHANGHAI)>();

        // EIP-3855
        add_opcode(
            PUSH0,
            table,
            {"PUSH0", 0, 0, 1, false, 2, OpCodeCategory::Stack});

        return table;
    }

    template <>
    consteval OpCodeTable make_opcode_table<EVMC_CANCUN>()
    {
        using enum OpCodeCategory;

        auto table = make_opcode_table<previous_evm_revision(EVMC_CANCUN)>();

        add_opcode(BLOBHASH, table, {"BLOBHASH", 0, 1, 1, false, 3, Block});
        add_opcode(
            BLOBBASEFEE, table, {"BLOBBASEFEE", 0, 0, 1, false, 2, Block});
        add_opcode(TLOAD, table, {"TLOAD", 0, 1, 1, false, 100, Storage});
        add_opcode(TSTORE, table, {"TSTORE", 0, 2, 0, false, 100, Storage});
        add_opcode(MCOPY, table, {"MCOPY", 0, 3, 0, true, 3, Memory});

        return table;
    }

    template <>
    consteval OpCodeTable make_opcode_table<EVMC_PRAGUE>()
    {
        return make_opcode_table<previous_evm_revision(EVMC_PRAGUE)>();
    }

    template <>
    consteval OpCodeTable make_opcode_table<EVMC_OSAKA>()
    {
        auto table = make_opcode_table<previous_evm_revision(EVMC_OSAKA)>();

        // EIP-7939
        add_opcode(
            CLZ, table, {"CLZ", 0, 1, 1, false, 5, OpCodeCategory::Bitwise});

        return table;
    }

    /**
     * Returns `true` if `info` is a placeholder for an opcode byte that has
     * no meaning at the table's revision.
     */
    constexpr bool is_unknown_opcode_info(OpCodeInfo const &info)
    {
        return info.category == OpCodeCategory::Invalid;
    }

    /**
     * Total, O(1) lookup of the descriptor for `opcode` at revision `Rev`.
     */
    template <evmc_revision Rev = EVMC_LATEST_STABLE_REVISION>
    constexpr OpCodeInfo const &describe(std::uint8_t const opcode) noexcept
    {
        return opcode_table<Rev>[opcode];
    }

    /**
     * Run-time revision variant of `describe`. Revisions newer than the
     * newest table known here use that newest table.
     */
    OpCodeInfo const &
    describe(std::uint8_t opcode, evmc_revision rev) noexcept;

    std::string_view category_name(OpCodeCategory) noexcept;
}
