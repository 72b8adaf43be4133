// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "opcodes.hpp"
#include <array>
#include <cstdint>

namespace evmeter::instr
{
/// The maximum number of EVM stack items.
inline constexpr int stack_limit = 1024;

/// Gas cost tiers shared by the simple instructions.
/// @{
inline constexpr uint64_t gas_quick_step = 2;
inline constexpr uint64_t gas_fastest_step = 3;
inline constexpr uint64_t gas_fast_step = 5;
/// @}

/// Memory expansion: 3 gas per word plus words^2 / 512.
/// @{
inline constexpr uint64_t memory_gas = 3;
inline constexpr uint64_t quad_coeff_div = 512;
/// @}

/// Per-word (or per-byte, for MCOPY) cost of copy instructions.
inline constexpr uint64_t copy_gas = 3;

/// EIP-2929 constants (https://eips.ethereum.org/EIPS/eip-2929).
/// @{
inline constexpr uint64_t cold_sload_cost = 2100;
inline constexpr uint64_t cold_account_access_cost = 2600;
inline constexpr uint64_t warm_storage_read_cost = 100;

/// Additional cold account access cost.
///
/// The warm access cost is unconditionally applied for every account access instruction.
/// If the access turns out to be cold, this cost must be applied additionally.
inline constexpr uint64_t additional_cold_account_access_cost =
    cold_account_access_cost - warm_storage_read_cost;
/// @}

/// Pre-access-list state access costs.
/// @{
inline constexpr uint64_t balance_gas_eip150 = 400;
inline constexpr uint64_t balance_gas_eip1884 = 700;
inline constexpr uint64_t extcodesize_gas_eip150 = 700;
inline constexpr uint64_t extcodecopy_base_eip150 = 700;
inline constexpr uint64_t extcodehash_gas_constantinople = 400;
inline constexpr uint64_t extcodehash_gas_eip1884 = 700;
inline constexpr uint64_t sload_gas_eip150 = 200;
inline constexpr uint64_t sload_gas_eip1884 = 800;
inline constexpr uint64_t sload_gas_eip2200 = 800;
inline constexpr uint64_t call_gas_eip150 = 700;
/// @}

/// Storage write costs.
/// @{
inline constexpr uint64_t sstore_set_gas = 20000;
inline constexpr uint64_t sstore_reset_gas = 5000;
inline constexpr int64_t sstore_refund_gas = 15000;
inline constexpr uint64_t sstore_sentry_gas_eip2200 = 2300;
inline constexpr int64_t sstore_clears_schedule_refund_eip2200 = 15000;
inline constexpr int64_t sstore_clears_schedule_refund_eip3529 = 4800;
/// @}

/// Calls and account creation.
/// @{
inline constexpr uint64_t call_value_transfer_gas = 9000;
inline constexpr uint64_t call_new_account_gas = 25000;
inline constexpr int64_t call_stipend = 2300;
inline constexpr uint64_t create_gas = 32000;
inline constexpr uint64_t keccak256_word_gas = 6;
inline constexpr int call_depth_limit = 1024;
/// @}

/// SELFDESTRUCT.
/// @{
inline constexpr uint64_t selfdestruct_gas_eip150 = 5000;
inline constexpr uint64_t create_by_selfdestruct_gas = 25000;
inline constexpr int64_t selfdestruct_refund_gas = 24000;
/// @}

/// EIP-3860 limits (https://eips.ethereum.org/EIPS/eip-3860).
/// @{
inline constexpr uint64_t max_initcode_size = 49152;
inline constexpr uint64_t initcode_word_gas = 2;
/// @}


/// EVM instruction traits.
struct Traits
{
    /// The instruction name;
    const char* name = nullptr;

    /// The number of stack items the instruction accesses during execution.
    int8_t stack_height_required = 0;

    /// The stack height change caused by the instruction execution. Can be negative.
    int8_t stack_height_change = 0;
};

/// The global, revision independent, table of traits of the EVM instructions known to evmeter.
constexpr inline std::array<Traits, 256> traits = []() noexcept {
    std::array<Traits, 256> table{};

    table[OP_STOP] = {"STOP", 0, 0};
    table[OP_ADD] = {"ADD", 2, -1};
    table[OP_MUL] = {"MUL", 2, -1};
    table[OP_SUB] = {"SUB", 2, -1};

    table[OP_ADDRESS] = {"ADDRESS", 0, 1};
    table[OP_BALANCE] = {"BALANCE", 1, 0};
    table[OP_CALLER] = {"CALLER", 0, 1};
    table[OP_CALLVALUE] = {"CALLVALUE", 0, 1};
    table[OP_CALLDATACOPY] = {"CALLDATACOPY", 3, -3};
    table[OP_EXTCODESIZE] = {"EXTCODESIZE", 1, 0};
    table[OP_EXTCODECOPY] = {"EXTCODECOPY", 4, -4};
    table[OP_EXTCODEHASH] = {"EXTCODEHASH", 1, 0};

    table[OP_CHAINID] = {"CHAINID", 0, 1};
    table[OP_SELFBALANCE] = {"SELFBALANCE", 0, 1};
    table[OP_BASEFEE] = {"BASEFEE", 0, 1};

    table[OP_POP] = {"POP", 1, -1};
    table[OP_MLOAD] = {"MLOAD", 1, 0};
    table[OP_MSTORE] = {"MSTORE", 2, -2};
    table[OP_MSTORE8] = {"MSTORE8", 2, -2};
    table[OP_SLOAD] = {"SLOAD", 1, 0};
    table[OP_SSTORE] = {"SSTORE", 2, -2};
    table[OP_MSIZE] = {"MSIZE", 0, 1};
    table[OP_GAS] = {"GAS", 0, 1};
    table[OP_MCOPY] = {"MCOPY", 3, -3};
    table[OP_PUSH0] = {"PUSH0", 0, 1};

    constexpr const char* dup_names[] = {"DUP1", "DUP2", "DUP3", "DUP4", "DUP5", "DUP6", "DUP7",
        "DUP8", "DUP9", "DUP10", "DUP11", "DUP12", "DUP13", "DUP14", "DUP15", "DUP16"};
    constexpr const char* swap_names[] = {"SWAP1", "SWAP2", "SWAP3", "SWAP4", "SWAP5", "SWAP6",
        "SWAP7", "SWAP8", "SWAP9", "SWAP10", "SWAP11", "SWAP12", "SWAP13", "SWAP14", "SWAP15",
        "SWAP16"};
    for (int n = 1; n <= 16; ++n)
    {
        table[OP_DUP1 + n - 1] = {dup_names[n - 1], static_cast<int8_t>(n), 1};
        table[OP_SWAP1 + n - 1] = {swap_names[n - 1], static_cast<int8_t>(n + 1), 0};
    }

    table[OP_CREATE] = {"CREATE", 3, -2};
    table[OP_CALL] = {"CALL", 7, -6};
    table[OP_CALLCODE] = {"CALLCODE", 7, -6};
    table[OP_RETURN] = {"RETURN", 2, -2};
    table[OP_DELEGATECALL] = {"DELEGATECALL", 6, -5};
    table[OP_CREATE2] = {"CREATE2", 4, -3};
    table[OP_STATICCALL] = {"STATICCALL", 6, -5};
    table[OP_REVERT] = {"REVERT", 2, -2};
    table[OP_SELFDESTRUCT] = {"SELFDESTRUCT", 1, -1};

    return table;
}();

/// The minimum stack height required to execute the instruction described by the traits.
constexpr int min_stack(const Traits& t) noexcept
{
    return t.stack_height_required;
}

/// The maximum stack height allowed before executing the instruction,
/// such that the stack limit is not exceeded afterwards.
constexpr int max_stack(const Traits& t) noexcept
{
    return stack_limit - t.stack_height_change;
}
}  // namespace evmeter::instr
