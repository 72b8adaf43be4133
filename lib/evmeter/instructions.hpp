// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "execution_state.hpp"
#include "instructions_traits.hpp"
#include "status.hpp"
#include <algorithm>
#include <optional>

namespace evmeter
{
/// The size of the EVM 256-bit word.
constexpr auto word_size = 32;

/// The largest memory size for which the expansion cost computation does not overflow 64 bits.
/// For more words the square term of the cost formula overflows.
constexpr uint64_t max_memory_size = 0x1FFFFFFFE0;

/// Returns number of words what would fit to provided number of bytes,
/// i.e. it rounds up the number bytes to number of words.
inline constexpr uint64_t num_words(uint64_t size_in_bytes) noexcept
{
    return size_in_bytes / word_size + (size_in_bytes % word_size != 0);
}

/// Checks if the 256-bit value fits in 64 bits.
inline constexpr bool fits_uint64(const uint256& x) noexcept
{
    return (x[3] | x[2] | x[1]) == 0;
}

/// Adds two gas values. Returns true on overflow, the wrapped sum is stored in `out` anyway.
[[nodiscard]] inline constexpr bool add_overflow(uint64_t x, uint64_t y, uint64_t& out) noexcept
{
    const auto r = intx::addc(x, y);
    out = r.value;
    return r.carry;
}

/// Multiplies two gas values. Returns true on overflow.
[[nodiscard]] inline constexpr bool mul_overflow(uint64_t x, uint64_t y, uint64_t& out) noexcept
{
    const auto p = intx::umul(x, y);
    out = p[0];
    return p[1] != 0;
}

/// The total cost of memory of the given number of words.
inline constexpr uint64_t memory_cost(uint64_t words) noexcept
{
    return instr::memory_gas * words + words * words / instr::quad_coeff_div;
}

/// Returns the end of the memory range [offset, offset + size).
///
/// The empty range needs no memory and has end 0 regardless of the offset.
/// Returns std::nullopt when the end is not representable in 64 bits.
[[nodiscard]] inline std::optional<uint64_t> memory_end(
    const uint256& offset, const uint256& size) noexcept
{
    if (size == 0)
        return 0;
    if (!fits_uint64(offset) || !fits_uint64(size))
        return std::nullopt;
    uint64_t end = 0;
    if (add_overflow(static_cast<uint64_t>(offset), static_cast<uint64_t>(size), end))
        return std::nullopt;
    return end;
}

/// Computes the cost of growing the memory so that it covers `new_size` bytes.
///
/// Only the growth beyond the current high-water mark is charged: the result is
/// memory_cost(new words) - memory_cost(current words), or 0 if the memory is large enough.
[[nodiscard]] inline GasCost memory_expansion_cost(const Memory& memory, uint64_t new_size) noexcept
{
    if (new_size == 0)
        return {};
    if (new_size > max_memory_size)
        return {Status::gas_uint_overflow, 0};

    const auto new_words = num_words(new_size);
    const auto current_words = memory.size() / word_size;
    if (new_words <= current_words)
        return {};
    return {Status::success, memory_cost(new_words) - memory_cost(current_words)};
}

/// Grows the memory (rounded up to whole words) to cover `end` bytes. Never shrinks.
inline void grow_memory(Memory& memory, uint64_t end) noexcept
{
    if (end > memory.size())
        memory.grow(static_cast<size_t>(num_words(end) * word_size));
}

/// The gas of the "copy" instructions: memory expansion to `mem_end` plus
/// instr::copy_gas per word of `size`.
[[nodiscard]] GasCost copy_gas_cost(const Memory& memory, uint64_t mem_end, const uint256& size) noexcept;

/// The instruction implementations ("execute" functions of the Operations).
///
/// They assume the stack requirements (overflow, underflow) have already been checked
/// and all gas, constant and dynamic, has already been charged.
/// The instructions RETURN, REVERT, STOP and SELFDESTRUCT halt the execution; the Operation
/// descriptor marks them.
namespace instr::core
{
Status stop(Stack& stack, ExecutionState& state) noexcept;
Status add(Stack& stack, ExecutionState& state) noexcept;
Status mul(Stack& stack, ExecutionState& state) noexcept;
Status sub(Stack& stack, ExecutionState& state) noexcept;
Status address(Stack& stack, ExecutionState& state) noexcept;
Status balance(Stack& stack, ExecutionState& state) noexcept;
Status caller(Stack& stack, ExecutionState& state) noexcept;
Status callvalue(Stack& stack, ExecutionState& state) noexcept;
Status calldatacopy(Stack& stack, ExecutionState& state) noexcept;
Status extcodesize(Stack& stack, ExecutionState& state) noexcept;
Status extcodecopy(Stack& stack, ExecutionState& state) noexcept;
Status extcodehash(Stack& stack, ExecutionState& state) noexcept;
Status chainid(Stack& stack, ExecutionState& state) noexcept;
Status selfbalance(Stack& stack, ExecutionState& state) noexcept;
Status basefee(Stack& stack, ExecutionState& state) noexcept;
Status pop(Stack& stack, ExecutionState& state) noexcept;
Status mload(Stack& stack, ExecutionState& state) noexcept;
Status mstore(Stack& stack, ExecutionState& state) noexcept;
Status mstore8(Stack& stack, ExecutionState& state) noexcept;
Status sload(Stack& stack, ExecutionState& state) noexcept;
Status sstore(Stack& stack, ExecutionState& state) noexcept;
Status msize(Stack& stack, ExecutionState& state) noexcept;
Status gas(Stack& stack, ExecutionState& state) noexcept;
Status mcopy(Stack& stack, ExecutionState& state) noexcept;
Status push0(Stack& stack, ExecutionState& state) noexcept;
Status return_(Stack& stack, ExecutionState& state) noexcept;
Status revert(Stack& stack, ExecutionState& state) noexcept;
Status selfdestruct(Stack& stack, ExecutionState& state) noexcept;
Status undefined(Stack& stack, ExecutionState& state) noexcept;

template <int N>
Status dup(Stack& stack, ExecutionState& /*state*/) noexcept
{
    stack.push(stack[N - 1]);
    return Status::success;
}

template <int N>
Status swap(Stack& stack, ExecutionState& /*state*/) noexcept
{
    std::swap(stack.top(), stack[N]);
    return Status::success;
}

template <Opcode Op>
Status call_impl(Stack& stack, ExecutionState& state) noexcept;
inline constexpr auto call = call_impl<OP_CALL>;
inline constexpr auto callcode = call_impl<OP_CALLCODE>;
inline constexpr auto delegatecall = call_impl<OP_DELEGATECALL>;
inline constexpr auto staticcall = call_impl<OP_STATICCALL>;

template <Opcode Op>
Status create_impl(Stack& stack, ExecutionState& state) noexcept;
inline constexpr auto create = create_impl<OP_CREATE>;
inline constexpr auto create2 = create_impl<OP_CREATE2>;
}  // namespace instr::core


/// The dynamic gas functions.
///
/// They compute the gas charged on top of the Operation's constant gas and run after the
/// constant gas has been charged, before the instruction executes. Some of them have
/// side effects on the transaction's AccessList (warming accounts and slots, refunds).
/// The side effects are not reverted if the frame cannot afford the returned cost.
namespace instr::gas
{
GasCost mload(Stack& stack, ExecutionState& state) noexcept;
GasCost mstore(Stack& stack, ExecutionState& state) noexcept;
GasCost mstore8(Stack& stack, ExecutionState& state) noexcept;
GasCost calldatacopy(Stack& stack, ExecutionState& state) noexcept;
GasCost extcodecopy(Stack& stack, ExecutionState& state) noexcept;
GasCost return_(Stack& stack, ExecutionState& state) noexcept;
GasCost mcopy(Stack& stack, ExecutionState& state) noexcept;
GasCost create(Stack& stack, ExecutionState& state) noexcept;
GasCost create2(Stack& stack, ExecutionState& state) noexcept;

/// CREATE and CREATE2 with the initcode size limit and initcode word cost of EIP-3860.
GasCost create_eip3860(Stack& stack, ExecutionState& state) noexcept;
GasCost create2_eip3860(Stack& stack, ExecutionState& state) noexcept;

/// The pre-access-list call costs: value transfer, new account, memory expansion
/// and the gas forwarded to the callee (all but one 64th, EIP-150).
/// @{
GasCost call(Stack& stack, ExecutionState& state) noexcept;
GasCost callcode(Stack& stack, ExecutionState& state) noexcept;
GasCost delegatecall(Stack& stack, ExecutionState& state) noexcept;
GasCost staticcall(Stack& stack, ExecutionState& state) noexcept;
/// @}

/// The storage write gas schedules.
enum class SstoreSchedule
{
    /// EIP-2200 net gas metering.
    eip2200,

    /// EIP-2200 repriced by EIP-2929 with the cold slot surcharge.
    eip2929,

    /// EIP-2929 with the clearing refund reduced by EIP-3529.
    eip3529,
};

/// The pre-Istanbul SSTORE cost: 20000 for zero to non-zero, 5000 otherwise,
/// 15000 refund for clearing.
GasCost sstore_legacy(Stack& stack, ExecutionState& state) noexcept;

/// The net gas metered SSTORE cost for the given schedule.
template <SstoreSchedule S>
GasCost sstore(Stack& stack, ExecutionState& state) noexcept;

GasCost selfdestruct_legacy(Stack& stack, ExecutionState& state) noexcept;

/// EIP-2929 access list aware gas functions.
/// @{
GasCost account_check_eip2929(Stack& stack, ExecutionState& state) noexcept;
GasCost extcodecopy_eip2929(Stack& stack, ExecutionState& state) noexcept;
GasCost sload_eip2929(Stack& stack, ExecutionState& state) noexcept;

using GasFn = GasCost (*)(Stack& stack, ExecutionState& state) noexcept;

/// Wraps a pre-access-list call gas function with the cold account surcharge.
template <GasFn PriorFn>
GasCost call_eip2929(Stack& stack, ExecutionState& state) noexcept;

/// SELFDESTRUCT with the cold beneficiary surcharge. RefundsEnabled is false since EIP-3529.
template <bool RefundsEnabled>
GasCost selfdestruct_eip2929(Stack& stack, ExecutionState& state) noexcept;
/// @}
}  // namespace instr::gas
}  // namespace evmeter
