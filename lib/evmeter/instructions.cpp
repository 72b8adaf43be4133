// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0

#include "instructions.hpp"

namespace evmeter
{
GasCost copy_gas_cost(const Memory& memory, uint64_t mem_end, const uint256& size) noexcept
{
    const auto mem = memory_expansion_cost(memory, mem_end);
    if (mem.status != Status::success)
        return mem;

    if (!fits_uint64(size))
        return {Status::gas_uint_overflow, 0};

    uint64_t copy_cost = 0;
    uint64_t total = 0;
    if (mul_overflow(num_words(static_cast<uint64_t>(size)), instr::copy_gas, copy_cost) ||
        add_overflow(mem.cost, copy_cost, total))
        return {Status::gas_uint_overflow, 0};
    return {Status::success, total};
}

namespace instr::core
{
namespace
{
/// Grows the memory to cover the range [offset, offset + size).
/// Returns false if the range is not representable.
[[nodiscard]] bool grow_memory_range(Memory& memory, const uint256& offset, const uint256& size) noexcept
{
    const auto end = memory_end(offset, size);
    if (!end)
        return false;
    grow_memory(memory, *end);
    return true;
}

/// Copies the bytes of `src` starting at `src_offset` to the memory at `dst`
/// and fills the rest of `size` with zeros.
void copy_padded(Memory& memory, uint64_t dst, bytes_view src, const uint256& src_offset,
    uint64_t size) noexcept
{
    const auto s = fits_uint64(src_offset) ?
                       std::min(static_cast<uint64_t>(src_offset), uint64_t{src.size()}) :
                       uint64_t{src.size()};
    const auto n = std::min(size, uint64_t{src.size()} - s);
    if (n > 0)
        std::memcpy(&memory[dst], &src[s], n);
    if (size - n > 0)
        std::memset(&memory[dst + n], 0, size - n);
}
}  // namespace

Status stop(Stack& /*stack*/, ExecutionState& /*state*/) noexcept
{
    return Status::success;
}

Status add(Stack& stack, ExecutionState& /*state*/) noexcept
{
    stack.top() += stack.pop();
    return Status::success;
}

Status mul(Stack& stack, ExecutionState& /*state*/) noexcept
{
    const auto a = stack.pop();
    stack.top() *= a;
    return Status::success;
}

Status sub(Stack& stack, ExecutionState& /*state*/) noexcept
{
    const auto a = stack.pop();
    stack.top() = a - stack.top();
    return Status::success;
}

Status address(Stack& stack, ExecutionState& state) noexcept
{
    stack.push(intx::be::load<uint256>(state.msg->recipient));
    return Status::success;
}

Status balance(Stack& stack, ExecutionState& state) noexcept
{
    auto& x = stack.top();
    const auto addr = intx::be::trunc<evmc::address>(x);
    x = intx::be::load<uint256>(state.host->get_balance(addr));
    return Status::success;
}

Status caller(Stack& stack, ExecutionState& state) noexcept
{
    stack.push(intx::be::load<uint256>(state.msg->sender));
    return Status::success;
}

Status callvalue(Stack& stack, ExecutionState& state) noexcept
{
    stack.push(intx::be::load<uint256>(state.msg->value));
    return Status::success;
}

Status calldatacopy(Stack& stack, ExecutionState& state) noexcept
{
    const auto mem_index = stack.pop();
    const auto input_index = stack.pop();
    const auto size = stack.pop();

    if (!grow_memory_range(state.memory, mem_index, size))
        return Status::memory_overflow;

    if (size != 0)
    {
        copy_padded(state.memory, static_cast<uint64_t>(mem_index),
            {state.msg->input_data, state.msg->input_size}, input_index,
            static_cast<uint64_t>(size));
    }
    return Status::success;
}

Status extcodesize(Stack& stack, ExecutionState& state) noexcept
{
    auto& x = stack.top();
    const auto addr = intx::be::trunc<evmc::address>(x);
    x = state.host->get_code_size(addr);
    return Status::success;
}

Status extcodecopy(Stack& stack, ExecutionState& state) noexcept
{
    const auto addr = intx::be::trunc<evmc::address>(stack.pop());
    const auto mem_index = stack.pop();
    const auto input_index = stack.pop();
    const auto size = stack.pop();

    if (!grow_memory_range(state.memory, mem_index, size))
        return Status::memory_overflow;

    if (size == 0)
        return Status::success;

    const auto dst = static_cast<size_t>(mem_index);
    const auto s = static_cast<size_t>(size);
    size_t num_bytes_copied = 0;
    if (fits_uint64(input_index))
    {
        num_bytes_copied = state.host->copy_code(
            addr, static_cast<size_t>(input_index), &state.memory[dst], s);
    }
    if (s - num_bytes_copied > 0)
        std::memset(&state.memory[dst + num_bytes_copied], 0, s - num_bytes_copied);
    return Status::success;
}

Status extcodehash(Stack& stack, ExecutionState& state) noexcept
{
    auto& x = stack.top();
    const auto addr = intx::be::trunc<evmc::address>(x);
    x = state.host->account_empty(addr) ?
            uint256{0} :
            intx::be::load<uint256>(state.host->get_code_hash(addr));
    return Status::success;
}

Status chainid(Stack& stack, ExecutionState& state) noexcept
{
    stack.push(intx::be::load<uint256>(state.host->get_tx_context().chain_id));
    return Status::success;
}

Status selfbalance(Stack& stack, ExecutionState& state) noexcept
{
    stack.push(intx::be::load<uint256>(state.host->get_balance(state.msg->recipient)));
    return Status::success;
}

Status basefee(Stack& stack, ExecutionState& state) noexcept
{
    stack.push(intx::be::load<uint256>(state.host->get_tx_context().block_base_fee));
    return Status::success;
}

Status pop(Stack& stack, ExecutionState& /*state*/) noexcept
{
    stack.pop();
    return Status::success;
}

Status mload(Stack& stack, ExecutionState& state) noexcept
{
    auto& x = stack.top();
    if (!grow_memory_range(state.memory, x, word_size))
        return Status::memory_overflow;
    x = intx::be::unsafe::load<uint256>(&state.memory[static_cast<size_t>(x)]);
    return Status::success;
}

Status mstore(Stack& stack, ExecutionState& state) noexcept
{
    const auto index = stack.pop();
    const auto value = stack.pop();
    if (!grow_memory_range(state.memory, index, word_size))
        return Status::memory_overflow;
    intx::be::unsafe::store(&state.memory[static_cast<size_t>(index)], value);
    return Status::success;
}

Status mstore8(Stack& stack, ExecutionState& state) noexcept
{
    const auto index = stack.pop();
    const auto value = stack.pop();
    if (!grow_memory_range(state.memory, index, 1))
        return Status::memory_overflow;
    state.memory[static_cast<size_t>(index)] = static_cast<uint8_t>(value);
    return Status::success;
}

Status msize(Stack& stack, ExecutionState& state) noexcept
{
    stack.push(state.memory.size());
    return Status::success;
}

Status gas(Stack& stack, ExecutionState& state) noexcept
{
    stack.push(state.gas_left);
    return Status::success;
}

Status mcopy(Stack& stack, ExecutionState& state) noexcept
{
    const auto size_u256 = stack.pop();
    const auto dst_u256 = stack.pop();
    const auto src_u256 = stack.pop();

    // Nothing is read or written, the offsets are irrelevant.
    if (size_u256 == 0)
        return Status::success;

    if (!fits_uint64(size_u256) || !fits_uint64(dst_u256) || !fits_uint64(src_u256))
        return Status::memory_overflow;

    const auto size = static_cast<uint64_t>(size_u256);
    const auto dst = static_cast<uint64_t>(dst_u256);
    const auto src = static_cast<uint64_t>(src_u256);
    uint64_t dst_end = 0;
    uint64_t src_end = 0;
    if (add_overflow(dst, size, dst_end) || add_overflow(src, size, src_end))
        return Status::memory_overflow;

    grow_memory(state.memory, std::max(dst_end, src_end));
    state.memory.copy(static_cast<size_t>(dst), static_cast<size_t>(src), static_cast<size_t>(size));
    return Status::success;
}

Status push0(Stack& stack, ExecutionState& /*state*/) noexcept
{
    stack.push(0);
    return Status::success;
}

namespace
{
Status return_impl(Stack& stack, ExecutionState& state, Status status) noexcept
{
    const auto offset = stack.pop();
    const auto size = stack.pop();
    if (!grow_memory_range(state.memory, offset, size))
        return Status::memory_overflow;

    state.output.clear();
    if (size != 0)
        state.output.assign(&state.memory[static_cast<size_t>(offset)], static_cast<size_t>(size));
    return status;
}
}  // namespace

Status return_(Stack& stack, ExecutionState& state) noexcept
{
    return return_impl(stack, state, Status::success);
}

Status revert(Stack& stack, ExecutionState& state) noexcept
{
    return return_impl(stack, state, Status::revert);
}

Status selfdestruct(Stack& stack, ExecutionState& state) noexcept
{
    if (state.in_static_mode())
        return Status::static_mode_violation;

    const auto beneficiary = intx::be::trunc<evmc::address>(stack.pop());
    state.host->selfdestruct(state.msg->recipient, beneficiary);
    return Status::success;
}

Status undefined(Stack& /*stack*/, ExecutionState& /*state*/) noexcept
{
    return Status::undefined_instruction;
}
}  // namespace instr::core


namespace instr::gas
{
namespace
{
GasCost memory_range_cost(const Memory& memory, const uint256& offset, const uint256& size) noexcept
{
    const auto end = memory_end(offset, size);
    if (!end)
        return {Status::gas_uint_overflow, 0};
    return memory_expansion_cost(memory, *end);
}

/// The memory expansion of a copy destination plus the per-word copy cost.
GasCost copy_range_cost(const Memory& memory, const uint256& offset, const uint256& size) noexcept
{
    const auto end = memory_end(offset, size);
    if (!end)
        return {Status::gas_uint_overflow, 0};
    return copy_gas_cost(memory, *end, size);
}

/// The memory expansion cost of CREATE and CREATE2 (stack: value, offset, size, ...)
/// plus `word_gas` per word of the initcode.
GasCost create_cost(Stack& stack, const Memory& memory, uint64_t word_gas) noexcept
{
    const auto& size = stack[2];
    const auto mem = memory_range_cost(memory, stack[1], size);
    if (mem.status != Status::success || word_gas == 0)
        return mem;

    // The memory cost check above guarantees the size fits in 64 bits if non-zero.
    uint64_t words_cost = 0;
    uint64_t total = 0;
    if (mul_overflow(num_words(static_cast<uint64_t>(size)), word_gas, words_cost) ||
        add_overflow(mem.cost, words_cost, total))
        return {Status::gas_uint_overflow, 0};
    return {Status::success, total};
}

template <bool Create2>
GasCost create_with_initcode_limit(Stack& stack, ExecutionState& state) noexcept
{
    const auto& size = stack[2];
    if (!fits_uint64(size))
        return {Status::gas_uint_overflow, 0};
    if (static_cast<uint64_t>(size) > max_initcode_size)
        return {Status::max_initcode_size_exceeded, 0};

    constexpr auto word_gas = initcode_word_gas + (Create2 ? keccak256_word_gas : 0);
    return create_cost(stack, state.memory, word_gas);
}
}  // namespace

GasCost mload(Stack& stack, ExecutionState& state) noexcept
{
    return memory_range_cost(state.memory, stack[0], word_size);
}

GasCost mstore(Stack& stack, ExecutionState& state) noexcept
{
    return memory_range_cost(state.memory, stack[0], word_size);
}

GasCost mstore8(Stack& stack, ExecutionState& state) noexcept
{
    return memory_range_cost(state.memory, stack[0], 1);
}

GasCost calldatacopy(Stack& stack, ExecutionState& state) noexcept
{
    return copy_range_cost(state.memory, stack[0], stack[2]);
}

GasCost extcodecopy(Stack& stack, ExecutionState& state) noexcept
{
    return copy_range_cost(state.memory, stack[1], stack[3]);
}

GasCost return_(Stack& stack, ExecutionState& state) noexcept
{
    return memory_range_cost(state.memory, stack[0], stack[1]);
}

GasCost mcopy(Stack& stack, ExecutionState& state) noexcept
{
    const auto& size = stack[0];
    const auto& dst = stack[1];
    const auto& src = stack[2];

    if (size == 0)
        return {};

    if (!fits_uint64(size) || !fits_uint64(dst) || !fits_uint64(src))
        return {Status::gas_uint_overflow, 0};

    const auto n = static_cast<uint64_t>(size);
    uint64_t dst_end = 0;
    uint64_t src_end = 0;
    if (add_overflow(static_cast<uint64_t>(dst), n, dst_end) ||
        add_overflow(static_cast<uint64_t>(src), n, src_end))
        return {Status::gas_uint_overflow, 0};

    const auto mem = memory_expansion_cost(state.memory, std::max(dst_end, src_end));
    if (mem.status != Status::success)
        return mem;

    // MCOPY is priced per byte copied, not per word.
    uint64_t copy_cost = 0;
    uint64_t total = 0;
    if (mul_overflow(n, copy_gas, copy_cost) || add_overflow(mem.cost, copy_cost, total))
        return {Status::gas_uint_overflow, 0};
    return {Status::success, total};
}

GasCost create(Stack& stack, ExecutionState& state) noexcept
{
    return create_cost(stack, state.memory, 0);
}

GasCost create2(Stack& stack, ExecutionState& state) noexcept
{
    return create_cost(stack, state.memory, keccak256_word_gas);
}

GasCost create_eip3860(Stack& stack, ExecutionState& state) noexcept
{
    return create_with_initcode_limit<false>(stack, state);
}

GasCost create2_eip3860(Stack& stack, ExecutionState& state) noexcept
{
    return create_with_initcode_limit<true>(stack, state);
}
}  // namespace instr::gas
}  // namespace evmeter
