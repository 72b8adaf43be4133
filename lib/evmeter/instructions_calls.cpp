// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0

#include "instructions.hpp"

namespace evmeter
{
namespace instr::core
{
namespace
{
/// Checks the balance of the current account for a value transfer.
bool has_balance(ExecutionState& state, const uint256& value) noexcept
{
    return intx::be::load<uint256>(state.host->get_balance(state.msg->recipient)) >= value;
}
}  // namespace

template <Opcode Op>
Status call_impl(Stack& stack, ExecutionState& state) noexcept
{
    static_assert(
        Op == OP_CALL || Op == OP_CALLCODE || Op == OP_DELEGATECALL || Op == OP_STATICCALL);
    constexpr bool has_value_arg = Op == OP_CALL || Op == OP_CALLCODE;

    stack.pop();  // The requested gas, already accounted for in state.call_gas.
    const auto dst = intx::be::trunc<evmc::address>(stack.pop());
    const auto value = has_value_arg ? stack.pop() : uint256{0};
    const auto has_value = value != 0;
    const auto input_offset = stack.pop();
    const auto input_size = stack.pop();
    const auto output_offset = stack.pop();
    const auto output_size = stack.pop();

    if (Op == OP_CALL && has_value && state.in_static_mode())
        return Status::static_mode_violation;

    const auto input_end = memory_end(input_offset, input_size);
    const auto output_end = memory_end(output_offset, output_size);
    if (!input_end || !output_end)
        return Status::memory_overflow;
    grow_memory(state.memory, std::max(*input_end, *output_end));

    auto gas = state.call_gas;
    state.call_gas = 0;
    if (has_value)
        gas += call_stipend;

    state.return_data.clear();

    evmc_message msg{.kind = EVMC_CALL};
    if constexpr (Op == OP_CALLCODE)
        msg.kind = EVMC_CALLCODE;
    else if constexpr (Op == OP_DELEGATECALL)
        msg.kind = EVMC_DELEGATECALL;
    msg.flags = (Op == OP_STATICCALL) ? uint32_t{EVMC_STATIC} : state.msg->flags;
    msg.depth = state.msg->depth + 1;
    msg.gas = gas;
    msg.recipient = (Op == OP_CALL || Op == OP_STATICCALL) ? dst : state.msg->recipient;
    msg.code_address = dst;
    msg.sender = (Op == OP_DELEGATECALL) ? state.msg->sender : state.msg->recipient;
    msg.value = (Op == OP_DELEGATECALL) ? state.msg->value : intx::be::store<evmc::uint256be>(value);
    if (*input_end != 0)
    {
        msg.input_data = &state.memory[static_cast<size_t>(input_offset)];
        msg.input_size = static_cast<size_t>(input_size);
    }

    // The call fails without executing anything and the forwarded gas is given back.
    if (state.msg->depth >= call_depth_limit || (has_value && !has_balance(state, value)))
    {
        stack.push(0);
        state.gas_left += gas;
        return Status::success;
    }

    const auto result = state.host->call(msg);
    state.return_data.assign(result.output_data, result.output_size);
    stack.push(result.status_code == EVMC_SUCCESS);

    if (const auto copy_size = std::min(static_cast<size_t>(output_size), result.output_size);
        copy_size > 0)
        std::memcpy(&state.memory[static_cast<size_t>(output_offset)], result.output_data, copy_size);

    state.gas_left += result.gas_left;
    return Status::success;
}

template Status call_impl<OP_CALL>(Stack&, ExecutionState&) noexcept;
template Status call_impl<OP_CALLCODE>(Stack&, ExecutionState&) noexcept;
template Status call_impl<OP_DELEGATECALL>(Stack&, ExecutionState&) noexcept;
template Status call_impl<OP_STATICCALL>(Stack&, ExecutionState&) noexcept;


template <Opcode Op>
Status create_impl(Stack& stack, ExecutionState& state) noexcept
{
    static_assert(Op == OP_CREATE || Op == OP_CREATE2);

    if (state.in_static_mode())
        return Status::static_mode_violation;

    const auto endowment = stack.pop();
    const auto init_code_offset = stack.pop();
    const auto init_code_size = stack.pop();
    const auto salt = (Op == OP_CREATE2) ? stack.pop() : uint256{};

    const auto init_code_end = memory_end(init_code_offset, init_code_size);
    if (!init_code_end)
        return Status::memory_overflow;
    grow_memory(state.memory, *init_code_end);

    state.return_data.clear();

    // All but one 64th of the remaining gas is forwarded (EIP-150).
    const auto gas = state.gas_left - state.gas_left / 64;
    state.gas_left -= gas;

    if (state.msg->depth >= call_depth_limit ||
        (endowment != 0 && !has_balance(state, endowment)))
    {
        stack.push(0);
        state.gas_left += gas;
        return Status::success;
    }

    evmc_message msg{.kind = (Op == OP_CREATE) ? EVMC_CREATE : EVMC_CREATE2};
    msg.depth = state.msg->depth + 1;
    msg.gas = gas;
    msg.sender = state.msg->recipient;
    msg.value = intx::be::store<evmc::uint256be>(endowment);
    if (*init_code_end != 0)
    {
        msg.input_data = &state.memory[static_cast<size_t>(init_code_offset)];
        msg.input_size = static_cast<size_t>(init_code_size);
    }
    if constexpr (Op == OP_CREATE2)
        msg.create2_salt = intx::be::store<evmc::bytes32>(salt);

    const auto result = state.host->call(msg);
    state.gas_left += result.gas_left;

    state.return_data.assign(result.output_data, result.output_size);
    stack.push(result.status_code == EVMC_SUCCESS ?
                   intx::be::load<uint256>(result.create_address) :
                   uint256{0});
    return Status::success;
}

template Status create_impl<OP_CREATE>(Stack&, ExecutionState&) noexcept;
template Status create_impl<OP_CREATE2>(Stack&, ExecutionState&) noexcept;
}  // namespace instr::core


namespace instr::gas
{
namespace
{
/// The common part of the pre-access-list call costs.
///
/// The stack layout is (gas, address, [value,] in_offset, in_size, out_offset, out_size).
/// Computes the gas forwarded to the callee and stores it in ExecutionState::call_gas;
/// the returned cost includes it.
template <bool HasValue>
GasCost call_cost(Stack& stack, ExecutionState& state, bool new_account_charged) noexcept
{
    constexpr int memory_args = HasValue ? 3 : 2;
    const auto& requested_gas = stack[0];
    const auto input_end = memory_end(stack[memory_args], stack[memory_args + 1]);
    const auto output_end = memory_end(stack[memory_args + 2], stack[memory_args + 3]);
    if (!input_end || !output_end)
        return {Status::gas_uint_overflow, 0};

    auto base = memory_expansion_cost(state.memory, std::max(*input_end, *output_end));
    if (base.status != Status::success)
        return base;

    if constexpr (HasValue)
    {
        if (stack[2] != 0)
        {
            uint64_t sum = 0;
            if (add_overflow(base.cost, call_value_transfer_gas, sum))
                return {Status::gas_uint_overflow, 0};
            base.cost = sum;

            if (new_account_charged &&
                state.host->account_empty(intx::be::trunc<evmc::address>(stack[1])))
            {
                if (add_overflow(base.cost, call_new_account_gas, sum))
                    return {Status::gas_uint_overflow, 0};
                base.cost = sum;
            }
        }
    }

    const auto gas_left = static_cast<uint64_t>(state.gas_left);
    if (base.cost > gas_left)
        return {Status::out_of_gas, 0};

    const auto available = gas_left - base.cost;
    const auto cap = available - available / 64;
    const auto forwarded =
        (fits_uint64(requested_gas) && static_cast<uint64_t>(requested_gas) < cap) ?
            static_cast<uint64_t>(requested_gas) :
            cap;
    state.call_gas = static_cast<int64_t>(forwarded);

    uint64_t total = 0;
    if (add_overflow(base.cost, forwarded, total))
        return {Status::gas_uint_overflow, 0};
    return {Status::success, total};
}
}  // namespace

GasCost call(Stack& stack, ExecutionState& state) noexcept
{
    return call_cost<true>(stack, state, true);
}

GasCost callcode(Stack& stack, ExecutionState& state) noexcept
{
    // The value is transferred to the current account, which cannot be created by it.
    return call_cost<true>(stack, state, false);
}

GasCost delegatecall(Stack& stack, ExecutionState& state) noexcept
{
    return call_cost<false>(stack, state, false);
}

GasCost staticcall(Stack& stack, ExecutionState& state) noexcept
{
    return call_cost<false>(stack, state, false);
}

GasCost selfdestruct_legacy(Stack& stack, ExecutionState& state) noexcept
{
    const auto beneficiary = intx::be::trunc<evmc::address>(stack[0]);
    uint64_t cost = selfdestruct_gas_eip150;

    if (state.host->account_empty(beneficiary) &&
        state.host->get_balance(state.msg->recipient) != evmc::uint256be{})
        cost += create_by_selfdestruct_gas;

    if (!state.host->has_selfdestructed(state.msg->recipient))
        state.access_list->add_refund(selfdestruct_refund_gas);
    return {Status::success, cost};
}
}  // namespace instr::gas
}  // namespace evmeter
