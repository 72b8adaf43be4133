// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0

/// The access list aware gas functions of EIP-2929 (https://eips.ethereum.org/EIPS/eip-2929).
///
/// The Operations using them carry the warm access cost (warm_storage_read_cost) as their
/// constant gas, except SLOAD whose whole cost is dynamic. The functions here add the
/// surcharge of a cold access and warm up what has been accessed.

#include "instructions.hpp"

namespace evmeter::instr::gas
{
GasCost account_check_eip2929(Stack& stack, ExecutionState& state) noexcept
{
    const auto addr = intx::be::trunc<evmc::address>(stack[0]);
    if (state.access_list->access_account(addr) == EVMC_ACCESS_COLD)
        return {Status::success, additional_cold_account_access_cost};
    return {};
}

GasCost extcodecopy_eip2929(Stack& stack, ExecutionState& state) noexcept
{
    const auto mem = extcodecopy(stack, state);
    if (mem.status != Status::success)
        return mem;

    const auto addr = intx::be::trunc<evmc::address>(stack[0]);
    if (state.access_list->access_account(addr) == EVMC_ACCESS_WARM)
        return mem;

    uint64_t total = 0;
    if (add_overflow(mem.cost, additional_cold_account_access_cost, total))
        return {Status::gas_uint_overflow, 0};
    return {Status::success, total};
}

GasCost sload_eip2929(Stack& stack, ExecutionState& state) noexcept
{
    const auto key = intx::be::store<evmc::bytes32>(stack[0]);
    if (state.access_list->access_storage(state.msg->recipient, key) == EVMC_ACCESS_COLD)
        return {Status::success, cold_sload_cost};
    return {Status::success, warm_storage_read_cost};
}

template <GasFn PriorFn>
GasCost call_eip2929(Stack& stack, ExecutionState& state) noexcept
{
    const auto addr = intx::be::trunc<evmc::address>(stack[1]);
    const bool warm = state.access_list->access_account(addr) == EVMC_ACCESS_WARM;

    // The cold surcharge is deducted before the prior calculation so that it is not
    // available for forwarding to the callee.
    if (!warm)
    {
        if (state.gas_left < static_cast<int64_t>(additional_cold_account_access_cost))
            return {Status::out_of_gas, 0};
        state.gas_left -= static_cast<int64_t>(additional_cold_account_access_cost);
    }

    const auto prior = PriorFn(stack, state);
    if (warm || prior.status != Status::success)
        return prior;

    // The surcharge is given back and charged as part of the total instead,
    // the dispatcher deducts the total at once.
    state.gas_left += static_cast<int64_t>(additional_cold_account_access_cost);
    uint64_t total = 0;
    if (add_overflow(prior.cost, additional_cold_account_access_cost, total))
        return {Status::gas_uint_overflow, 0};
    return {Status::success, total};
}

template GasCost call_eip2929<call>(Stack&, ExecutionState&) noexcept;
template GasCost call_eip2929<callcode>(Stack&, ExecutionState&) noexcept;
template GasCost call_eip2929<delegatecall>(Stack&, ExecutionState&) noexcept;
template GasCost call_eip2929<staticcall>(Stack&, ExecutionState&) noexcept;

template <bool RefundsEnabled>
GasCost selfdestruct_eip2929(Stack& stack, ExecutionState& state) noexcept
{
    const auto beneficiary = intx::be::trunc<evmc::address>(stack[0]);
    uint64_t cost = 0;

    if (state.access_list->access_account(beneficiary) == EVMC_ACCESS_COLD)
        cost = cold_account_access_cost;

    if (state.host->account_empty(beneficiary) &&
        state.host->get_balance(state.msg->recipient) != evmc::uint256be{})
        cost += create_by_selfdestruct_gas;

    if constexpr (RefundsEnabled)
    {
        if (!state.host->has_selfdestructed(state.msg->recipient))
            state.access_list->add_refund(selfdestruct_refund_gas);
    }
    return {Status::success, cost};
}

template GasCost selfdestruct_eip2929<true>(Stack&, ExecutionState&) noexcept;
template GasCost selfdestruct_eip2929<false>(Stack&, ExecutionState&) noexcept;
}  // namespace evmeter::instr::gas
