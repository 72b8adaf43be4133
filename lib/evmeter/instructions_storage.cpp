// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0

#include "instructions.hpp"

namespace evmeter
{
namespace instr::core
{
Status sload(Stack& stack, ExecutionState& state) noexcept
{
    auto& x = stack.top();
    const auto key = intx::be::store<evmc::bytes32>(x);
    x = intx::be::load<uint256>(state.host->get_storage(state.msg->recipient, key));
    return Status::success;
}

Status sstore(Stack& stack, ExecutionState& state) noexcept
{
    if (state.in_static_mode())
        return Status::static_mode_violation;

    const auto key = intx::be::store<evmc::bytes32>(stack.pop());
    const auto value = intx::be::store<evmc::bytes32>(stack.pop());
    state.host->set_storage(state.msg->recipient, key, value);
    return Status::success;
}
}  // namespace instr::core


namespace instr::gas
{
namespace
{
/// The prices of a net gas metered storage write schedule.
struct NetStorageCosts
{
    /// The cost of a no-op write and of a write to an already dirty slot.
    uint64_t dirty;

    /// The cost of creating a slot (zero to non-zero).
    uint64_t set;

    /// The cost of modifying a clean non-zero slot.
    uint64_t reset;

    /// The refund for clearing a slot.
    int64_t clear_refund;

    /// Cold slots are charged the additional cold_sload_cost and warmed up.
    bool access_list;
};

constexpr NetStorageCosts net_storage_costs(SstoreSchedule schedule) noexcept
{
    switch (schedule)
    {
    case SstoreSchedule::eip2200:
        return {sload_gas_eip2200, sstore_set_gas, sstore_reset_gas,
            sstore_clears_schedule_refund_eip2200, false};
    case SstoreSchedule::eip2929:
        return {warm_storage_read_cost, sstore_set_gas, sstore_reset_gas - cold_sload_cost,
            sstore_clears_schedule_refund_eip2200, true};
    case SstoreSchedule::eip3529:
        return {warm_storage_read_cost, sstore_set_gas, sstore_reset_gas - cold_sload_cost,
            sstore_clears_schedule_refund_eip3529, true};
    }
    return {};
}

constexpr bool is_zero(const evmc::bytes32& x) noexcept
{
    return x == evmc::bytes32{};
}
}  // namespace

GasCost sstore_legacy(Stack& stack, ExecutionState& state) noexcept
{
    const auto key = intx::be::store<evmc::bytes32>(stack[0]);
    const auto current = state.host->get_storage(state.msg->recipient, key);
    const bool value_is_zero = stack[1] == 0;

    if (is_zero(current) && !value_is_zero)
        return {Status::success, sstore_set_gas};
    if (!is_zero(current) && value_is_zero)
        state.access_list->add_refund(sstore_refund_gas);
    return {Status::success, sstore_reset_gas};
}

template <SstoreSchedule S>
GasCost sstore(Stack& stack, ExecutionState& state) noexcept
{
    constexpr auto c = net_storage_costs(S);

    // The reentrancy sentry goes first: nothing is read and no slot is warmed
    // when it fails.
    if (state.gas_left <= static_cast<int64_t>(sstore_sentry_gas_eip2200))
        return {Status::sstore_sentry, 0};

    const auto& addr = state.msg->recipient;
    const auto key = intx::be::store<evmc::bytes32>(stack[0]);
    const auto value = intx::be::store<evmc::bytes32>(stack[1]);
    auto& ledger = *state.access_list;

    uint64_t cold_cost = 0;
    if constexpr (c.access_list)
    {
        if (ledger.access_storage(addr, key) == EVMC_ACCESS_COLD)
            cold_cost = cold_sload_cost;
    }

    const auto current = state.host->get_storage(addr, key);
    if (current == value)  // No-op.
        return {Status::success, cold_cost + c.dirty};

    const auto original = state.host->get_committed_storage(addr, key);
    if (original == current)  // Clean slot.
    {
        if (is_zero(original))
            return {Status::success, cold_cost + c.set};
        if (is_zero(value))
            ledger.add_refund(c.clear_refund);
        return {Status::success, cold_cost + c.reset};
    }

    // Dirty slot.
    if (!is_zero(original))
    {
        if (is_zero(current))  // Recreating a slot cleared earlier in the transaction.
            ledger.sub_refund(c.clear_refund);
        else if (is_zero(value))
            ledger.add_refund(c.clear_refund);
    }
    if (original == value)  // Restoring the original value.
    {
        if (is_zero(original))
            ledger.add_refund(static_cast<int64_t>(c.set - c.dirty));
        else
            ledger.add_refund(static_cast<int64_t>(c.reset - c.dirty));
    }
    return {Status::success, cold_cost + c.dirty};
}

template GasCost sstore<SstoreSchedule::eip2200>(Stack&, ExecutionState&) noexcept;
template GasCost sstore<SstoreSchedule::eip2929>(Stack&, ExecutionState&) noexcept;
template GasCost sstore<SstoreSchedule::eip3529>(Stack&, ExecutionState&) noexcept;
}  // namespace instr::gas
}  // namespace evmeter
