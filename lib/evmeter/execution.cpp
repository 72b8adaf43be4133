// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0

#include "execution.hpp"
#include "tracing.hpp"

namespace evmeter
{
namespace
{
Status check_and_charge(const Operation& op, ExecutionState& state, GasCost& dynamic) noexcept
{
    if (!op.is_defined())
        return Status::undefined_instruction;

    const auto stack_height = state.stack.size();
    if (stack_height < op.min_stack)
        return Status::stack_underflow;
    if (stack_height > op.max_stack)
        return Status::stack_overflow;

    if (static_cast<uint64_t>(state.gas_left) < op.constant_gas)
        return Status::out_of_gas;
    state.gas_left -= static_cast<int64_t>(op.constant_gas);

    if (op.dynamic_gas != nullptr)
    {
        dynamic = op.dynamic_gas(state.stack, state);
        if (dynamic.status != Status::success)
            return dynamic.status;
        if (static_cast<uint64_t>(state.gas_left) < dynamic.cost)
            return Status::out_of_gas;
        state.gas_left -= static_cast<int64_t>(dynamic.cost);
    }
    return Status::success;
}
}  // namespace

Status step(const JumpTable& table, uint8_t opcode, ExecutionState& state, Tracer* tracer) noexcept
{
    const auto& op = table[opcode];
    if (tracer != nullptr)
        tracer->notify_pre_charge(opcode, op, state);

    GasCost dynamic;
    if (const auto status = check_and_charge(op, state, dynamic); status != Status::success)
    {
        if (tracer != nullptr)
            tracer->notify_error(opcode, status, state);
        return status;
    }

    if (tracer != nullptr)
        tracer->notify_post_charge(opcode, op.constant_gas, dynamic.cost, state);

    const auto status = op.execute(state.stack, state);
    if (status != Status::success && tracer != nullptr)
        tracer->notify_error(opcode, status, state);
    return status;
}
}  // namespace evmeter
