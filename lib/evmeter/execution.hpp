// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "execution_state.hpp"
#include "jump_table.hpp"
#include "status.hpp"

namespace evmeter
{
class Tracer;

/// Meters and executes a single instruction.
///
/// The order is: stack bounds check, constant gas, dynamic gas, execution. Nothing is
/// deducted for a charge the frame cannot afford. The side effects of the dynamic gas
/// function (warm accounts and slots, refunds) are kept even if the charge fails.
///
/// @param table   The dispatch table of the protocol version.
/// @param opcode  The instruction to run.
/// @param state   The call frame state.
/// @param tracer  The optional tracer notified about the charges and errors.
/// @return        Status::success or Status::revert if the instruction executed,
///                the failure otherwise.
Status step(const JumpTable& table, uint8_t opcode, ExecutionState& state,
    Tracer* tracer = nullptr) noexcept;
}  // namespace evmeter
