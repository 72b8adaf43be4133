// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "execution_state.hpp"
#include "instructions_traits.hpp"
#include "status.hpp"
#include <array>
#include <memory>

namespace evmeter
{
/// The instruction implementation.
using ExecuteFn = Status (*)(Stack& stack, ExecutionState& state) noexcept;

/// The dynamic gas function. May modify the transaction's AccessList.
using DynamicGasFn = GasCost (*)(Stack& stack, ExecutionState& state) noexcept;

/// The behavior of one opcode in one protocol version.
struct Operation
{
    ExecuteFn execute = nullptr;

    /// The gas charged unconditionally before the dynamic gas function and the execution.
    uint64_t constant_gas = 0;

    /// The optional state dependent gas charged on top of the constant gas.
    DynamicGasFn dynamic_gas = nullptr;

    /// The minimum stack height required before the execution.
    int min_stack = 0;

    /// The maximum stack height allowed before the execution.
    int max_stack = 0;

    /// The execution of the frame ends after this instruction.
    bool halts = false;

    /// Checks if the opcode is defined (has an implementation other than the undefined marker).
    [[nodiscard]] bool is_defined() const noexcept;

    bool operator==(const Operation&) const noexcept = default;
};

/// The descriptor of unassigned opcodes.
extern const Operation undefined_operation;

/// Creates the Operation for the opcode with the stack bounds derived from its traits.
[[nodiscard]] Operation make_operation(Opcode opcode, ExecuteFn execute, uint64_t constant_gas,
    DynamicGasFn dynamic_gas = nullptr, bool halts = false) noexcept;

/// The mutable table a builder works on. Only activators modify it.
using OperationTable = std::array<Operation, 256>;

/// Returns the base table: the Petersburg instruction set known to evmeter,
/// the starting point of every protocol version.
[[nodiscard]] OperationTable make_base_table() noexcept;


/// The frozen dispatch table of one protocol version.
///
/// It is created only by FeatureRegistry::build() and cannot be modified afterwards,
/// so it can be shared by concurrently executing frames.
class JumpTable
{
    OperationTable m_operations;

    explicit JumpTable(OperationTable&& operations) noexcept : m_operations{std::move(operations)}
    {}

    friend class FeatureRegistry;

public:
    [[nodiscard]] const Operation& operator[](uint8_t opcode) const noexcept
    {
        return m_operations[opcode];
    }

    [[nodiscard]] const OperationTable& operations() const noexcept { return m_operations; }

    bool operator==(const JumpTable&) const noexcept = default;
};

using JumpTablePtr = std::shared_ptr<const JumpTable>;
}  // namespace evmeter
