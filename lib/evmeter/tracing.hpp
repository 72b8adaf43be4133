// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "status.hpp"
#include <cstdint>
#include <memory>
#include <ostream>

namespace evmeter
{
class ExecutionState;
struct Operation;

/// The optional observer of the metering done by step().
///
/// Tracers form a chain: every notification is passed to the next tracer after this one.
class Tracer
{
    std::unique_ptr<Tracer> m_next_tracer;

public:
    virtual ~Tracer() = default;

    /// Appends the tracer at the end of the chain.
    void add_tracer(std::unique_ptr<Tracer> tracer) noexcept  // NOLINT(misc-no-recursion)
    {
        if (m_next_tracer)
            m_next_tracer->add_tracer(std::move(tracer));
        else
            m_next_tracer = std::move(tracer);
    }

    /// Before any gas of the operation is charged.
    void notify_pre_charge(  // NOLINT(misc-no-recursion)
        uint8_t opcode, const Operation& op, const ExecutionState& state) noexcept
    {
        on_pre_charge(opcode, op, state);
        if (m_next_tracer)
            m_next_tracer->notify_pre_charge(opcode, op, state);
    }

    /// After the constant and dynamic gas have been charged, before the execution.
    void notify_post_charge(  // NOLINT(misc-no-recursion)
        uint8_t opcode, uint64_t constant_gas, uint64_t dynamic_gas,
        const ExecutionState& state) noexcept
    {
        on_post_charge(opcode, constant_gas, dynamic_gas, state);
        if (m_next_tracer)
            m_next_tracer->notify_post_charge(opcode, constant_gas, dynamic_gas, state);
    }

    /// When the operation fails in the metering or in the execution.
    void notify_error(  // NOLINT(misc-no-recursion)
        uint8_t opcode, Status status, const ExecutionState& state) noexcept
    {
        on_error(opcode, status, state);
        if (m_next_tracer)
            m_next_tracer->notify_error(opcode, status, state);
    }

private:
    virtual void on_pre_charge(
        uint8_t opcode, const Operation& op, const ExecutionState& state) noexcept = 0;
    virtual void on_post_charge(uint8_t opcode, uint64_t constant_gas, uint64_t dynamic_gas,
        const ExecutionState& state) noexcept = 0;
    virtual void on_error(uint8_t opcode, Status status, const ExecutionState& state) noexcept = 0;
};

/// Creates the tracer reporting every charge and every error as a line of JSON.
///
/// @param out  Report output stream.
std::unique_ptr<Tracer> create_gas_tracer(std::ostream& out);

/// Creates the tracer accumulating the charged gas per opcode and reporting it
/// in CSV format when destroyed.
std::unique_ptr<Tracer> create_gas_histogram_tracer(std::ostream& out);
}  // namespace evmeter
