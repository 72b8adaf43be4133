// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.h>
#include <cstdint>
#include <iosfwd>
#include <string_view>

namespace evmeter
{
/// The outcome of metering or executing a single operation.
enum class Status
{
    success,

    /// The remaining gas cannot cover a constant or dynamic charge.
    out_of_gas,

    /// A gas cost or memory bound computation does not fit in 64 bits.
    gas_uint_overflow,

    /// The source or destination range of a memory copy is not representable.
    memory_overflow,

    /// SSTORE invoked with no more than the EIP-2200 sentry gas left.
    sstore_sentry,

    /// Initcode larger than the EIP-3860 limit.
    max_initcode_size_exceeded,

    stack_underflow,
    stack_overflow,
    undefined_instruction,
    static_mode_violation,

    /// Execution finished with REVERT. Not an error of the metering itself.
    revert,
};

/// The result of a gas function: either an additional gas charge or a failure status.
struct GasCost
{
    Status status = Status::success;
    uint64_t cost = 0;
};

[[nodiscard]] std::string_view get_error_message(Status status) noexcept;

/// Maps the status to the EVMC status code reported to the host.
///
/// Arithmetic overflows are reported as EVMC_OUT_OF_GAS: the host treats them the same way,
/// only diagnostics distinguish them.
[[nodiscard]] evmc_status_code to_evmc_status(Status status) noexcept;

std::ostream& operator<<(std::ostream& os, Status status) noexcept;
}  // namespace evmeter
