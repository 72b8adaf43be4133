// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0

#include "status.hpp"
#include <ostream>

namespace evmeter
{
std::string_view get_error_message(Status status) noexcept
{
    switch (status)
    {
    case Status::success:
        return "success";
    case Status::out_of_gas:
        return "out of gas";
    case Status::gas_uint_overflow:
        return "gas uint64 overflow";
    case Status::memory_overflow:
        return "memory overflow";
    case Status::sstore_sentry:
        return "not enough gas for reentrancy sentry";
    case Status::max_initcode_size_exceeded:
        return "max initcode size exceeded";
    case Status::stack_underflow:
        return "stack underflow";
    case Status::stack_overflow:
        return "stack overflow";
    case Status::undefined_instruction:
        return "undefined instruction";
    case Status::static_mode_violation:
        return "static mode violation";
    case Status::revert:
        return "execution reverted";
    }
    return "<unknown>";
}

evmc_status_code to_evmc_status(Status status) noexcept
{
    switch (status)
    {
    case Status::success:
        return EVMC_SUCCESS;
    case Status::out_of_gas:
    case Status::gas_uint_overflow:
    case Status::sstore_sentry:
    case Status::max_initcode_size_exceeded:
        return EVMC_OUT_OF_GAS;
    case Status::memory_overflow:
        return EVMC_INVALID_MEMORY_ACCESS;
    case Status::stack_underflow:
        return EVMC_STACK_UNDERFLOW;
    case Status::stack_overflow:
        return EVMC_STACK_OVERFLOW;
    case Status::undefined_instruction:
        return EVMC_UNDEFINED_INSTRUCTION;
    case Status::static_mode_violation:
        return EVMC_STATIC_MODE_VIOLATION;
    case Status::revert:
        return EVMC_REVERT;
    }
    return EVMC_INTERNAL_ERROR;
}

std::ostream& operator<<(std::ostream& os, Status status) noexcept
{
    os << get_error_message(status);
    return os;
}
}  // namespace evmeter
