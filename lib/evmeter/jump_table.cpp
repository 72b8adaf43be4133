// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0

#include "jump_table.hpp"
#include "instructions.hpp"
#include <utility>

namespace evmeter
{
const Operation undefined_operation{instr::core::undefined, 0, nullptr, 0, instr::stack_limit, true};

bool Operation::is_defined() const noexcept
{
    return execute != nullptr && execute != instr::core::undefined;
}

Operation make_operation(Opcode opcode, ExecuteFn execute, uint64_t constant_gas,
    DynamicGasFn dynamic_gas, bool halts) noexcept
{
    const auto& tr = instr::traits[opcode];
    return {execute, constant_gas, dynamic_gas, instr::min_stack(tr), instr::max_stack(tr), halts};
}

namespace
{
template <size_t... N>
void set_dup_swap(OperationTable& table, std::index_sequence<N...>) noexcept
{
    ((table[OP_DUP1 + N] =
             make_operation(static_cast<Opcode>(OP_DUP1 + N), instr::core::dup<N + 1>,
                 instr::gas_fastest_step)),
        ...);
    ((table[OP_SWAP1 + N] =
             make_operation(static_cast<Opcode>(OP_SWAP1 + N), instr::core::swap<N + 1>,
                 instr::gas_fastest_step)),
        ...);
}
}  // namespace

OperationTable make_base_table() noexcept
{
    using namespace instr;
    namespace core = instr::core;
    namespace gas = instr::gas;

    OperationTable table;
    table.fill(undefined_operation);

    table[OP_STOP] = make_operation(OP_STOP, core::stop, 0, nullptr, true);
    table[OP_ADD] = make_operation(OP_ADD, core::add, gas_fastest_step);
    table[OP_MUL] = make_operation(OP_MUL, core::mul, gas_fast_step);
    table[OP_SUB] = make_operation(OP_SUB, core::sub, gas_fastest_step);

    table[OP_ADDRESS] = make_operation(OP_ADDRESS, core::address, gas_quick_step);
    table[OP_BALANCE] = make_operation(OP_BALANCE, core::balance, balance_gas_eip150);
    table[OP_CALLER] = make_operation(OP_CALLER, core::caller, gas_quick_step);
    table[OP_CALLVALUE] = make_operation(OP_CALLVALUE, core::callvalue, gas_quick_step);
    table[OP_CALLDATACOPY] =
        make_operation(OP_CALLDATACOPY, core::calldatacopy, gas_fastest_step, gas::calldatacopy);
    table[OP_EXTCODESIZE] = make_operation(OP_EXTCODESIZE, core::extcodesize, extcodesize_gas_eip150);
    table[OP_EXTCODECOPY] =
        make_operation(OP_EXTCODECOPY, core::extcodecopy, extcodecopy_base_eip150, gas::extcodecopy);
    table[OP_EXTCODEHASH] =
        make_operation(OP_EXTCODEHASH, core::extcodehash, extcodehash_gas_constantinople);

    table[OP_POP] = make_operation(OP_POP, core::pop, gas_quick_step);
    table[OP_MLOAD] = make_operation(OP_MLOAD, core::mload, gas_fastest_step, gas::mload);
    table[OP_MSTORE] = make_operation(OP_MSTORE, core::mstore, gas_fastest_step, gas::mstore);
    table[OP_MSTORE8] = make_operation(OP_MSTORE8, core::mstore8, gas_fastest_step, gas::mstore8);
    table[OP_SLOAD] = make_operation(OP_SLOAD, core::sload, sload_gas_eip150);
    table[OP_SSTORE] = make_operation(OP_SSTORE, core::sstore, 0, gas::sstore_legacy);
    table[OP_MSIZE] = make_operation(OP_MSIZE, core::msize, gas_quick_step);
    table[OP_GAS] = make_operation(OP_GAS, core::gas, gas_quick_step);

    set_dup_swap(table, std::make_index_sequence<16>{});

    table[OP_CREATE] = make_operation(OP_CREATE, core::create, create_gas, gas::create);
    table[OP_CALL] = make_operation(OP_CALL, core::call, call_gas_eip150, gas::call);
    table[OP_CALLCODE] = make_operation(OP_CALLCODE, core::callcode, call_gas_eip150, gas::callcode);
    table[OP_RETURN] = make_operation(OP_RETURN, core::return_, 0, gas::return_, true);
    table[OP_DELEGATECALL] =
        make_operation(OP_DELEGATECALL, core::delegatecall, call_gas_eip150, gas::delegatecall);
    table[OP_CREATE2] = make_operation(OP_CREATE2, core::create2, create_gas, gas::create2);
    table[OP_STATICCALL] =
        make_operation(OP_STATICCALL, core::staticcall, call_gas_eip150, gas::staticcall);
    table[OP_REVERT] = make_operation(OP_REVERT, core::revert, 0, gas::return_, true);
    table[OP_SELFDESTRUCT] = make_operation(
        OP_SELFDESTRUCT, core::selfdestruct, 0, gas::selfdestruct_legacy, true);

    return table;
}
}  // namespace evmeter
