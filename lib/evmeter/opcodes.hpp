// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>

namespace evmeter
{
/// The EVM opcodes known to evmeter.
///
/// This is not enum class because we want implicit conversion to integers,
/// e.g. for usage as an array index.
enum Opcode : uint8_t
{
    OP_STOP = 0x00,
    OP_ADD = 0x01,
    OP_MUL = 0x02,
    OP_SUB = 0x03,

    OP_ADDRESS = 0x30,
    OP_BALANCE = 0x31,
    OP_CALLER = 0x33,
    OP_CALLVALUE = 0x34,
    OP_CALLDATACOPY = 0x37,
    OP_EXTCODESIZE = 0x3b,
    OP_EXTCODECOPY = 0x3c,
    OP_EXTCODEHASH = 0x3f,

    OP_CHAINID = 0x46,
    OP_SELFBALANCE = 0x47,
    OP_BASEFEE = 0x48,

    OP_POP = 0x50,
    OP_MLOAD = 0x51,
    OP_MSTORE = 0x52,
    OP_MSTORE8 = 0x53,
    OP_SLOAD = 0x54,
    OP_SSTORE = 0x55,
    OP_MSIZE = 0x59,
    OP_GAS = 0x5a,
    OP_MCOPY = 0x5e,
    OP_PUSH0 = 0x5f,

    OP_DUP1 = 0x80,
    OP_DUP16 = 0x8f,
    OP_SWAP1 = 0x90,
    OP_SWAP16 = 0x9f,

    OP_CREATE = 0xf0,
    OP_CALL = 0xf1,
    OP_CALLCODE = 0xf2,
    OP_RETURN = 0xf3,
    OP_DELEGATECALL = 0xf4,
    OP_CREATE2 = 0xf5,
    OP_STATICCALL = 0xfa,
    OP_REVERT = 0xfd,
    OP_SELFDESTRUCT = 0xff,
};
}  // namespace evmeter
