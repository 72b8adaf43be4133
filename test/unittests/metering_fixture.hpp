// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmeter/eips.hpp>
#include <evmeter/execution.hpp>
#include <gtest/gtest.h>
#include <intx/intx.hpp>
#include <test/utils/host_mock.hpp>
#include <initializer_list>
#include <iterator>
#include <string>
#include <vector>

namespace evmeter::test
{
using namespace evmc::literals;
using intx::uint256;

/// The test fixture owning a call frame: its state host, access list, message and ExecutionState.
class metering : public testing::Test
{
protected:
    static constexpr int64_t default_gas = 1000000;
    static constexpr auto sender = 0x00000000000000000000000000000000005e0de7_address;
    static constexpr auto recipient = 0x000000000000000000000000000000000000c0de_address;

    MockedHost host;
    AccessList access_list;
    evmc_message msg{};
    ExecutionState state;

    metering() noexcept
    {
        msg.gas = default_gas;
        msg.sender = sender;
        msg.recipient = recipient;
        state.reset(msg, host, access_list);
    }

    /// Builds the table from the base table with the default registry (and the dormant features).
    static JumpTablePtr build(const std::vector<std::string>& features, bool with_dormant = false)
    {
        const auto registry = with_dormant ? FeatureRegistry::create_with_dormant() :
                                             FeatureRegistry::create_default();
        auto result = registry.build(features);
        const auto* table = std::get_if<JumpTablePtr>(&result);
        EXPECT_NE(table, nullptr);
        return table != nullptr ? *table : nullptr;
    }

    /// Pushes the instruction arguments given in the operand order: the first one ends up on top.
    void push_args(std::initializer_list<uint256> args)
    {
        for (auto it = std::rbegin(args); it != std::rend(args); ++it)
            state.stack.push(*it);
    }

    /// Runs the instruction and returns the gas it consumed.
    int64_t gas_used_by(const JumpTable& table, Opcode opcode, Status expected = Status::success)
    {
        const auto gas_before = state.gas_left;
        EXPECT_EQ(step(table, opcode, state), expected);
        return gas_before - state.gas_left;
    }

    /// Sets the storage slot of the recipient: its value at transaction start and the current one.
    void set_slot(const evmc::bytes32& key, uint64_t original, uint64_t current)
    {
        host.accounts[recipient].storage[key] = {
            intx::be::store<evmc::bytes32>(uint256{original}),
            intx::be::store<evmc::bytes32>(uint256{current})};
    }
};
}  // namespace evmeter::test
