// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0

#include <evmc/hex.hpp>
#include <evmeter/eips.hpp>
#include <evmeter/evmeter.h>
#include <evmeter/execution.hpp>
#include <evmeter/tracing.hpp>
#include <iostream>
#include <map>
#include <string_view>
#include <utility>
#include <vector>

namespace
{
/// The state with no accounts except the storage written during the demo.
class DemoState : public evmeter::StateHost
{
    std::map<evmc::bytes32, evmc::bytes32> m_storage;

public:
    bool account_exists(const evmc::address& /*addr*/) const noexcept override { return false; }
    bool account_empty(const evmc::address& /*addr*/) const noexcept override { return true; }
    evmc::uint256be get_balance(const evmc::address& /*addr*/) const noexcept override
    {
        return {};
    }
    size_t get_code_size(const evmc::address& /*addr*/) const noexcept override { return 0; }
    evmc::bytes32 get_code_hash(const evmc::address& /*addr*/) const noexcept override
    {
        return {};
    }
    size_t copy_code(const evmc::address& /*addr*/, size_t /*code_offset*/,
        uint8_t* /*buffer_data*/, size_t /*buffer_size*/) const noexcept override
    {
        return 0;
    }
    evmc::bytes32 get_storage(
        const evmc::address& /*addr*/, const evmc::bytes32& key) const noexcept override
    {
        const auto it = m_storage.find(key);
        return it != m_storage.end() ? it->second : evmc::bytes32{};
    }
    evmc::bytes32 get_committed_storage(
        const evmc::address& /*addr*/, const evmc::bytes32& /*key*/) const noexcept override
    {
        return {};
    }
    void set_storage(const evmc::address& /*addr*/, const evmc::bytes32& key,
        const evmc::bytes32& value) noexcept override
    {
        m_storage[key] = value;
    }
    bool has_selfdestructed(const evmc::address& /*addr*/) const noexcept override { return false; }
    bool selfdestruct(
        const evmc::address& /*addr*/, const evmc::address& /*beneficiary*/) noexcept override
    {
        return true;
    }
    evmc::Result call(const evmc_message& msg) noexcept override
    {
        return evmc::Result{EVMC_SUCCESS, msg.gas};
    }
    evmc_tx_context get_tx_context() const noexcept override { return {}; }
};

void print_table(std::ostream& out, const evmeter::JumpTable& table)
{
    for (size_t i = 0; i < 256; ++i)
    {
        const auto& op = table[static_cast<uint8_t>(i)];
        if (!op.is_defined())
            continue;
        out << "0x" << evmc::hex(static_cast<uint8_t>(i)) << ' '
            << evmeter::instr::traits[i].name << " constant_gas=" << op.constant_gas
            << " dynamic_gas=" << (op.dynamic_gas != nullptr ? "yes" : "no")
            << " min_stack=" << op.min_stack << " max_stack=" << op.max_stack
            << (op.halts ? " halts" : "") << '\n';
    }
}

/// Meters a few storage and memory instructions with the gas tracer attached.
void trace_demo(std::ostream& out, const evmeter::JumpTable& table)
{
    using namespace evmc::literals;

    DemoState state_host;
    evmeter::AccessList access_list;
    evmc_message msg{};
    msg.gas = 1000000;
    msg.recipient = 0x0000000000000000000000000000000000000001_address;

    evmeter::ExecutionState state{msg, state_host, access_list};
    const auto tracer = evmeter::create_gas_tracer(out);

    // Two reads of the same slot, a write, and a memory store copied by MCOPY if enabled.
    // The arguments are pushed in reverse order: the last one ends up on top.
    const std::pair<evmeter::Opcode, std::vector<intx::uint256>> program[] = {
        {evmeter::OP_SLOAD, {1}},
        {evmeter::OP_SLOAD, {1}},
        {evmeter::OP_SSTORE, {0x2a, 1}},
        {evmeter::OP_MSTORE, {0xff, 0}},
        {evmeter::OP_MCOPY, {0, 0x20, 0x20}},
    };

    for (const auto& [opcode, args] : program)
    {
        state.stack.clear();
        for (const auto& arg : args)
            state.stack.push(arg);

        if (const auto status = evmeter::step(table, opcode, state, tracer.get());
            status != evmeter::Status::success)
        {
            out << "Stopped at " << evmeter::instr::traits[opcode].name << ": " << status << '\n';
            break;
        }
    }

    out << "Gas used: " << msg.gas - state.gas_left << "\nRefund:   " << access_list.refund()
        << '\n';
}
}  // namespace

int main(int argc, const char* argv[])
{
    using namespace std::literals;

    auto& out = std::cout;
    bool dormant = false;
    bool trace = false;

    while (argc >= 2 && std::string_view{argv[1]}.starts_with("--"))
    {
        if (argv[1] == "--dormant"sv)
            dormant = true;
        else if (argv[1] == "--trace"sv)
            trace = true;
        else if (argv[1] == "--version"sv)
        {
            out << "evmeter " << evmeter::version() << '\n';
            return 0;
        }
        else
        {
            std::cerr << "Unknown option: " << argv[1] << '\n';
            return -4;
        }
        --argc;
        ++argv;
    }

    const auto registry =
        dormant ? evmeter::FeatureRegistry::create_with_dormant() : evmeter::default_registry();

    if (argc < 2)
    {
        out << "Available features:";
        for (const auto& name : registry.activatable_features())
            out << ' ' << name;
        out << '\n';
        return 0;
    }

    const auto features = evmeter::parse_feature_list(argv[1]);
    auto result = registry.build(features);
    if (const auto* error = std::get_if<evmeter::ConfigError>(&result))
    {
        std::cerr << "Configuration error: " << *error << '\n';
        return -3;
    }

    const auto& table = *std::get<evmeter::JumpTablePtr>(result);
    if (trace)
        trace_demo(out, table);
    else
        print_table(out, table);
    return 0;
}
