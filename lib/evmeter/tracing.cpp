// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0

#include "tracing.hpp"
#include "execution_state.hpp"
#include "instructions_traits.hpp"
#include "jump_table.hpp"
#include <evmc/hex.hpp>
#include <array>

namespace evmeter
{
namespace
{
std::string get_name(uint8_t opcode)
{
    const auto name = instr::traits[opcode].name;
    return (name != nullptr) ? name : "0x" + evmc::hex(opcode);
}

class GasTracer : public Tracer
{
    std::ostream& m_out;  ///< Output stream.

    void on_pre_charge(
        uint8_t opcode, const Operation& op, const ExecutionState& state) noexcept override
    {
        m_out << "{";
        m_out << R"("event":"pre")";
        m_out << R"(,"op":)" << int{opcode};
        m_out << R"(,"opName":")" << get_name(opcode) << '"';
        m_out << R"(,"gas":)" << state.gas_left;
        m_out << R"(,"constantGas":)" << op.constant_gas;
        m_out << R"(,"stackHeight":)" << state.stack.size();
        m_out << R"(,"memSize":)" << state.memory.size();
        m_out << "}\n";
    }

    void on_post_charge(uint8_t opcode, uint64_t constant_gas, uint64_t dynamic_gas,
        const ExecutionState& state) noexcept override
    {
        m_out << "{";
        m_out << R"("event":"charge")";
        m_out << R"(,"op":)" << int{opcode};
        m_out << R"(,"opName":")" << get_name(opcode) << '"';
        m_out << R"(,"constantGas":)" << constant_gas;
        m_out << R"(,"dynamicGas":)" << dynamic_gas;
        m_out << R"(,"gas":)" << state.gas_left;
        if (state.access_list != nullptr)
            m_out << R"(,"refund":)" << state.access_list->refund();
        m_out << "}\n";
    }

    void on_error(uint8_t opcode, Status status, const ExecutionState& state) noexcept override
    {
        m_out << "{";
        m_out << R"("event":"error")";
        m_out << R"(,"op":)" << int{opcode};
        m_out << R"(,"opName":")" << get_name(opcode) << '"';
        m_out << R"(,"error":")" << status << '"';
        m_out << R"(,"gas":)" << state.gas_left;
        m_out << "}\n";
    }

public:
    explicit GasTracer(std::ostream& out) noexcept : m_out{out}
    {
        m_out << std::dec;  // JSON does not support other number formats.
    }
};

/// @see create_gas_histogram_tracer()
class GasHistogramTracer : public Tracer
{
    struct Counter
    {
        uint64_t count = 0;
        uint64_t gas = 0;
        uint64_t errors = 0;
    };

    std::array<Counter, 256> m_counters{};
    std::ostream& m_out;

    void on_pre_charge(uint8_t /*opcode*/, const Operation& /*op*/,
        const ExecutionState& /*state*/) noexcept override
    {}

    void on_post_charge(uint8_t opcode, uint64_t constant_gas, uint64_t dynamic_gas,
        const ExecutionState& /*state*/) noexcept override
    {
        auto& c = m_counters[opcode];
        ++c.count;
        c.gas += constant_gas + dynamic_gas;
    }

    void on_error(
        uint8_t opcode, Status /*status*/, const ExecutionState& /*state*/) noexcept override
    {
        ++m_counters[opcode].errors;
    }

public:
    explicit GasHistogramTracer(std::ostream& out) noexcept : m_out{out} {}

    ~GasHistogramTracer() noexcept override
    {
        m_out << "--- # GAS HISTOGRAM\nopcode,count,gas,errors\n";
        for (size_t i = 0; i < m_counters.size(); ++i)
        {
            const auto& c = m_counters[i];
            if (c.count != 0 || c.errors != 0)
            {
                m_out << get_name(static_cast<uint8_t>(i)) << ',' << c.count << ',' << c.gas << ','
                      << c.errors << '\n';
            }
        }
    }
};
}  // namespace

std::unique_ptr<Tracer> create_gas_tracer(std::ostream& out)
{
    return std::make_unique<GasTracer>(out);
}

std::unique_ptr<Tracer> create_gas_histogram_tracer(std::ostream& out)
{
    return std::make_unique<GasHistogramTracer>(out);
}
}  // namespace evmeter
