// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0

#include "metering_fixture.hpp"
#include <evmeter/tracing.hpp>
#include <gmock/gmock.h>
#include <sstream>

using namespace evmeter;
using namespace evmc::literals;
using namespace testing;
using evmeter::test::metering;

namespace
{
class tracing : public metering
{
protected:
    JumpTablePtr berlin = build({"ethereum_1884", "ethereum_2200", "ethereum_2929"});

    std::ostringstream trace_stream;

    /// Records the notifications as a compact text.
    class EventTracer final : public Tracer
    {
        std::string m_name;
        std::ostringstream& m_trace;

        void on_pre_charge(uint8_t opcode, const Operation& /*op*/,
            const ExecutionState& /*state*/) noexcept override
        {
            m_trace << m_name << "pre:" << instr::traits[opcode].name << " ";
        }

        void on_post_charge(uint8_t /*opcode*/, uint64_t constant_gas, uint64_t dynamic_gas,
            const ExecutionState& /*state*/) noexcept override
        {
            m_trace << m_name << "charge:" << constant_gas << "+" << dynamic_gas << " ";
        }

        void on_error(uint8_t /*opcode*/, Status status,
            const ExecutionState& /*state*/) noexcept override
        {
            m_trace << m_name << "error:" << status << " ";
        }

    public:
        EventTracer(tracing& parent, std::string name) noexcept
          : m_name{std::move(name)}, m_trace{parent.trace_stream}
        {}
    };

    std::string trace(uint8_t opcode, Tracer& tracer)
    {
        step(*berlin, opcode, state, &tracer);
        auto result = trace_stream.str();
        trace_stream.str({});
        return result;
    }
};
}  // namespace

TEST_F(tracing, no_tracer)
{
    push_args({1});
    EXPECT_EQ(step(*berlin, OP_SLOAD, state, nullptr), Status::success);
    EXPECT_EQ(trace_stream.str(), "");
}

TEST_F(tracing, events)
{
    EventTracer tracer{*this, ""};

    push_args({1});
    EXPECT_EQ(trace(OP_SLOAD, tracer), "pre:SLOAD charge:0+2100 ");

    EXPECT_EQ(trace(OP_ADD, tracer), "pre:ADD error:stack underflow ");

    state.gas_left = 99;
    EXPECT_EQ(trace(OP_BALANCE, tracer), "pre:BALANCE error:out of gas ");
}

TEST_F(tracing, execution_error)
{
    EventTracer tracer{*this, ""};
    msg.flags = EVMC_STATIC;
    push_args({1, 1});
    access_list.add(recipient, intx::be::store<evmc::bytes32>(uint256{1}));
    EXPECT_EQ(trace(OP_SSTORE, tracer),
        "pre:SSTORE charge:0+20000 error:static mode violation ");
}

TEST_F(tracing, chain)
{
    EventTracer tracer{*this, "A"};
    tracer.add_tracer(std::make_unique<EventTracer>(*this, "B"));
    tracer.add_tracer(std::make_unique<EventTracer>(*this, "C"));

    EXPECT_EQ(trace(OP_PUSH0, tracer), "Apre:PUSH0 Bpre:PUSH0 Cpre:PUSH0 "
                                       "Aerror:undefined instruction Berror:undefined instruction "
                                       "Cerror:undefined instruction ");
}

TEST_F(tracing, gas_tracer)
{
    auto tracer = create_gas_tracer(trace_stream);

    push_args({1});
    EXPECT_EQ(trace(OP_SLOAD, *tracer),
        R"({"event":"pre","op":84,"opName":"SLOAD","gas":1000000,"constantGas":0,"stackHeight":1,"memSize":0}
{"event":"charge","op":84,"opName":"SLOAD","constantGas":0,"dynamicGas":2100,"gas":997900,"refund":0}
)");

    EXPECT_EQ(trace(0x0c, *tracer),
        R"({"event":"pre","op":12,"opName":"0x0c","gas":997900,"constantGas":0,"stackHeight":1,"memSize":0}
{"event":"error","op":12,"opName":"0x0c","error":"undefined instruction","gas":997900}
)");
}

TEST_F(tracing, gas_tracer_refund)
{
    auto tracer = create_gas_tracer(trace_stream);
    set_slot(0x01_bytes32, 5, 5);
    access_list.add(recipient, 0x01_bytes32);
    push_args({1, 0});
    const auto trace_output = trace(OP_SSTORE, *tracer);
    EXPECT_THAT(trace_output, HasSubstr(R"("dynamicGas":2900)"));
    EXPECT_THAT(trace_output, HasSubstr(R"("refund":15000)"));
}

TEST_F(tracing, gas_histogram)
{
    {
        auto tracer = create_gas_histogram_tracer(trace_stream);
        push_args({1});
        step(*berlin, OP_SLOAD, state, tracer.get());
        push_args({2});
        step(*berlin, OP_SLOAD, state, tracer.get());
        push_args({2});
        step(*berlin, OP_SLOAD, state, tracer.get());
        step(*berlin, OP_ADD, state, tracer.get());
        step(*berlin, OP_PUSH0, state, tracer.get());
        EXPECT_EQ(trace_stream.str(), "");
    }

    EXPECT_EQ(trace_stream.str(),
        "--- # GAS HISTOGRAM\n"
        "opcode,count,gas,errors\n"
        "ADD,1,3,0\n"
        "SLOAD,3,4300,0\n"
        "PUSH0,0,0,1\n");
}
