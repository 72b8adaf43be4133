// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0

/// MCOPY (https://eips.ethereum.org/EIPS/eip-5656).
/// The arguments are (size, destination, source) counted from the stack top.

#include "metering_fixture.hpp"
#include <evmeter/instructions.hpp>
#include <algorithm>
#include <limits>
#include <vector>

using namespace evmeter;
using evmeter::test::metering;

namespace
{
class mcopy : public metering
{
protected:
    JumpTablePtr cancun = build({"ethereum_3855", "ethereum_5656"});

    void fill_memory(size_t size)
    {
        state.memory.grow(size);
        for (size_t i = 0; i < size; ++i)
            state.memory[i] = static_cast<uint8_t>(i + 1);
    }

    std::vector<uint8_t> memory_snapshot()
    {
        return {state.memory.data(), state.memory.data() + state.memory.size()};
    }
};
}  // namespace

TEST_F(mcopy, not_available_before_activation)
{
    const auto shanghai = build({"ethereum_3855"});
    push_args({1, 0, 0});
    EXPECT_EQ(step(*shanghai, OP_MCOPY, state), Status::undefined_instruction);
    EXPECT_EQ(state.gas_left, default_gas);
}

TEST_F(mcopy, zero_size_ignores_offsets)
{
    const auto huge = uint256{1} << 255;
    push_args({0, huge, huge});
    EXPECT_EQ(gas_used_by(*cancun, OP_MCOPY), 0);
    EXPECT_EQ(state.memory.size(), 0);
    EXPECT_EQ(state.stack.size(), 0);
}

TEST_F(mcopy, gas_with_memory_expansion)
{
    // 2 words of memory + 32 bytes copied.
    push_args({32, 32, 0});
    EXPECT_EQ(gas_used_by(*cancun, OP_MCOPY), 6 + 32 * 3);
    EXPECT_EQ(state.memory.size(), 64);
}

TEST_F(mcopy, gas_without_memory_expansion)
{
    fill_memory(64);
    push_args({32, 32, 0});
    EXPECT_EQ(gas_used_by(*cancun, OP_MCOPY), 96);

    // Priced per byte, not per word.
    push_args({33, 0, 0});
    EXPECT_EQ(gas_used_by(*cancun, OP_MCOPY), 99);
}

TEST_F(mcopy, expansion_by_source)
{
    push_args({1, 0, 95});
    EXPECT_EQ(gas_used_by(*cancun, OP_MCOPY), 9 + 3);
    EXPECT_EQ(state.memory.size(), 96);
}

TEST_F(mcopy, overlap_forward)
{
    fill_memory(64);
    auto expected = memory_snapshot();
    const std::vector<uint8_t> tmp(expected.begin() + 1, expected.begin() + 1 + 40);
    std::copy(tmp.begin(), tmp.end(), expected.begin() + 9);

    push_args({40, 9, 1});
    gas_used_by(*cancun, OP_MCOPY);
    EXPECT_EQ(memory_snapshot(), expected);
}

TEST_F(mcopy, overlap_backward)
{
    fill_memory(64);
    auto expected = memory_snapshot();
    const std::vector<uint8_t> tmp(expected.begin() + 20, expected.begin() + 20 + 40);
    std::copy(tmp.begin(), tmp.end(), expected.begin() + 3);

    push_args({40, 3, 20});
    gas_used_by(*cancun, OP_MCOPY);
    EXPECT_EQ(memory_snapshot(), expected);
}

TEST_F(mcopy, same_source_and_destination)
{
    fill_memory(32);
    const auto before = memory_snapshot();
    push_args({32, 0, 0});
    EXPECT_EQ(gas_used_by(*cancun, OP_MCOPY), 96);
    EXPECT_EQ(memory_snapshot(), before);
}

TEST_F(mcopy, copy_into_expanded_area_is_zero_filled)
{
    fill_memory(32);
    push_args({32, 0, 64});
    gas_used_by(*cancun, OP_MCOPY);
    EXPECT_EQ(state.memory.size(), 96);
    for (size_t i = 0; i < 32; ++i)
        EXPECT_EQ(state.memory[i], 0);
}

TEST_F(mcopy, offset_overflow)
{
    const auto u64_max = uint256{std::numeric_limits<uint64_t>::max()};

    push_args({1, uint256{1} << 64, 0});
    EXPECT_EQ(instr::gas::mcopy(state.stack, state).status, Status::gas_uint_overflow);
    EXPECT_EQ(instr::core::mcopy(state.stack, state), Status::memory_overflow);

    push_args({2, 0, u64_max});
    EXPECT_EQ(instr::gas::mcopy(state.stack, state).status, Status::gas_uint_overflow);
    EXPECT_EQ(instr::core::mcopy(state.stack, state), Status::memory_overflow);

    push_args({uint256{1} << 64, 0, 0});
    EXPECT_EQ(step(*cancun, OP_MCOPY, state), Status::gas_uint_overflow);
    EXPECT_EQ(state.memory.size(), 0);
}

TEST_F(mcopy, memory_limit)
{
    push_args({max_memory_size, 32, 0});
    EXPECT_EQ(step(*cancun, OP_MCOPY, state), Status::gas_uint_overflow);
    EXPECT_EQ(state.gas_left, default_gas);
}

TEST_F(mcopy, out_of_gas)
{
    state.gas_left = 101;
    push_args({32, 32, 0});
    EXPECT_EQ(step(*cancun, OP_MCOPY, state), Status::out_of_gas);
    EXPECT_EQ(state.memory.size(), 0);
}
