// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0

#include <evmeter/instructions.hpp>
#include <gtest/gtest.h>
#include <limits>

using namespace evmeter;

namespace
{
constexpr auto u64_max = std::numeric_limits<uint64_t>::max();
}

TEST(memory, num_words)
{
    EXPECT_EQ(num_words(0), 0);
    EXPECT_EQ(num_words(1), 1);
    EXPECT_EQ(num_words(32), 1);
    EXPECT_EQ(num_words(33), 2);
    EXPECT_EQ(num_words(u64_max), u64_max / 32 + 1);
}

TEST(memory, grow_zero_fills)
{
    Memory m;
    m.grow(64);
    EXPECT_EQ(m.size(), 64);
    for (size_t i = 0; i < m.size(); ++i)
        EXPECT_EQ(m[i], 0);

    m[63] = 0xff;
    m.clear();
    m.grow(64);
    EXPECT_EQ(m[63], 0);
}

TEST(memory, grow_beyond_initial_capacity)
{
    Memory m;
    m.grow(32);
    m[31] = 0xfe;
    m.grow(3 * 4096 + 32);
    EXPECT_EQ(m.size(), 3 * 4096 + 32);
    EXPECT_EQ(m[31], 0xfe);
    EXPECT_EQ(m[3 * 4096 + 31], 0);
}

TEST(memory, expansion_cost)
{
    Memory m;
    EXPECT_EQ(memory_expansion_cost(m, 0).cost, 0);
    EXPECT_EQ(memory_expansion_cost(m, 1).cost, 3);
    EXPECT_EQ(memory_expansion_cost(m, 32).cost, 3);
    EXPECT_EQ(memory_expansion_cost(m, 33).cost, 6);
    EXPECT_EQ(memory_expansion_cost(m, 1024 * 32).cost, 3 * 1024 + 1024 * 1024 / 512);
}

TEST(memory, expansion_cost_is_delta)
{
    Memory m;
    m.grow(512 * 32);

    // memory_cost(1024) - memory_cost(512) = 5120 - 2048
    const auto r = memory_expansion_cost(m, 1024 * 32);
    EXPECT_EQ(r.status, Status::success);
    EXPECT_EQ(r.cost, 3072);

    // Already covered ranges are free.
    EXPECT_EQ(memory_expansion_cost(m, 512 * 32).cost, 0);
    EXPECT_EQ(memory_expansion_cost(m, 1).cost, 0);
}

TEST(memory, expansion_cost_limit)
{
    Memory m;
    EXPECT_EQ(memory_expansion_cost(m, max_memory_size).status, Status::success);
    EXPECT_EQ(memory_expansion_cost(m, max_memory_size + 1).status, Status::gas_uint_overflow);
    EXPECT_EQ(memory_expansion_cost(m, u64_max).status, Status::gas_uint_overflow);
}

TEST(memory, memory_end)
{
    EXPECT_EQ(memory_end(0, 0), 0);
    EXPECT_EQ(memory_end(uint256{1} << 200, 0), 0);
    EXPECT_EQ(memory_end(10, 22), 32);
    EXPECT_EQ(memory_end(u64_max - 1, 1), u64_max);
    EXPECT_EQ(memory_end(u64_max, 1), std::nullopt);
    EXPECT_EQ(memory_end(uint256{1} << 64, 1), std::nullopt);
    EXPECT_EQ(memory_end(0, uint256{1} << 64), std::nullopt);
}

TEST(memory, overflow_checked_arithmetic)
{
    uint64_t r = 0;
    EXPECT_FALSE(add_overflow(u64_max - 1, 1, r));
    EXPECT_EQ(r, u64_max);
    EXPECT_TRUE(add_overflow(u64_max, 1, r));

    EXPECT_FALSE(mul_overflow(uint64_t{1} << 32, (uint64_t{1} << 32) - 1, r));
    EXPECT_TRUE(mul_overflow(uint64_t{1} << 32, uint64_t{1} << 32, r));
}

TEST(memory, copy_gas_cost)
{
    Memory m;
    const auto r = copy_gas_cost(m, 64, 33);
    EXPECT_EQ(r.status, Status::success);
    EXPECT_EQ(r.cost, 6 + 2 * 3);

    EXPECT_EQ(copy_gas_cost(m, 0, uint256{1} << 64).status, Status::gas_uint_overflow);
}

TEST(memory, copy_overlapping)
{
    Memory m;
    m.grow(64);
    for (size_t i = 0; i < 64; ++i)
        m[i] = static_cast<uint8_t>(i);

    m.copy(4, 0, 16);
    for (size_t i = 0; i < 16; ++i)
        EXPECT_EQ(m[4 + i], i);

    m.copy(0, 8, 16);
    EXPECT_EQ(m[0], 4);
    EXPECT_EQ(m[11], 15);
    EXPECT_EQ(m[12], 20);
    EXPECT_EQ(m[15], 23);
}
