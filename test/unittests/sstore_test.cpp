// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0

/// SSTORE gas metering: the legacy schedule, EIP-2200 net gas metering,
/// its EIP-2929 repricing and the EIP-3529 refund reduction.

#include "metering_fixture.hpp"

using namespace evmeter;
using namespace evmc::literals;
using evmeter::test::metering;

namespace
{
constexpr auto key = 0x01_bytes32;

class sstore : public metering
{
protected:
    JumpTablePtr berlin = build({"ethereum_1884", "ethereum_2200", "ethereum_2929"});
    JumpTablePtr london =
        build({"ethereum_1884", "ethereum_2200", "ethereum_2929", "ethereum_3529"});

    /// Writes the value with the given table. The slot is warm unless requested otherwise.
    int64_t store(const JumpTable& table, uint64_t original, uint64_t current, uint64_t value,
        bool cold = false)
    {
        set_slot(key, original, current);
        if (!cold)
            access_list.add(recipient, key);
        push_args({intx::be::load<uint256>(key), value});
        return gas_used_by(table, OP_SSTORE);
    }

    uint64_t stored() { return intx::be::load<uint256>(host.get_storage(recipient, key))[0]; }
};
}  // namespace

TEST_F(sstore, noop)
{
    EXPECT_EQ(store(*berlin, 5, 5, 5), 100);
    EXPECT_EQ(access_list.refund(), 0);
}

TEST_F(sstore, noop_cold)
{
    EXPECT_EQ(store(*berlin, 0, 0, 0, true), 2100 + 100);
    EXPECT_TRUE(access_list.contains(recipient, key).slot);
}

TEST_F(sstore, fresh_slot)
{
    EXPECT_EQ(store(*berlin, 0, 0, 5), 20000);
    EXPECT_EQ(access_list.refund(), 0);
    EXPECT_EQ(stored(), 5);
}

TEST_F(sstore, fresh_slot_cold)
{
    EXPECT_EQ(store(*berlin, 0, 0, 5, true), 2100 + 20000);
    EXPECT_TRUE(access_list.contains(recipient, key).slot);
}

TEST_F(sstore, clear_clean_slot)
{
    EXPECT_EQ(store(*berlin, 5, 5, 0), 2900);
    EXPECT_EQ(access_list.refund(), 15000);
    EXPECT_EQ(stored(), 0);
}

TEST_F(sstore, clear_clean_slot_reduced_refund)
{
    EXPECT_EQ(store(*london, 5, 5, 0), 2900);
    EXPECT_EQ(access_list.refund(), 4800);
}

TEST_F(sstore, modify_clean_slot)
{
    EXPECT_EQ(store(*berlin, 5, 5, 7), 2900);
    EXPECT_EQ(access_list.refund(), 0);
}

TEST_F(sstore, recreate_cleared_slot)
{
    // The refund granted for clearing the slot earlier is reversed.
    access_list.add_refund(15000);
    EXPECT_EQ(store(*berlin, 5, 0, 7), 100);
    EXPECT_EQ(access_list.refund(), 0);
}

TEST_F(sstore, recreate_cleared_slot_with_original)
{
    access_list.add_refund(4800);
    EXPECT_EQ(store(*london, 5, 0, 5), 100);
    EXPECT_EQ(access_list.refund(), 4800 - 4800 + (5000 - 2100 - 100));
}

TEST_F(sstore, clear_dirty_slot)
{
    EXPECT_EQ(store(*berlin, 5, 7, 0), 100);
    EXPECT_EQ(access_list.refund(), 15000);
}

TEST_F(sstore, restore_original_zero)
{
    EXPECT_EQ(store(*berlin, 0, 7, 0), 100);
    EXPECT_EQ(access_list.refund(), 20000 - 100);
}

TEST_F(sstore, restore_original_nonzero)
{
    EXPECT_EQ(store(*berlin, 5, 7, 5), 100);
    EXPECT_EQ(access_list.refund(), 5000 - 2100 - 100);
}

TEST_F(sstore, dirty_update)
{
    EXPECT_EQ(store(*berlin, 5, 7, 9), 100);
    EXPECT_EQ(access_list.refund(), 0);
    EXPECT_EQ(stored(), 9);
}

TEST_F(sstore, sentry)
{
    set_slot(key, 0, 0);
    push_args({intx::be::load<uint256>(key), 1});
    state.gas_left = 2300;
    EXPECT_EQ(step(*berlin, OP_SSTORE, state), Status::sstore_sentry);
    EXPECT_EQ(state.gas_left, 2300);

    // Nothing has been touched.
    EXPECT_FALSE(access_list.contains(recipient, key).slot);
    EXPECT_TRUE(host.recorded_account_accesses.empty());
}

TEST_F(sstore, sentry_passed_but_out_of_gas)
{
    set_slot(key, 0, 0);
    push_args({intx::be::load<uint256>(key), 1});
    state.gas_left = 2301;
    EXPECT_EQ(step(*berlin, OP_SSTORE, state), Status::out_of_gas);

    // The slot stays warm even though the write failed.
    EXPECT_TRUE(access_list.contains(recipient, key).slot);
    EXPECT_EQ(stored(), 0);
}

TEST_F(sstore, net_metering_istanbul)
{
    const auto istanbul = build({"ethereum_1344", "ethereum_1884", "ethereum_2200"});

    EXPECT_EQ(store(*istanbul, 5, 5, 5, true), 800);
    EXPECT_EQ(store(*istanbul, 0, 0, 5, true), 20000);
    EXPECT_EQ(store(*istanbul, 5, 5, 0, true), 5000);
    EXPECT_EQ(access_list.refund(), 15000);
    EXPECT_EQ(store(*istanbul, 5, 7, 5, true), 800);
    EXPECT_EQ(access_list.refund(), 15000 + 4200);

    // No access list accounting before EIP-2929.
    EXPECT_FALSE(access_list.contains(recipient, key).slot);
}

TEST_F(sstore, legacy)
{
    const auto base = build({});

    EXPECT_EQ(store(*base, 0, 0, 5, true), 20000);
    EXPECT_EQ(store(*base, 5, 5, 7, true), 5000);
    EXPECT_EQ(store(*base, 5, 5, 0, true), 5000);
    EXPECT_EQ(access_list.refund(), 15000);
    EXPECT_EQ(store(*base, 0, 0, 0, true), 5000);

    // The legacy schedule has no sentry.
    set_slot(key, 0, 5);
    push_args({intx::be::load<uint256>(key), 6});
    state.gas_left = 5000;
    EXPECT_EQ(step(*base, OP_SSTORE, state), Status::success);
    EXPECT_EQ(state.gas_left, 0);
}

TEST_F(sstore, static_mode)
{
    msg.flags = EVMC_STATIC;
    access_list.add(recipient, key);
    set_slot(key, 0, 0);
    push_args({intx::be::load<uint256>(key), 1});
    EXPECT_EQ(step(*berlin, OP_SSTORE, state), Status::static_mode_violation);
    EXPECT_EQ(stored(), 0);
}
