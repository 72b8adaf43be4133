// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <cstdint>
#include <unordered_map>
#include <unordered_set>

namespace evmeter
{
/// The per-transaction ledger of warm accounts and storage slots
/// (https://eips.ethereum.org/EIPS/eip-2929) together with the gas refund counter.
///
/// One instance is created for a top-level transaction and shared by all its call frames.
/// Membership is monotonic: nothing is ever removed from the warm sets during a transaction,
/// also when an access is followed by an out-of-gas failure.
class AccessList
{
    /// The warm accounts. For every warm account the set of its warm storage slots.
    std::unordered_map<evmc::address, std::unordered_set<evmc::bytes32>> m_accounts;

    /// The gas refund counter. Can be temporarily negative inside a transaction.
    int64_t m_refund = 0;

public:
    /// Presence of an account and of one of its storage slots.
    struct SlotPresence
    {
        bool address = false;
        bool slot = false;
    };

    [[nodiscard]] bool contains(const evmc::address& addr) const noexcept;

    [[nodiscard]] SlotPresence contains(
        const evmc::address& addr, const evmc::bytes32& key) const noexcept;

    /// Warms up the account. Returns true if the account was cold before.
    bool add(const evmc::address& addr);

    /// Warms up the storage slot and its account. Returns true if the slot was cold before.
    bool add(const evmc::address& addr, const evmc::bytes32& key);

    /// Checks the account access status and marks the account warm.
    ///
    /// This mirrors evmc::HostInterface::access_account():
    /// the returned status is the status before the access.
    evmc_access_status access_account(const evmc::address& addr)
    {
        return add(addr) ? EVMC_ACCESS_COLD : EVMC_ACCESS_WARM;
    }

    /// Checks the storage slot access status and marks the slot warm.
    evmc_access_status access_storage(const evmc::address& addr, const evmc::bytes32& key)
    {
        return add(addr, key) ? EVMC_ACCESS_COLD : EVMC_ACCESS_WARM;
    }

    void add_refund(int64_t gas) noexcept { m_refund += gas; }
    void sub_refund(int64_t gas) noexcept { m_refund -= gas; }
    [[nodiscard]] int64_t refund() const noexcept { return m_refund; }

    /// The number of warm accounts.
    [[nodiscard]] size_t num_accounts() const noexcept { return m_accounts.size(); }

    /// The total number of warm storage slots.
    [[nodiscard]] size_t num_slots() const noexcept;
};
}  // namespace evmeter
