// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0

#include "access_list.hpp"

namespace evmeter
{
bool AccessList::contains(const evmc::address& addr) const noexcept
{
    return m_accounts.contains(addr);
}

AccessList::SlotPresence AccessList::contains(
    const evmc::address& addr, const evmc::bytes32& key) const noexcept
{
    const auto it = m_accounts.find(addr);
    if (it == m_accounts.end())
        return {};
    return {true, it->second.contains(key)};
}

bool AccessList::add(const evmc::address& addr)
{
    return m_accounts.try_emplace(addr).second;
}

bool AccessList::add(const evmc::address& addr, const evmc::bytes32& key)
{
    return m_accounts[addr].insert(key).second;
}

size_t AccessList::num_slots() const noexcept
{
    size_t n = 0;
    for (const auto& [_, slots] : m_accounts)
        n += slots.size();
    return n;
}
}  // namespace evmeter
