// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>

namespace evmeter
{
/// The state access interface evmeter consumes.
///
/// This is the subset of the EVMC host interface needed by the metered instructions,
/// extended with the queries net gas metering of SSTORE and SELFDESTRUCT depend on
/// (committed storage value, account emptiness, self-destruct status).
/// Implemented by the surrounding ledger, not by evmeter.
class StateHost
{
public:
    virtual ~StateHost() noexcept = default;

    /// Check account existence.
    virtual bool account_exists(const evmc::address& addr) const noexcept = 0;

    /// Check if the account is empty as defined by EIP-161 (no code, zero nonce and balance).
    virtual bool account_empty(const evmc::address& addr) const noexcept = 0;

    virtual evmc::uint256be get_balance(const evmc::address& addr) const noexcept = 0;

    virtual size_t get_code_size(const evmc::address& addr) const noexcept = 0;

    virtual evmc::bytes32 get_code_hash(const evmc::address& addr) const noexcept = 0;

    /// Copy code. Returns the number of bytes copied.
    virtual size_t copy_code(const evmc::address& addr, size_t code_offset, uint8_t* buffer_data,
        size_t buffer_size) const noexcept = 0;

    /// Get the current value of the storage slot.
    virtual evmc::bytes32 get_storage(
        const evmc::address& addr, const evmc::bytes32& key) const noexcept = 0;

    /// Get the value of the storage slot at the beginning of the current transaction.
    virtual evmc::bytes32 get_committed_storage(
        const evmc::address& addr, const evmc::bytes32& key) const noexcept = 0;

    virtual void set_storage(
        const evmc::address& addr, const evmc::bytes32& key, const evmc::bytes32& value) noexcept = 0;

    /// Check if the account has already self-destructed in the current transaction.
    virtual bool has_selfdestructed(const evmc::address& addr) const noexcept = 0;

    /// Register the account to be destructed. Returns false if it was registered already.
    virtual bool selfdestruct(
        const evmc::address& addr, const evmc::address& beneficiary) noexcept = 0;

    /// Execute a message call or contract creation in a new call frame.
    virtual evmc::Result call(const evmc_message& msg) noexcept = 0;

    virtual evmc_tx_context get_tx_context() const noexcept = 0;
};
}  // namespace evmeter
