// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "access_list.hpp"
#include "instructions_traits.hpp"
#include "state_host.hpp"
#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <memory>

namespace evmeter
{
using evmc::bytes;
using evmc::bytes_view;
using intx::uint256;


/// Provides memory for EVM stack.
class StackSpace
{
    static uint256* allocate() noexcept
    {
        static constexpr auto alignment = sizeof(uint256);
        static constexpr auto size = limit * sizeof(uint256);
        const auto p = std::aligned_alloc(alignment, size);
        return static_cast<uint256*>(p);
    }

    struct Deleter
    {
        void operator()(void* p) noexcept { std::free(p); }
    };

    /// The storage allocated for maximum possible number of items.
    /// Items are aligned to 256 bits for better packing in cache lines.
    std::unique_ptr<uint256, Deleter> m_stack_space;

public:
    /// The maximum number of EVM stack items.
    static constexpr auto limit = instr::stack_limit;

    StackSpace() noexcept : m_stack_space{allocate()} {}

    [[nodiscard]] uint256* data() noexcept { return m_stack_space.get(); }
};


/// The EVM value stack.
///
/// Bounds are not checked here: the dispatcher checks the Operation stack requirements
/// before any instruction touches the stack.
class Stack
{
    StackSpace m_space;
    int m_size = 0;

public:
    [[nodiscard]] int size() const noexcept { return m_size; }

    /// Returns the reference to the stack item by index, where 0 means the top item
    /// and positive index values the items further down the stack.
    [[nodiscard]] uint256& operator[](int index) noexcept
    {
        return m_space.data()[m_size - 1 - index];
    }

    /// Returns the reference to the stack top item.
    [[nodiscard]] uint256& top() noexcept { return (*this)[0]; }

    /// Removes the top item and returns it.
    uint256 pop() noexcept { return m_space.data()[--m_size]; }

    void push(const uint256& value) noexcept { m_space.data()[m_size++] = value; }

    void clear() noexcept { m_size = 0; }
};


/// The EVM memory.
///
/// The implementations uses initial allocation of 4k and then grows capacity with 2x factor.
class Memory
{
    /// The size of allocation "page".
    static constexpr size_t page_size = 4 * 1024;

    struct FreeDeleter
    {
        void operator()(uint8_t* p) const noexcept { std::free(p); }
    };

    /// Owned pointer to allocated memory.
    std::unique_ptr<uint8_t[], FreeDeleter> m_data;

    /// The "virtual" size of the memory.
    size_t m_size = 0;

    /// The size of allocated memory. The initialization value is the initial capacity.
    size_t m_capacity = page_size;

    [[noreturn, gnu::cold]] static void handle_out_of_memory() noexcept { std::terminate(); }

    void allocate_capacity() noexcept
    {
        m_data.reset(static_cast<uint8_t*>(std::realloc(m_data.release(), m_capacity)));
        if (!m_data) [[unlikely]]
            handle_out_of_memory();
    }

public:
    /// Creates Memory object with initial capacity allocation.
    Memory() noexcept { allocate_capacity(); }

    uint8_t& operator[](size_t index) noexcept { return m_data[index]; }

    [[nodiscard]] const uint8_t* data() const noexcept { return m_data.get(); }
    [[nodiscard]] size_t size() const noexcept { return m_size; }

    /// Grows the memory to the given size. The extent is filled with zeros.
    ///
    /// @param new_size  New memory size. Must be larger than the current size and multiple of 32.
    void grow(size_t new_size) noexcept
    {
        if (new_size > m_capacity)
        {
            m_capacity *= 2;  // Double the capacity.

            if (m_capacity < new_size)  // If not enough.
            {
                // Set capacity to required size rounded to multiple of page_size.
                m_capacity = ((new_size + (page_size - 1)) / page_size) * page_size;
            }

            allocate_capacity();
        }
        std::memset(&m_data[m_size], 0, new_size - m_size);
        m_size = new_size;
    }

    /// Copies the bytes [src, src+size) to [dst, dst+size).
    /// Both ranges must be within the memory size and may overlap.
    void copy(size_t dst, size_t src, size_t size) noexcept
    {
        std::memmove(&m_data[dst], &m_data[src], size);
    }

    /// Virtually clears the memory by setting its size to 0. The capacity stays unchanged.
    void clear() noexcept { m_size = 0; }
};


/// The state of a single call frame: its stack, memory and the per-transaction
/// collaborators the metered instructions consult.
class ExecutionState
{
public:
    /// The gas left in the frame.
    int64_t gas_left = 0;

    Memory memory;
    Stack stack;
    const evmc_message* msg = nullptr;
    StateHost* host = nullptr;

    /// The transaction's access list and refund ledger.
    /// Shared with the other frames of the same transaction, never across transactions.
    AccessList* access_list = nullptr;

    bytes return_data;

    /// The output of RETURN or REVERT.
    bytes output;

    /// The gas to be forwarded to the callee by the next call instruction.
    /// Computed by the call gas functions, consumed by the call instructions.
    int64_t call_gas = 0;

    ExecutionState() noexcept = default;

    ExecutionState(const evmc_message& message, StateHost& state_host, AccessList& accessed) noexcept
      : gas_left{message.gas}, msg{&message}, host{&state_host}, access_list{&accessed}
    {}

    ExecutionState(const ExecutionState&) = delete;
    ExecutionState& operator=(const ExecutionState&) = delete;

    /// Resets the contents of the ExecutionState so that it could be reused.
    void reset(const evmc_message& message, StateHost& state_host, AccessList& accessed) noexcept
    {
        gas_left = message.gas;
        memory.clear();
        stack.clear();
        msg = &message;
        host = &state_host;
        access_list = &accessed;
        return_data.clear();
        output.clear();
        call_gas = 0;
    }

    [[nodiscard]] bool in_static_mode() const { return (msg->flags & EVMC_STATIC) != 0; }
};
}  // namespace evmeter
