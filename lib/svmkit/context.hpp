// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "hash_utils.hpp"
#include "runtime.hpp"
#include "transaction.hpp"

namespace svmkit
{
/// The error thrown by TestContext::process_instruction() for a failed instruction.
class InstructionError : public std::system_error
{
    InstructionFailure m_failure;

public:
    explicit InstructionError(InstructionFailure failure);

    [[nodiscard]] const InstructionFailure& failure() const noexcept { return m_failure; }
};

/// The testing context: the in-memory account store and the runtime executing against it.
///
/// All instructions and batches run strictly sequentially against the single store.
class TestContext
{
    InMemoryAccountStore m_store;
    Runtime m_runtime;

public:
    TestContext() = default;
    explicit TestContext(int64_t unix_timestamp) noexcept
    {
        m_runtime.clock.unix_timestamp = unix_timestamp;
    }

    TestContext(const TestContext&) = delete;
    TestContext& operator=(const TestContext&) = delete;

    /// Inserts or overwrites the account.
    void add_account(const Address& addr, Account account);

    [[nodiscard]] std::optional<Account> get_account(const Address& addr) const
    {
        return m_store.get_account(addr);
    }

    /// Returns the account balance if the account exists.
    [[nodiscard]] std::optional<uint64_t> get_balance(const Address& addr) const noexcept
    {
        return m_store.get_balance(addr);
    }

    /// Sets the address to a system account holding the lamports.
    void fund_account(const Address& addr, uint64_t lamports);

    /// Sets the address to a funded account owned by the program and holding the data.
    void add_program_account(const Address& addr, const Address& owner, bytes data);

    /// Executes the instruction and keeps its effects.
    ///
    /// @throws InstructionError if the instruction fails.
    InstructionSuccess process_instruction(const Instruction& instruction);

    /// Executes the instruction and returns its outcome.
    InstructionOutcome process_instruction_unchecked(const Instruction& instruction);

    /// Transfers lamports with the system program.
    ///
    /// @throws InstructionError if the transfer fails.
    InstructionSuccess transfer(const Address& from, const Address& to, uint64_t lamports);

    /// Starts a new batch of instructions executed against the store.
    [[nodiscard]] TransactionBuilder transaction() noexcept
    {
        return TransactionBuilder{m_store, m_runtime, m_runtime.get_tracer()};
    }

    void add_program(const Address& program_id, std::unique_ptr<Program> program)
    {
        m_runtime.add_program(program_id, std::move(program));
    }

    void warp_to_slot(uint64_t slot) noexcept { m_runtime.warp_to_slot(slot); }

    void set_unix_timestamp(int64_t timestamp) noexcept
    {
        m_runtime.clock.unix_timestamp = timestamp;
    }

    [[nodiscard]] int64_t unix_timestamp() const noexcept { return m_runtime.clock.unix_timestamp; }

    [[nodiscard]] const Clock& clock() const noexcept { return m_runtime.clock; }

    /// Sets a runtime configuration option. See Runtime::set_option().
    evmc_set_option_result set_option(std::string_view name, std::string_view value)
    {
        return m_runtime.set_option(name, value);
    }

    /// Computes the digest of the current store contents.
    [[nodiscard]] hash256 state_hash() const { return svmkit::state_hash(m_store.accounts()); }

    [[nodiscard]] InMemoryAccountStore& store() noexcept { return m_store; }
    [[nodiscard]] const InMemoryAccountStore& store() const noexcept { return m_store; }

    [[nodiscard]] Runtime& runtime() noexcept { return m_runtime; }
};
}  // namespace svmkit
