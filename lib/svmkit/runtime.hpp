// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "processor.hpp"
#include "tracing.hpp"
#include <evmc/evmc.h>
#include <memory>
#include <string_view>
#include <unordered_map>

namespace svmkit
{
/// The number of slots in an epoch.
constexpr uint64_t SLOTS_PER_EPOCH = 432'000;

/// The default per-instruction compute budget.
constexpr uint64_t DEFAULT_COMPUTE_LIMIT = 200'000;

/// The maximum size of account data.
constexpr uint64_t MAX_ACCOUNT_DATA_SIZE = 10 * 1024 * 1024;

/// The clock sysvar.
struct Clock
{
    uint64_t slot = 0;
    uint64_t epoch = 0;
    int64_t unix_timestamp = 0;
};

/// The account loaded for the instruction execution.
struct BorrowedAccount
{
    Address address;
    Account account;
    bool is_signer = false;
    bool is_writable = false;
};

/// The execution context of a single program invocation.
///
/// Holds working copies of the instruction accounts. The same address passed multiple times
/// refers to the same working copy.
class InvokeContext
{
    const Instruction& m_instruction;
    const Clock& m_clock;

    /// The unique accounts of the instruction.
    std::vector<BorrowedAccount> m_accounts;

    /// Maps the positions of the instruction accounts to m_accounts.
    std::vector<size_t> m_positions;

    std::vector<std::string> m_logs;
    bytes m_return_data;
    uint64_t m_compute_limit;
    uint64_t m_compute_used = 0;

public:
    InvokeContext(const Instruction& instruction, const AccountStore& store, const Clock& clock,
        uint64_t compute_limit);

    [[nodiscard]] const Address& program_id() const noexcept { return m_instruction.program_id; }

    [[nodiscard]] bytes_view data() const noexcept { return m_instruction.data; }

    [[nodiscard]] const Clock& clock() const noexcept { return m_clock; }

    /// The number of accounts passed to the instruction (duplicates included).
    [[nodiscard]] size_t num_accounts() const noexcept { return m_positions.size(); }

    /// Returns the account at the instruction account position or null if out of range.
    [[nodiscard]] BorrowedAccount* account(size_t position) noexcept;

    /// Returns the unique accounts of the instruction.
    [[nodiscard]] const std::vector<BorrowedAccount>& accounts() const noexcept
    {
        return m_accounts;
    }

    /// Charges compute units. Fails with COMPUTE_BUDGET_EXCEEDED if the budget is exhausted.
    [[nodiscard]] std::error_code consume(uint64_t units) noexcept;

    [[nodiscard]] uint64_t compute_used() const noexcept { return m_compute_used; }
    [[nodiscard]] uint64_t compute_limit() const noexcept { return m_compute_limit; }

    void log(std::string message) { m_logs.emplace_back(std::move(message)); }

    void set_return_data(bytes data) noexcept { m_return_data = std::move(data); }

    [[nodiscard]] std::vector<std::string>& logs() noexcept { return m_logs; }

    [[nodiscard]] bytes& return_data() noexcept { return m_return_data; }
};

/// The program executable by the Runtime.
class Program
{
public:
    virtual ~Program() = default;

    /// Executes the instruction in the context. Modifies the context accounts only.
    virtual std::error_code execute(InvokeContext& ctx) = 0;
};

/// The native execution engine: dispatches instructions to the registered programs.
///
/// The system and memo programs are registered by default.
/// A failed instruction leaves the store untouched; a successful one writes back its writable
/// accounts. The writable accounts left with zero lamports are removed from the store.
class Runtime : public Processor
{
    std::unordered_map<Address, std::unique_ptr<Program>> m_programs;
    std::unique_ptr<Tracer> m_first_tracer;

public:
    Clock clock;
    uint64_t compute_limit = DEFAULT_COMPUTE_LIMIT;

    Runtime();

    ProcessResult process(const Instruction& instruction, AccountStore& store) override;

    /// Registers the program under the id. Replaces the program previously registered there.
    void add_program(const Address& program_id, std::unique_ptr<Program> program);

    [[nodiscard]] bool has_program(const Address& program_id) const noexcept
    {
        return m_programs.contains(program_id);
    }

    /// Moves the clock to the slot and updates the epoch.
    void warp_to_slot(uint64_t slot) noexcept;

    /// Sets a configuration option:
    /// - "trace": the instruction tracer to std::clog,
    /// - "histogram": the histogram tracer to std::clog,
    /// - "compute_limit": the decimal per-instruction compute budget,
    /// - "unix_timestamp": the decimal clock time.
    evmc_set_option_result set_option(std::string_view name, std::string_view value);

    void add_tracer(std::unique_ptr<Tracer> tracer) noexcept
    {
        // Find the first empty unique_ptr and assign the new tracer to it.
        auto* end = &m_first_tracer;
        while (*end)
            end = &(*end)->m_next_tracer;
        *end = std::move(tracer);
    }

    [[nodiscard]] Tracer* get_tracer() const noexcept { return m_first_tracer.get(); }
};
}  // namespace svmkit
