// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "execution.hpp"
#include <optional>
#include <span>
#include <string_view>

namespace svmkit
{
class Tracer;

/// The batch execution policy: decides when to stop executing and when to roll back.
enum class Policy : uint8_t
{
    /// Stop at the first failed instruction and roll back.
    stop_on_failure,

    /// Execute all instructions and roll back if any of them has failed.
    allow_failures,

    /// Execute all instructions and always roll back.
    dry_run,
};

/// The overall status of the executed batch.
enum class BatchStatus : uint8_t
{
    all_succeeded,
    partial_failure,
    rolled_back_dry_run,
};

/// The batch execution state.
enum class BatchState : uint8_t
{
    idle,
    running,
    committed,
    rolled_back,
};

std::string_view to_string(Policy policy) noexcept;
std::string_view to_string(BatchStatus status) noexcept;
std::string_view to_string(BatchState state) noexcept;

/// Parses the policy name as returned by to_string(Policy). Also accepts the builder method names
/// "execute" and "execute_allow_failures".
std::optional<Policy> parse_policy(std::string_view name) noexcept;

/// Parses the status name as returned by to_string(BatchStatus).
std::optional<BatchStatus> parse_batch_status(std::string_view name) noexcept;

/// The report of the whole batch execution.
struct BatchResult
{
    /// The outcomes of executed instructions in the execution order.
    /// Shorter than the batch if the execution has been stopped at a failure.
    std::vector<InstructionOutcome> outcomes;

    BatchStatus status = BatchStatus::all_succeeded;

    Policy policy = Policy::stop_on_failure;

    /// The terminal state: committed or rolled_back.
    BatchState final_state = BatchState::committed;

    /// Sum of compute units of all outcomes, failed instructions included.
    uint64_t total_compute_units = 0;

    /// Sum of execution times of all outcomes.
    std::chrono::nanoseconds total_execution_time{};

    /// The store has been restored to the state from before the batch.
    [[nodiscard]] bool rolled_back() const noexcept
    {
        return final_state == BatchState::rolled_back;
    }

    /// All executed instructions have succeeded.
    [[nodiscard]] bool is_success() const noexcept;

    /// Returns the index of the first failed instruction.
    [[nodiscard]] std::optional<size_t> failed_at() const noexcept;

    /// Returns the outcome of the last executed instruction or null if none has been executed.
    [[nodiscard]] const InstructionOutcome* last_outcome() const noexcept
    {
        return outcomes.empty() ? nullptr : &outcomes.back();
    }

    /// Throws TransactionFailed if any instruction has failed.
    const BatchResult& check() const;
};

/// The error reported by BatchResult::check() for a batch with a failed instruction.
class TransactionFailed : public std::system_error
{
    size_t m_index;

public:
    TransactionFailed(size_t index, std::error_code error);

    /// The position of the failed instruction in the batch.
    [[nodiscard]] size_t index() const noexcept { return m_index; }
};

/// Computes the overall batch status.
///
/// The dry-run policy always reports rolled_back_dry_run. Otherwise, any failure or the rollback
/// gives partial_failure. Only the committed batch without failures reports all_succeeded.
[[nodiscard]] BatchStatus aggregate_status(
    std::span<const InstructionOutcome> outcomes, BatchState final_state, Policy policy) noexcept;

/// Packages the outcomes and the terminal state into the batch report.
[[nodiscard]] BatchResult make_batch_result(
    std::vector<InstructionOutcome> outcomes, BatchState final_state, Policy policy) noexcept;

/// Executes the instructions in order against the store under the policy.
///
/// The store is snapshot before the first instruction. The snapshot is restored when the policy
/// requires rollback, otherwise the effects of executed instructions are kept.
/// Errors of the store propagate as exceptions; then no rollback is claimed.
///
/// @param tracer  The first tracer in the chain to notify. May be null.
BatchResult run_batch(std::span<const Instruction> instructions, Policy policy,
    AccountStore& store, Processor& processor, Tracer* tracer = nullptr);
}  // namespace svmkit
