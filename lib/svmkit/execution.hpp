// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "processor.hpp"
#include <chrono>
#include <variant>

namespace svmkit
{
/// The instruction has been applied to the account store.
struct InstructionSuccess
{
    /// The position of the instruction in the executed batch.
    size_t index = 0;
    std::vector<std::string> logs;
    uint64_t compute_units = 0;
    bytes return_data;
    std::chrono::nanoseconds execution_time{};
};

/// The instruction could not be applied.
struct InstructionFailure
{
    /// The position of the failing instruction in the executed batch.
    size_t index = 0;
    std::error_code error;
    std::vector<std::string> logs;
    uint64_t compute_units = 0;
    std::chrono::nanoseconds execution_time{};
};

/// The normalized result of executing a single instruction.
using InstructionOutcome = std::variant<InstructionSuccess, InstructionFailure>;

[[nodiscard]] inline bool is_success(const InstructionOutcome& outcome) noexcept
{
    return holds_alternative<InstructionSuccess>(outcome);
}

[[nodiscard]] inline size_t index_of(const InstructionOutcome& outcome) noexcept
{
    return std::visit([](const auto& o) noexcept { return o.index; }, outcome);
}

[[nodiscard]] inline uint64_t compute_units_of(const InstructionOutcome& outcome) noexcept
{
    return std::visit([](const auto& o) noexcept { return o.compute_units; }, outcome);
}

/// The wall-clock time spent in the processor.
[[nodiscard]] inline std::chrono::nanoseconds execution_time_of(
    const InstructionOutcome& outcome) noexcept
{
    return std::visit([](const auto& o) noexcept { return o.execution_time; }, outcome);
}

[[nodiscard]] inline const std::vector<std::string>& logs_of(
    const InstructionOutcome& outcome) noexcept
{
    return std::visit(
        [](const auto& o) noexcept -> const std::vector<std::string>& { return o.logs; }, outcome);
}

/// Executes a single instruction with the processor against the store.
///
/// The effects of a successful instruction stay in the store. Rollback is not performed here.
/// The time spent in the processor is measured with the steady clock.
///
/// @param index  The position of the instruction in the batch, recorded in the outcome.
InstructionOutcome execute(
    Processor& processor, const Instruction& instruction, AccountStore& store, size_t index = 0);
}  // namespace svmkit
