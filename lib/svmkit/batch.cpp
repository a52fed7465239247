// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0

#include "batch.hpp"
#include "snapshot.hpp"
#include "tracing.hpp"
#include <algorithm>

namespace svmkit
{
std::string_view to_string(Policy policy) noexcept
{
    switch (policy)
    {
    case Policy::stop_on_failure:
        return "stop_on_failure";
    case Policy::allow_failures:
        return "allow_failures";
    case Policy::dry_run:
        return "dry_run";
    }
    return "<unknown>";
}

std::string_view to_string(BatchStatus status) noexcept
{
    switch (status)
    {
    case BatchStatus::all_succeeded:
        return "all_succeeded";
    case BatchStatus::partial_failure:
        return "partial_failure";
    case BatchStatus::rolled_back_dry_run:
        return "rolled_back_dry_run";
    }
    return "<unknown>";
}

std::string_view to_string(BatchState state) noexcept
{
    switch (state)
    {
    case BatchState::idle:
        return "idle";
    case BatchState::running:
        return "running";
    case BatchState::committed:
        return "committed";
    case BatchState::rolled_back:
        return "rolled_back";
    }
    return "<unknown>";
}

std::optional<Policy> parse_policy(std::string_view name) noexcept
{
    if (name == "stop_on_failure" || name == "execute")
        return Policy::stop_on_failure;
    if (name == "allow_failures" || name == "execute_allow_failures")
        return Policy::allow_failures;
    if (name == "dry_run")
        return Policy::dry_run;
    return std::nullopt;
}

std::optional<BatchStatus> parse_batch_status(std::string_view name) noexcept
{
    for (const auto s : {BatchStatus::all_succeeded, BatchStatus::partial_failure,
             BatchStatus::rolled_back_dry_run})
    {
        if (to_string(s) == name)
            return s;
    }
    return std::nullopt;
}

bool BatchResult::is_success() const noexcept
{
    return std::ranges::all_of(outcomes, [](const auto& o) { return svmkit::is_success(o); });
}

std::optional<size_t> BatchResult::failed_at() const noexcept
{
    const auto it =
        std::ranges::find_if(outcomes, [](const auto& o) { return !svmkit::is_success(o); });
    if (it == outcomes.end())
        return std::nullopt;
    return index_of(*it);
}

const BatchResult& BatchResult::check() const
{
    for (const auto& outcome : outcomes)
    {
        if (const auto* failure = std::get_if<InstructionFailure>(&outcome))
            throw TransactionFailed{failure->index, failure->error};
    }
    return *this;
}

TransactionFailed::TransactionFailed(size_t index, std::error_code error)
  : std::system_error{error, "transaction failed at instruction " + std::to_string(index)},
    m_index{index}
{}

BatchStatus aggregate_status(
    std::span<const InstructionOutcome> outcomes, BatchState final_state, Policy policy) noexcept
{
    if (policy == Policy::dry_run)
        return BatchStatus::rolled_back_dry_run;

    const auto any_failed =
        std::ranges::any_of(outcomes, [](const auto& o) { return !is_success(o); });
    if (any_failed || final_state == BatchState::rolled_back)
        return BatchStatus::partial_failure;

    return BatchStatus::all_succeeded;
}

BatchResult make_batch_result(
    std::vector<InstructionOutcome> outcomes, BatchState final_state, Policy policy) noexcept
{
    uint64_t total_compute_units = 0;
    std::chrono::nanoseconds total_execution_time{};
    for (const auto& o : outcomes)
    {
        total_compute_units += compute_units_of(o);
        total_execution_time += execution_time_of(o);
    }

    const auto status = aggregate_status(outcomes, final_state, policy);
    return {
        .outcomes = std::move(outcomes),
        .status = status,
        .policy = policy,
        .final_state = final_state,
        .total_compute_units = total_compute_units,
        .total_execution_time = total_execution_time,
    };
}

BatchResult run_batch(std::span<const Instruction> instructions, Policy policy,
    AccountStore& store, Processor& processor, Tracer* tracer)
{
    if (tracer != nullptr)
        tracer->notify_batch_start(policy, instructions.size());

    // Idle -> Running. The snapshot is captured also for the empty batch.
    const auto snapshot = Snapshot::capture(store);
    auto state = BatchState::running;

    std::vector<InstructionOutcome> outcomes;
    outcomes.reserve(instructions.size());
    bool rollback = policy == Policy::dry_run;
    try
    {
        for (size_t i = 0; i < instructions.size(); ++i)
        {
            if (tracer != nullptr)
                tracer->notify_instruction_start(i, instructions[i]);

            const auto& outcome =
                outcomes.emplace_back(execute(processor, instructions[i], store, i));

            if (tracer != nullptr)
                tracer->notify_instruction_end(outcome);

            if (!is_success(outcome))
            {
                rollback = true;
                if (policy == Policy::stop_on_failure)
                    break;  // The remaining instructions are never executed.
            }
        }
    }
    catch (const std::exception&)
    {
        // The engine has failed in an unexpected way. Undo the partial effects and propagate.
        snapshot.restore(store);
        throw;
    }

    if (rollback)
    {
        snapshot.restore(store);
        state = BatchState::rolled_back;
    }
    else
        state = BatchState::committed;

    auto result = make_batch_result(std::move(outcomes), state, policy);

    if (tracer != nullptr)
        tracer->notify_batch_end(result);

    return result;
}
}  // namespace svmkit
