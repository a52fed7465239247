// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0

#include "execution.hpp"

namespace svmkit
{
InstructionOutcome execute(
    Processor& processor, const Instruction& instruction, AccountStore& store, size_t index)
{
    using clock = std::chrono::steady_clock;

    ProcessResult result;
    const auto start_time = clock::now();
    try
    {
        result = processor.process(instruction, store);
    }
    catch (const ProgramError& err)
    {
        return InstructionFailure{
            .index = index, .error = err.code(), .execution_time = clock::now() - start_time};
    }
    const std::chrono::nanoseconds execution_time = clock::now() - start_time;

    if (result.error)
    {
        return InstructionFailure{
            .index = index,
            .error = result.error,
            .logs = std::move(result.logs),
            .compute_units = result.compute_units_consumed,
            .execution_time = execution_time,
        };
    }

    return InstructionSuccess{
        .index = index,
        .logs = std::move(result.logs),
        .compute_units = result.compute_units_consumed,
        .return_data = std::move(result.return_data),
        .execution_time = execution_time,
    };
}
}  // namespace svmkit
