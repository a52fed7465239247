// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "account_store.hpp"
#include "errors.hpp"
#include "instruction.hpp"
#include <string>
#include <vector>

namespace svmkit
{
/// The result of processing a single instruction by an execution engine.
struct ProcessResult
{
    /// The instruction error. Empty if the instruction has succeeded.
    std::error_code error;

    /// The log lines emitted during the execution.
    std::vector<std::string> logs;

    /// Amount of compute units consumed, also by a failed instruction.
    uint64_t compute_units_consumed = 0;

    /// The data returned by the program.
    bytes return_data;
};

/// The execution engine: processes a single instruction against the account store.
///
/// A successful instruction applies its effects to the store. A failed instruction must leave
/// the store untouched. An implementation reports failures in ProcessResult::error or by
/// throwing ProgramError.
class Processor
{
public:
    virtual ~Processor() = default;

    virtual ProcessResult process(const Instruction& instruction, AccountStore& store) = 0;
};
}  // namespace svmkit
