// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0

#include "context.hpp"
#include "system_program.hpp"

namespace svmkit
{
InstructionError::InstructionError(InstructionFailure failure)
  : std::system_error{failure.error}, m_failure{std::move(failure)}
{}

void TestContext::add_account(const Address& addr, Account account)
{
    m_store.store_account(addr, std::move(account));
}

void TestContext::fund_account(const Address& addr, uint64_t lamports)
{
    add_account(addr, system_account_with_lamports(lamports));
}

void TestContext::add_program_account(const Address& addr, const Address& owner, bytes data)
{
    add_account(addr, program_account(owner, std::move(data)));
}

InstructionOutcome TestContext::process_instruction_unchecked(const Instruction& instruction)
{
    auto* const tracer = m_runtime.get_tracer();
    if (tracer != nullptr)
        tracer->notify_instruction_start(0, instruction);

    auto outcome = execute(m_runtime, instruction, m_store);

    if (tracer != nullptr)
        tracer->notify_instruction_end(outcome);
    return outcome;
}

InstructionSuccess TestContext::process_instruction(const Instruction& instruction)
{
    auto outcome = process_instruction_unchecked(instruction);
    if (auto* failure = std::get_if<InstructionFailure>(&outcome))
        throw InstructionError{std::move(*failure)};
    return std::get<InstructionSuccess>(std::move(outcome));
}

InstructionSuccess TestContext::transfer(const Address& from, const Address& to, uint64_t lamports)
{
    return process_instruction(system_instruction::transfer(from, to, lamports));
}
}  // namespace svmkit
