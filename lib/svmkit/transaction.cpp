// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0

#include "transaction.hpp"
#include <stdexcept>

namespace svmkit
{
void TransactionBuilder::check_not_finalized(std::string_view operation) const
{
    if (m_finalized)
    {
        throw std::logic_error{
            "TransactionBuilder::" + std::string{operation} + ": the batch has already been executed"};
    }
}

TransactionBuilder& TransactionBuilder::add_instruction(Instruction instruction)
{
    check_not_finalized("add_instruction");
    m_instructions.emplace_back(std::move(instruction));
    return *this;
}

TransactionBuilder& TransactionBuilder::add_instructions(std::span<const Instruction> instructions)
{
    check_not_finalized("add_instructions");
    m_instructions.insert(m_instructions.end(), instructions.begin(), instructions.end());
    return *this;
}

BatchResult TransactionBuilder::finalize(Policy policy, std::string_view method)
{
    check_not_finalized(method);
    m_finalized = true;
    return run_batch(m_instructions, policy, m_store, m_processor, m_tracer);
}

BatchResult TransactionBuilder::execute()
{
    return finalize(Policy::stop_on_failure, "execute");
}

BatchResult TransactionBuilder::execute_allow_failures()
{
    return finalize(Policy::allow_failures, "execute_allow_failures");
}

BatchResult TransactionBuilder::dry_run()
{
    return finalize(Policy::dry_run, "dry_run");
}
}  // namespace svmkit
