// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "batch.hpp"

namespace svmkit
{
/// The accumulator of instructions executed as one batch.
///
/// Instructions are only collected until one of the finalizing methods (execute(),
/// execute_allow_failures(), dry_run()) runs the batch. Afterwards the builder is frozen:
/// appending or finalizing again throws std::logic_error and leaves the store untouched.
class TransactionBuilder
{
    AccountStore& m_store;
    Processor& m_processor;
    Tracer* m_tracer = nullptr;
    std::vector<Instruction> m_instructions;
    bool m_finalized = false;

    void check_not_finalized(std::string_view operation) const;

    BatchResult finalize(Policy policy, std::string_view method);

public:
    TransactionBuilder(AccountStore& store, Processor& processor, Tracer* tracer = nullptr) noexcept
      : m_store{store}, m_processor{processor}, m_tracer{tracer}
    {}
    TransactionBuilder(const TransactionBuilder&) = delete;
    TransactionBuilder(TransactionBuilder&&) = delete;
    TransactionBuilder& operator=(const TransactionBuilder&) = delete;
    TransactionBuilder& operator=(TransactionBuilder&&) = delete;

    /// Appends the instruction to the batch.
    TransactionBuilder& add_instruction(Instruction instruction);

    /// Appends the instructions to the batch, preserving their order.
    TransactionBuilder& add_instructions(std::span<const Instruction> instructions);

    /// Executes the batch stopping at the first failure. Rolls back if any instruction failed.
    BatchResult execute();

    /// Executes all instructions. Rolls back if any instruction failed.
    BatchResult execute_allow_failures();

    /// Executes all instructions and always rolls back.
    BatchResult dry_run();

    [[nodiscard]] size_t size() const noexcept { return m_instructions.size(); }

    [[nodiscard]] bool finalized() const noexcept { return m_finalized; }

    [[nodiscard]] const std::vector<Instruction>& instructions() const noexcept
    {
        return m_instructions;
    }
};
}  // namespace svmkit
