// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "batch.hpp"
#include <memory>
#include <ostream>

namespace svmkit
{
class Tracer
{
    friend class Runtime;  // Has access the m_next_tracer to traverse the list forward.
    std::unique_ptr<Tracer> m_next_tracer;

public:
    virtual ~Tracer() = default;

    void notify_batch_start(  // NOLINT(misc-no-recursion)
        Policy policy, size_t num_instructions) noexcept
    {
        on_batch_start(policy, num_instructions);
        if (m_next_tracer)
            m_next_tracer->notify_batch_start(policy, num_instructions);
    }

    void notify_instruction_start(  // NOLINT(misc-no-recursion)
        size_t index, const Instruction& instruction) noexcept
    {
        on_instruction_start(index, instruction);
        if (m_next_tracer)
            m_next_tracer->notify_instruction_start(index, instruction);
    }

    void notify_instruction_end(const InstructionOutcome& outcome) noexcept  // NOLINT
    {
        on_instruction_end(outcome);
        if (m_next_tracer)
            m_next_tracer->notify_instruction_end(outcome);
    }

    void notify_batch_end(const BatchResult& result) noexcept  // NOLINT(misc-no-recursion)
    {
        on_batch_end(result);
        if (m_next_tracer)
            m_next_tracer->notify_batch_end(result);
    }

private:
    virtual void on_batch_start(Policy policy, size_t num_instructions) noexcept = 0;
    virtual void on_instruction_start(size_t index, const Instruction& instruction) noexcept = 0;
    virtual void on_instruction_end(const InstructionOutcome& outcome) noexcept = 0;
    virtual void on_batch_end(const BatchResult& result) noexcept = 0;
};

/// Creates the "histogram" tracer which counts executed and failed instructions of individual
/// programs and reports this data in CSV format at the end of every batch.
/// An instruction executed outside of a batch gets its own report.
///
/// @param out  Report output stream.
/// @return     Histogram tracer object.
std::unique_ptr<Tracer> create_histogram_tracer(std::ostream& out);

/// Creates the tracer reporting every batch and instruction event as a JSON line.
std::unique_ptr<Tracer> create_instruction_tracer(std::ostream& out);

}  // namespace svmkit
