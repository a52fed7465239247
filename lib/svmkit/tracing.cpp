// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0

#include "tracing.hpp"
#include "hash_utils.hpp"
#include <map>

namespace svmkit
{
namespace
{
/// @see create_histogram_tracer()
class HistogramTracer : public Tracer
{
    struct Counts
    {
        uint32_t executed = 0;
        uint32_t failed = 0;
    };

    std::map<Address, Counts> m_counts;
    Address m_current_program;
    uint32_t m_batch_number = 0;
    uint32_t m_instruction_number = 0;
    bool m_in_batch = false;
    std::ostream& m_out;

    void report(std::string_view scope, uint32_t number)
    {
        m_out << "--- # HISTOGRAM " << scope << '=' << number << "\nprogram,count,failed\n";
        for (const auto& [program, counts] : m_counts)
            m_out << hex0x(program) << ',' << counts.executed << ',' << counts.failed << '\n';
        m_counts.clear();
    }

    void on_batch_start(Policy /*policy*/, size_t /*num_instructions*/) noexcept override
    {
        m_counts.clear();
        m_in_batch = true;
    }

    void on_instruction_start(size_t /*index*/, const Instruction& instruction) noexcept override
    {
        m_current_program = instruction.program_id;
        ++m_counts[m_current_program].executed;
    }

    void on_instruction_end(const InstructionOutcome& outcome) noexcept override
    {
        if (!is_success(outcome))
            ++m_counts[m_current_program].failed;

        // Instructions processed outside of a batch are reported one by one.
        if (!m_in_batch)
            report("instruction", m_instruction_number++);
    }

    void on_batch_end(const BatchResult& /*result*/) noexcept override
    {
        report("batch", m_batch_number++);
        m_in_batch = false;
    }

public:
    explicit HistogramTracer(std::ostream& out) noexcept : m_out{out} {}
};


class InstructionTracer : public Tracer
{
    std::ostream& m_out;  ///< Output stream.

    void output_string(std::string_view s)
    {
        m_out << '"';
        for (const auto c : s)
        {
            switch (c)
            {
            case '"':
                m_out << R"(\")";
                break;
            case '\\':
                m_out << R"(\\)";
                break;
            case '\n':
                m_out << R"(\n)";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                    m_out << "\\u00" << evmc::hex(static_cast<uint8_t>(c));
                else
                    m_out << c;
            }
        }
        m_out << '"';
    }

    void output_logs(const std::vector<std::string>& logs)
    {
        m_out << R"(,"logs":[)";
        for (size_t i = 0; i < logs.size(); ++i)
        {
            if (i != 0)
                m_out << ',';
            output_string(logs[i]);
        }
        m_out << ']';
    }

    void on_batch_start(Policy policy, size_t num_instructions) noexcept override
    {
        m_out << R"({"batch":"start","policy":")" << to_string(policy) << '"';
        m_out << R"(,"instructions":)" << num_instructions << "}\n";
    }

    void on_instruction_start(size_t index, const Instruction& instruction) noexcept override
    {
        m_out << "{";
        m_out << R"("index":)" << index;
        m_out << R"(,"program":")" << hex0x(instruction.program_id) << '"';
        m_out << R"(,"accounts":)" << instruction.accounts.size();
        m_out << R"(,"dataSize":)" << instruction.data.size();
        m_out << "}\n";
    }

    void on_instruction_end(const InstructionOutcome& outcome) noexcept override
    {
        m_out << "{";
        m_out << R"("index":)" << index_of(outcome);
        if (const auto* failure = std::get_if<InstructionFailure>(&outcome))
        {
            m_out << R"(,"pass":false,"error":)";
            output_string(failure->error.message());
        }
        else
            m_out << R"(,"pass":true)";
        m_out << R"(,"computeUnits":)" << compute_units_of(outcome);
        output_logs(logs_of(outcome));
        m_out << "}\n";
    }

    void on_batch_end(const BatchResult& result) noexcept override
    {
        m_out << R"({"batch":"end","status":")" << to_string(result.status) << '"';
        m_out << R"(,"state":")" << to_string(result.final_state) << '"';
        m_out << R"(,"outcomes":)" << result.outcomes.size();
        m_out << R"(,"computeUnits":)" << result.total_compute_units;
        m_out << "}\n";
    }

public:
    explicit InstructionTracer(std::ostream& out) noexcept : m_out{out}
    {
        m_out << std::dec;  // JSON does not support other number formats.
    }
};
}  // namespace

std::unique_ptr<Tracer> create_histogram_tracer(std::ostream& out)
{
    return std::make_unique<HistogramTracer>(out);
}

std::unique_ptr<Tracer> create_instruction_tracer(std::ostream& out)
{
    return std::make_unique<InstructionTracer>(out);
}
}  // namespace svmkit
