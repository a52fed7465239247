// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0

#include "runtime.hpp"
#include "hash_utils.hpp"
#include "memo_program.hpp"
#include "system_program.hpp"
#include <intx/intx.hpp>
#include <algorithm>
#include <charconv>
#include <iostream>

namespace svmkit
{
namespace
{
template <typename T>
std::optional<T> parse_decimal(std::string_view s) noexcept
{
    T v{};
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size())
        return std::nullopt;
    return v;
}

/// Checks the account modifications made by the program are permitted.
std::error_code verify_accounts(const std::vector<BorrowedAccount>& pre,
    const std::vector<BorrowedAccount>& post, const Address& program_id) noexcept
{
    intx::uint128 pre_total = 0;
    intx::uint128 post_total = 0;
    for (size_t i = 0; i < pre.size(); ++i)
    {
        const auto& before = pre[i].account;
        const auto& after = post[i].account;
        pre_total += before.lamports;
        post_total += after.lamports;

        const auto lamports_changed = before.lamports != after.lamports;
        const auto data_changed = before.data != after.data;

        if (!pre[i].is_writable)
        {
            if (lamports_changed)
                return READONLY_LAMPORT_CHANGE;
            if (data_changed)
                return READONLY_DATA_MODIFIED;
        }

        const auto is_owner = before.owner == program_id;
        if (before.owner != after.owner && (!is_owner || !pre[i].is_writable))
            return INVALID_ACCOUNT_OWNER;
        if (after.lamports < before.lamports && !is_owner)
            return EXTERNAL_ACCOUNT_LAMPORT_SPEND;
        if (data_changed && !is_owner)
            return EXTERNAL_ACCOUNT_DATA_MODIFIED;
        if (after.data.size() > MAX_ACCOUNT_DATA_SIZE)
            return MAX_ACCOUNT_DATA_SIZE_EXCEEDED;
    }

    if (pre_total != post_total)
        return UNBALANCED_INSTRUCTION;
    return {};
}
}  // namespace

InvokeContext::InvokeContext(const Instruction& instruction, const AccountStore& store,
    const Clock& clock, uint64_t compute_limit)
  : m_instruction{instruction}, m_clock{clock}, m_compute_limit{compute_limit}
{
    m_positions.reserve(instruction.accounts.size());
    for (const auto& meta : instruction.accounts)
    {
        const auto it = std::ranges::find(m_accounts, meta.address, &BorrowedAccount::address);
        if (it != m_accounts.end())
        {
            it->is_signer |= meta.is_signer;
            it->is_writable |= meta.is_writable;
            m_positions.push_back(static_cast<size_t>(it - m_accounts.begin()));
            continue;
        }

        // Missing accounts are loaded as empty system accounts.
        auto account = store.get_account(meta.address);
        if (!account.has_value())
            account.emplace(Account{.rent_epoch = clock.epoch});
        m_positions.push_back(m_accounts.size());
        m_accounts.push_back({meta.address, std::move(*account), meta.is_signer, meta.is_writable});
    }
}

BorrowedAccount* InvokeContext::account(size_t position) noexcept
{
    if (position >= m_positions.size())
        return nullptr;
    return &m_accounts[m_positions[position]];
}

std::error_code InvokeContext::consume(uint64_t units) noexcept
{
    if (units > m_compute_limit - m_compute_used)
    {
        m_compute_used = m_compute_limit;
        return COMPUTE_BUDGET_EXCEEDED;
    }
    m_compute_used += units;
    return {};
}

Runtime::Runtime()
{
    add_program(SYSTEM_PROGRAM_ID, std::make_unique<SystemProgram>());
    add_program(MEMO_PROGRAM_ID, std::make_unique<MemoProgram>());
}

void Runtime::add_program(const Address& program_id, std::unique_ptr<Program> program)
{
    m_programs.insert_or_assign(program_id, std::move(program));
}

void Runtime::warp_to_slot(uint64_t slot) noexcept
{
    clock.slot = slot;
    clock.epoch = slot / SLOTS_PER_EPOCH;
}

ProcessResult Runtime::process(const Instruction& instruction, AccountStore& store)
{
    const auto program_it = m_programs.find(instruction.program_id);
    if (program_it == m_programs.end())
        return {.error = UNSUPPORTED_PROGRAM_ID};

    InvokeContext ctx{instruction, store, clock, compute_limit};
    const auto pre_accounts = ctx.accounts();
    const auto id = hex0x(instruction.program_id);

    ctx.log("Program " + id + " invoke [1]");
    auto error = program_it->second->execute(ctx);
    if (!error)
        error = verify_accounts(pre_accounts, ctx.accounts(), instruction.program_id);

    ctx.log("Program " + id + " consumed " + std::to_string(ctx.compute_used()) + " of " +
            std::to_string(ctx.compute_limit()) + " compute units");

    if (error)
    {
        ctx.log("Program " + id + " failed: " + error.message());
        return {error, std::move(ctx.logs()), ctx.compute_used(), {}};
    }
    ctx.log("Program " + id + " success");

    // Write back modified accounts. Drained accounts are purged.
    // Writes go to the loaded addresses whatever the program did to its working copies.
    const auto& post_accounts = ctx.accounts();
    for (size_t i = 0; i < post_accounts.size(); ++i)
    {
        const auto& pre = pre_accounts[i];
        const auto& post = post_accounts[i].account;
        if (!pre.is_writable || post == pre.account)
            continue;
        if (post.lamports == 0)
            store.remove_account(pre.address);
        else
            store.store_account(pre.address, post);
    }

    return {{}, std::move(ctx.logs()), ctx.compute_used(), std::move(ctx.return_data())};
}

evmc_set_option_result Runtime::set_option(std::string_view name, std::string_view value)
{
    if (name == "trace")
    {
        add_tracer(create_instruction_tracer(std::clog));
        return EVMC_SET_OPTION_SUCCESS;
    }
    else if (name == "histogram")
    {
        add_tracer(create_histogram_tracer(std::clog));
        return EVMC_SET_OPTION_SUCCESS;
    }
    else if (name == "compute_limit")
    {
        const auto limit = parse_decimal<uint64_t>(value);
        if (!limit.has_value() || *limit == 0)
            return EVMC_SET_OPTION_INVALID_VALUE;
        compute_limit = *limit;
        return EVMC_SET_OPTION_SUCCESS;
    }
    else if (name == "unix_timestamp")
    {
        const auto timestamp = parse_decimal<int64_t>(value);
        if (!timestamp.has_value())
            return EVMC_SET_OPTION_INVALID_VALUE;
        clock.unix_timestamp = *timestamp;
        return EVMC_SET_OPTION_SUCCESS;
    }
    return EVMC_SET_OPTION_INVALID_NAME;
}
}  // namespace svmkit
