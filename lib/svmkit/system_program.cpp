// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0

#include "system_program.hpp"
#include <evmc/hex.hpp>
#include <algorithm>
#include <limits>

namespace svmkit
{
namespace
{
constexpr size_t DISCRIMINANT_SIZE = sizeof(uint32_t);

template <typename T>
std::optional<T> load_le(bytes_view data, size_t offset) noexcept
{
    if (data.size() < offset + sizeof(T))
        return std::nullopt;
    T v = 0;
    for (size_t i = 0; i < sizeof(T); ++i)
        v |= static_cast<T>(T{data[offset + i]} << (8 * i));
    return v;
}

template <typename T>
void store_le(bytes& out, T v)
{
    for (size_t i = 0; i < sizeof(T); ++i)
        out.push_back(static_cast<uint8_t>(v >> (8 * i)));
}

std::optional<Address> load_address(bytes_view data, size_t offset) noexcept
{
    if (data.size() < offset + sizeof(Address))
        return std::nullopt;
    Address addr;
    std::copy_n(&data[offset], sizeof(addr), addr.bytes);
    return addr;
}

bytes encode(SystemInstruction kind)
{
    bytes data;
    store_le(data, static_cast<uint32_t>(kind));
    return data;
}

std::error_code transfer_lamports(
    InvokeContext& ctx, BorrowedAccount& from, BorrowedAccount& to, uint64_t lamports)
{
    if (!from.is_signer)
    {
        ctx.log("Transfer: `from` account 0x" + evmc::hex(from.address) + " must sign");
        return MISSING_REQUIRED_SIGNATURE;
    }
    if (!from.account.data.empty())
    {
        ctx.log("Transfer: `from` must not carry data");
        return INVALID_ACCOUNT_DATA;
    }
    if (lamports > from.account.lamports)
    {
        ctx.log("Transfer: insufficient lamports " + std::to_string(from.account.lamports) +
                ", need " + std::to_string(lamports));
        return INSUFFICIENT_FUNDS;
    }

    from.account.lamports -= lamports;
    if (to.account.lamports > std::numeric_limits<uint64_t>::max() - lamports)
        return ARITHMETIC_OVERFLOW;
    to.account.lamports += lamports;
    return {};
}

std::error_code allocate(InvokeContext& ctx, BorrowedAccount& account, uint64_t space)
{
    if (!account.is_signer)
    {
        ctx.log("Allocate: 'to' account 0x" + evmc::hex(account.address) + " must sign");
        return MISSING_REQUIRED_SIGNATURE;
    }
    if (!account.account.data.empty() || account.account.owner != SYSTEM_PROGRAM_ID)
    {
        ctx.log("Allocate: account 0x" + evmc::hex(account.address) + " already in use");
        return ACCOUNT_ALREADY_IN_USE;
    }
    if (space > MAX_ACCOUNT_DATA_SIZE)
        return MAX_ACCOUNT_DATA_SIZE_EXCEEDED;

    account.account.data.assign(static_cast<size_t>(space), 0);
    return {};
}

std::error_code assign(InvokeContext& ctx, BorrowedAccount& account, const Address& owner)
{
    if (account.account.owner == owner)
        return {};
    if (!account.is_signer)
    {
        ctx.log("Assign: account 0x" + evmc::hex(account.address) + " must sign");
        return MISSING_REQUIRED_SIGNATURE;
    }
    account.account.owner = owner;
    return {};
}
}  // namespace

std::error_code SystemProgram::execute(InvokeContext& ctx)
{
    if (const auto err = ctx.consume(SYSTEM_PROGRAM_COST))
        return err;

    const auto data = ctx.data();
    const auto kind = load_le<uint32_t>(data, 0);
    if (!kind.has_value())
        return INVALID_INSTRUCTION_DATA;

    switch (static_cast<SystemInstruction>(*kind))
    {
    case SystemInstruction::create_account:
    {
        const auto lamports = load_le<uint64_t>(data, DISCRIMINANT_SIZE);
        const auto space = load_le<uint64_t>(data, DISCRIMINANT_SIZE + 8);
        const auto owner = load_address(data, DISCRIMINANT_SIZE + 16);
        if (!lamports || !space || !owner)
            return INVALID_INSTRUCTION_DATA;

        auto* from = ctx.account(0);
        auto* to = ctx.account(1);
        if (from == nullptr || to == nullptr)
            return NOT_ENOUGH_ACCOUNT_KEYS;

        if (to->account.lamports != 0)
        {
            ctx.log("Create Account: account 0x" + evmc::hex(to->address) + " already in use");
            return ACCOUNT_ALREADY_IN_USE;
        }
        if (const auto err = allocate(ctx, *to, *space))
            return err;
        if (const auto err = assign(ctx, *to, *owner))
            return err;
        return transfer_lamports(ctx, *from, *to, *lamports);
    }

    case SystemInstruction::assign:
    {
        const auto owner = load_address(data, DISCRIMINANT_SIZE);
        if (!owner)
            return INVALID_INSTRUCTION_DATA;
        auto* account = ctx.account(0);
        if (account == nullptr)
            return NOT_ENOUGH_ACCOUNT_KEYS;
        return assign(ctx, *account, *owner);
    }

    case SystemInstruction::transfer:
    {
        const auto lamports = load_le<uint64_t>(data, DISCRIMINANT_SIZE);
        if (!lamports)
            return INVALID_INSTRUCTION_DATA;
        auto* from = ctx.account(0);
        auto* to = ctx.account(1);
        if (from == nullptr || to == nullptr)
            return NOT_ENOUGH_ACCOUNT_KEYS;
        return transfer_lamports(ctx, *from, *to, *lamports);
    }

    case SystemInstruction::allocate:
    {
        const auto space = load_le<uint64_t>(data, DISCRIMINANT_SIZE);
        if (!space)
            return INVALID_INSTRUCTION_DATA;
        auto* account = ctx.account(0);
        if (account == nullptr)
            return NOT_ENOUGH_ACCOUNT_KEYS;
        return allocate(ctx, *account, *space);
    }
    }
    return INVALID_INSTRUCTION_DATA;
}

namespace system_instruction
{
Instruction transfer(const Address& from, const Address& to, uint64_t lamports)
{
    auto data = encode(SystemInstruction::transfer);
    store_le(data, lamports);
    return {SYSTEM_PROGRAM_ID, {writable(from, true), writable(to)}, std::move(data)};
}

Instruction create_account(const Address& from, const Address& to, uint64_t lamports,
    uint64_t space, const Address& owner)
{
    auto data = encode(SystemInstruction::create_account);
    store_le(data, lamports);
    store_le(data, space);
    data.append(owner.bytes, sizeof(owner.bytes));
    return {SYSTEM_PROGRAM_ID, {writable(from, true), writable(to, true)}, std::move(data)};
}

Instruction assign(const Address& account, const Address& owner)
{
    auto data = encode(SystemInstruction::assign);
    data.append(owner.bytes, sizeof(owner.bytes));
    return {SYSTEM_PROGRAM_ID, {writable(account, true)}, std::move(data)};
}

Instruction allocate(const Address& account, uint64_t space)
{
    auto data = encode(SystemInstruction::allocate);
    store_le(data, space);
    return {SYSTEM_PROGRAM_ID, {writable(account, true)}, std::move(data)};
}
}  // namespace system_instruction
}  // namespace svmkit
