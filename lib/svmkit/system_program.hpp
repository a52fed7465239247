// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "runtime.hpp"

namespace svmkit
{
/// The system instruction kinds: the little-endian uint32 prefix of the instruction data.
enum class SystemInstruction : uint32_t
{
    create_account = 0,
    assign = 1,
    transfer = 2,
    allocate = 8,
};

/// The compute units charged by every system instruction.
constexpr uint64_t SYSTEM_PROGRAM_COST = 150;

/// The built-in program creating accounts, assigning owners and transferring lamports.
class SystemProgram : public Program
{
public:
    std::error_code execute(InvokeContext& ctx) override;
};

namespace system_instruction
{
/// Transfers lamports. Accounts: [writable signer] from, [writable] to.
Instruction transfer(const Address& from, const Address& to, uint64_t lamports);

/// Creates a new account funded from the payer, with zeroed data of the given size
/// and assigned to the owner. Accounts: [writable signer] from, [writable signer] to.
Instruction create_account(const Address& from, const Address& to, uint64_t lamports,
    uint64_t space, const Address& owner);

/// Assigns the account to the owner program. Accounts: [writable signer] account.
Instruction assign(const Address& account, const Address& owner);

/// Allocates zeroed data of the account. Accounts: [writable signer] account.
Instruction allocate(const Address& account, uint64_t space);
}  // namespace system_instruction
}  // namespace svmkit
