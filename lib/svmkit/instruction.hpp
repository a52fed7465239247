// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "account.hpp"
#include <vector>

namespace svmkit
{
/// The reference to an account passed to an instruction.
struct AccountMeta
{
    Address address;
    bool is_signer = false;
    bool is_writable = false;

    bool operator==(const AccountMeta&) const noexcept = default;
};

/// The instruction: the program to invoke, the accounts it operates on and the input data.
struct Instruction
{
    Address program_id;
    std::vector<AccountMeta> accounts;
    bytes data;

    bool operator==(const Instruction&) const noexcept = default;
};

/// Creates the meta of a writable account.
inline AccountMeta writable(const Address& addr, bool is_signer = false) noexcept
{
    return {addr, is_signer, true};
}

/// Creates the meta of a read-only account.
inline AccountMeta readonly(const Address& addr, bool is_signer = false) noexcept
{
    return {addr, is_signer, false};
}
}  // namespace svmkit
