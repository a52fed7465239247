// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <cstdint>
#include <map>

namespace svmkit
{
using evmc::bytes;
using evmc::bytes_view;
using namespace evmc::literals;

/// The 32-byte account address (public key).
using Address = evmc::bytes32;

/// The address of the built-in system program.
constexpr Address SYSTEM_PROGRAM_ID{};

/// The account record.
struct Account
{
    /// The account balance in lamports.
    uint64_t lamports = 0;

    /// The program owning the account. Only the owner may debit lamports or modify data.
    Address owner = SYSTEM_PROGRAM_ID;

    /// The opaque account data.
    bytes data;

    /// The account holds a loaded program.
    bool executable = false;

    /// The epoch at which the account will next owe rent.
    uint64_t rent_epoch = 0;

    bool operator==(const Account&) const noexcept = default;
};

/// The address-ordered collection of accounts.
using AccountMap = std::map<Address, Account>;

/// Creates a system-owned account holding only lamports.
inline Account system_account_with_lamports(uint64_t lamports)
{
    return {.lamports = lamports};
}

/// Creates a funded account owned by the given program and holding the data.
inline Account program_account(const Address& owner, bytes data)
{
    return {.lamports = 1'000'000'000, .owner = owner, .data = std::move(data)};
}
}  // namespace svmkit
