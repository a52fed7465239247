// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "account.hpp"
#include <optional>

namespace svmkit
{
/// The mutable mapping of addresses to accounts the instructions are executed against.
class AccountStore
{
public:
    virtual ~AccountStore() = default;

    /// Returns the copy of the account at the address if the account exists.
    virtual std::optional<Account> get_account(const Address& addr) const = 0;

    /// Inserts or overwrites the account at the address.
    virtual void store_account(const Address& addr, Account account) = 0;

    /// Erases the account at the address. Does nothing if the account does not exist.
    virtual void remove_account(const Address& addr) = 0;

    /// Returns the copy of all accounts.
    virtual AccountMap read_all() const = 0;

    /// Replaces the store contents: afterwards exactly the given accounts exist.
    virtual void write_all(AccountMap accounts) = 0;
};

/// The AccountStore kept in memory.
class InMemoryAccountStore : public AccountStore
{
    AccountMap m_accounts;

public:
    InMemoryAccountStore() = default;
    explicit InMemoryAccountStore(AccountMap accounts) noexcept : m_accounts{std::move(accounts)}
    {}

    std::optional<Account> get_account(const Address& addr) const override;
    void store_account(const Address& addr, Account account) override;
    void remove_account(const Address& addr) override;
    AccountMap read_all() const override { return m_accounts; }
    void write_all(AccountMap accounts) override { m_accounts = std::move(accounts); }

    /// Returns the account balance if the account exists.
    [[nodiscard]] std::optional<uint64_t> get_balance(const Address& addr) const noexcept;

    [[nodiscard]] bool contains(const Address& addr) const noexcept
    {
        return m_accounts.contains(addr);
    }

    [[nodiscard]] size_t size() const noexcept { return m_accounts.size(); }

    /// Read-only access to the accounts without copying.
    [[nodiscard]] const AccountMap& accounts() const noexcept { return m_accounts; }

    bool operator==(const InMemoryAccountStore& other) const noexcept
    {
        return m_accounts == other.m_accounts;
    }
};
}  // namespace svmkit
