// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0

#include "account_store.hpp"

namespace svmkit
{
std::optional<Account> InMemoryAccountStore::get_account(const Address& addr) const
{
    const auto it = m_accounts.find(addr);
    if (it == m_accounts.end())
        return std::nullopt;
    return it->second;
}

void InMemoryAccountStore::store_account(const Address& addr, Account account)
{
    m_accounts.insert_or_assign(addr, std::move(account));
}

void InMemoryAccountStore::remove_account(const Address& addr)
{
    m_accounts.erase(addr);
}

std::optional<uint64_t> InMemoryAccountStore::get_balance(const Address& addr) const noexcept
{
    if (const auto it = m_accounts.find(addr); it != m_accounts.end())
        return it->second.lamports;
    return std::nullopt;
}
}  // namespace svmkit
