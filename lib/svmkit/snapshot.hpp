// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "account_store.hpp"

namespace svmkit
{
/// The point-in-time copy of the whole AccountStore.
///
/// Addresses missing from the snapshot are recorded as absent: restoring the snapshot removes
/// the accounts created after it has been captured and recreates the ones deleted since.
class Snapshot
{
    AccountMap m_accounts;

    explicit Snapshot(AccountMap accounts) noexcept : m_accounts{std::move(accounts)} {}

public:
    /// Copies the current contents of the store. The store is not modified.
    [[nodiscard]] static Snapshot capture(const AccountStore& store);

    /// Replaces the store contents with the captured accounts.
    ///
    /// Restoring the same snapshot multiple times yields the same store state.
    void restore(AccountStore& store) const;

    /// Returns the captured account or null if the address was absent.
    [[nodiscard]] const Account* find(const Address& addr) const noexcept;

    [[nodiscard]] size_t size() const noexcept { return m_accounts.size(); }

    [[nodiscard]] const AccountMap& accounts() const noexcept { return m_accounts; }
};
}  // namespace svmkit
