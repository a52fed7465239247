// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0

#include "snapshot.hpp"

namespace svmkit
{
Snapshot Snapshot::capture(const AccountStore& store)
{
    return Snapshot{store.read_all()};
}

void Snapshot::restore(AccountStore& store) const
{
    // Copy: the snapshot stays intact for subsequent restores.
    store.write_all(m_accounts);
}

const Account* Snapshot::find(const Address& addr) const noexcept
{
    const auto it = m_accounts.find(addr);
    return it != m_accounts.end() ? &it->second : nullptr;
}
}  // namespace svmkit
