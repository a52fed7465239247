// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "account.hpp"
#include <ethash/keccak.hpp>
#include <evmc/hex.hpp>
#include <bit>
#include <ostream>

namespace svmkit
{
/// Default type for 256-bit hash.
using hash256 = evmc::bytes32;

/// Computes Keccak hash out of input bytes (wrapper of ethash::keccak256).
inline hash256 keccak256(bytes_view data) noexcept
{
    return std::bit_cast<hash256>(ethash::keccak256(data.data(), data.size()));
}

/// Computes the digest of the accounts.
///
/// Every account contributes its address, lamports, owner, executable flag, rent epoch and
/// the length-prefixed data, in the address order. Integers are encoded as little-endian.
/// Equal digests mean the same set of addresses with the same account records.
[[nodiscard]] hash256 state_hash(const AccountMap& accounts);

/// Encodes bytes as hex with 0x prefix.
inline std::string hex0x(bytes_view v)
{
    return "0x" + evmc::hex(v);
}
}  // namespace svmkit

std::ostream& operator<<(std::ostream& out, const svmkit::Address& a);
