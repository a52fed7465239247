// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0
#include "hash_utils.hpp"

namespace svmkit
{
namespace
{
void append_le(bytes& out, uint64_t v)
{
    for (size_t i = 0; i < sizeof(v); ++i)
        out.push_back(static_cast<uint8_t>(v >> (8 * i)));
}
}  // namespace

hash256 state_hash(const AccountMap& accounts)
{
    bytes encoded;
    for (const auto& [addr, acc] : accounts)
    {
        encoded.append(addr.bytes, sizeof(addr.bytes));
        append_le(encoded, acc.lamports);
        encoded.append(acc.owner.bytes, sizeof(acc.owner.bytes));
        encoded.push_back(acc.executable ? 1 : 0);
        append_le(encoded, acc.rent_epoch);
        append_le(encoded, acc.data.size());
        encoded += acc.data;
    }
    return keccak256(encoded);
}
}  // namespace svmkit

std::ostream& operator<<(std::ostream& out, const svmkit::Address& a)
{
    return out << svmkit::hex0x(a);
}
