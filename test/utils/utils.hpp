// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#include <svmkit/account.hpp>
#include <svmkit/execution.hpp>
#include <algorithm>

namespace svmkit::test
{
using evmc::bytes;
using evmc::bytes_view;
using evmc::from_hex;
using evmc::from_spaced_hex;
using evmc::hex;

/// Converts a string to bytes by casting individual characters.
inline bytes to_bytes(std::string_view s)
{
    return {s.begin(), s.end()};
}

/// Produces bytes out of string literal.
inline bytes operator""_b(const char* data, size_t size)
{
    return to_bytes({data, size});
}

inline bytes operator""_hex(const char* s, size_t size)
{
    return from_spaced_hex({s, size}).value();
}

/// Creates the address with the given number in its last bytes.
inline Address make_address(uint64_t n) noexcept
{
    Address addr;
    for (size_t i = 0; i < sizeof(n); ++i)
        addr.bytes[sizeof(addr) - 1 - i] = static_cast<uint8_t>(n >> (8 * i));
    return addr;
}

/// Returns the failure of the outcome. The outcome must be a failure.
inline const InstructionFailure& failure_of(const InstructionOutcome& outcome)
{
    return std::get<InstructionFailure>(outcome);
}
}  // namespace svmkit::test
