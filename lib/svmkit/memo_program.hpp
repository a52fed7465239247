// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "runtime.hpp"
#include <span>

namespace svmkit
{
/// The address of the built-in memo program.
constexpr auto MEMO_PROGRAM_ID = 0x4d656d6f_bytes32;

/// The base compute cost of a memo. One more unit is charged per memo byte.
constexpr uint64_t MEMO_BASE_COST = 100;

/// The built-in program logging a UTF-8 memo. All passed accounts must be signers.
class MemoProgram : public Program
{
public:
    std::error_code execute(InvokeContext& ctx) override;
};

/// Checks if the bytes are valid UTF-8 text.
[[nodiscard]] bool is_valid_utf8(bytes_view data) noexcept;

/// Creates the memo instruction signed by the signers.
Instruction memo(std::string_view text, std::span<const Address> signers = {});
}  // namespace svmkit
