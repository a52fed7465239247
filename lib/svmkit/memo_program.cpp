// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0

#include "memo_program.hpp"
#include <evmc/hex.hpp>

namespace svmkit
{
bool is_valid_utf8(bytes_view data) noexcept
{
    size_t i = 0;
    while (i < data.size())
    {
        const auto c = data[i];
        size_t len = 0;
        uint32_t cp = 0;
        if (c < 0x80)
        {
            ++i;
            continue;
        }
        else if ((c & 0xe0) == 0xc0)
        {
            len = 2;
            cp = c & 0x1fu;
        }
        else if ((c & 0xf0) == 0xe0)
        {
            len = 3;
            cp = c & 0x0fu;
        }
        else if ((c & 0xf8) == 0xf0)
        {
            len = 4;
            cp = c & 0x07u;
        }
        else
            return false;

        if (i + len > data.size())
            return false;
        for (size_t k = 1; k < len; ++k)
        {
            const auto cc = data[i + k];
            if ((cc & 0xc0) != 0x80)
                return false;
            cp = (cp << 6) | (cc & 0x3fu);
        }

        // Reject overlong encodings, surrogates and code points above U+10FFFF.
        static constexpr uint32_t min_code_point[] = {0, 0, 0x80, 0x800, 0x10000};
        if (cp < min_code_point[len] || (cp >= 0xd800 && cp <= 0xdfff) || cp > 0x10ffff)
            return false;
        i += len;
    }
    return true;
}

std::error_code MemoProgram::execute(InvokeContext& ctx)
{
    const auto data = ctx.data();
    if (const auto err = ctx.consume(MEMO_BASE_COST + data.size()))
        return err;

    bool missing_signature = false;
    for (size_t i = 0; i < ctx.num_accounts(); ++i)
    {
        const auto* account = ctx.account(i);
        if (!account->is_signer)
        {
            ctx.log("Signature missing for 0x" + evmc::hex(account->address));
            missing_signature = true;
        }
    }
    if (missing_signature)
        return MISSING_REQUIRED_SIGNATURE;

    if (!is_valid_utf8(data))
    {
        ctx.log("Invalid UTF-8");
        return INVALID_INSTRUCTION_DATA;
    }

    const std::string_view text{reinterpret_cast<const char*>(data.data()), data.size()};
    ctx.log("Memo (len " + std::to_string(data.size()) + "): \"" + std::string{text} + '"');
    return {};
}

Instruction memo(std::string_view text, std::span<const Address> signers)
{
    Instruction instruction{.program_id = MEMO_PROGRAM_ID};
    for (const auto& signer : signers)
        instruction.accounts.push_back(readonly(signer, true));
    instruction.data.assign(text.begin(), text.end());
    return instruction;
}
}  // namespace svmkit
