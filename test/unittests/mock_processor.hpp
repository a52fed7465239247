// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <gmock/gmock.h>
#include <svmkit/processor.hpp>

namespace svmkit::test
{
class MockProcessor : public Processor
{
public:
    MOCK_METHOD(ProcessResult, process, (const Instruction&, AccountStore&), (override));
};

/// Creates the instruction identified by the tag in its data.
inline Instruction tagged_instruction(uint8_t tag)
{
    return {.data = bytes(1, tag)};
}

/// Action for MockProcessor::process: credits the lamports to the account and succeeds.
inline auto credit(const Address& addr, uint64_t lamports, uint64_t compute_units = 100)
{
    return [=](const Instruction&, AccountStore& store) {
        auto account = store.get_account(addr).value_or(Account{});
        account.lamports += lamports;
        store.store_account(addr, account);
        return ProcessResult{.logs = {"credit"}, .compute_units_consumed = compute_units};
    };
}

/// Action for MockProcessor::process: fails with the error without touching the store.
inline auto fail(ErrorCode error, uint64_t compute_units = 10)
{
    return [=](const Instruction&, AccountStore&) {
        return ProcessResult{.error = error, .compute_units_consumed = compute_units};
    };
}
}  // namespace svmkit::test
