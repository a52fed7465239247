// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0

#include "mock_processor.hpp"
#include <gtest/gtest.h>
#include <svmkit/execution.hpp>
#include <test/utils/utils.hpp>
#include <thread>

using namespace svmkit;
using namespace svmkit::test;
using testing::_;
using testing::Return;
using testing::Throw;

namespace
{
constexpr auto Alice = 0xa11c_bytes32;
}

TEST(execution, success_keeps_effects)
{
    MockProcessor processor;
    InMemoryAccountStore store;
    const auto ix = tagged_instruction(1);

    EXPECT_CALL(processor, process(ix, testing::Ref(store))).WillOnce(credit(Alice, 100, 150));

    const auto outcome = execute(processor, ix, store, 3);
    ASSERT_TRUE(is_success(outcome));
    const auto& success = std::get<InstructionSuccess>(outcome);
    EXPECT_EQ(success.index, 3);
    EXPECT_EQ(success.compute_units, 150);
    EXPECT_EQ(success.logs, std::vector<std::string>{"credit"});
    EXPECT_EQ(store.get_balance(Alice), 100);
}

TEST(execution, success_return_data)
{
    MockProcessor processor;
    InMemoryAccountStore store;

    EXPECT_CALL(processor, process(_, _))
        .WillOnce(Return(ProcessResult{.compute_units_consumed = 1, .return_data = "ret"_b}));

    const auto outcome = execute(processor, tagged_instruction(1), store);
    ASSERT_TRUE(is_success(outcome));
    EXPECT_EQ(std::get<InstructionSuccess>(outcome).return_data, "ret"_b);
    EXPECT_EQ(index_of(outcome), 0);
}

TEST(execution, reported_failure)
{
    MockProcessor processor;
    InMemoryAccountStore store;

    EXPECT_CALL(processor, process(_, _))
        .WillOnce(Return(ProcessResult{
            .error = INSUFFICIENT_FUNDS, .logs = {"a", "b"}, .compute_units_consumed = 42}));

    const auto outcome = execute(processor, tagged_instruction(1), store, 5);
    ASSERT_FALSE(is_success(outcome));
    const auto& failure = failure_of(outcome);
    EXPECT_EQ(failure.index, 5);
    EXPECT_EQ(failure.error, INSUFFICIENT_FUNDS);
    EXPECT_EQ(failure.error.message(), "insufficient funds for instruction");
    EXPECT_EQ(failure.logs.size(), 2);
    EXPECT_EQ(failure.compute_units, 42);
    EXPECT_EQ(compute_units_of(outcome), 42);
}

TEST(execution, thrown_program_error)
{
    MockProcessor processor;
    InMemoryAccountStore store;

    EXPECT_CALL(processor, process(_, _)).WillOnce(Throw(ProgramError{ACCOUNT_NOT_FOUND}));

    const auto outcome = execute(processor, tagged_instruction(1), store, 1);
    ASSERT_FALSE(is_success(outcome));
    EXPECT_EQ(failure_of(outcome).index, 1);
    EXPECT_EQ(failure_of(outcome).error, ACCOUNT_NOT_FOUND);
    EXPECT_EQ(failure_of(outcome).compute_units, 0);
    EXPECT_EQ(store.size(), 0);
}

TEST(execution, execution_time_measured)
{
    MockProcessor processor;
    InMemoryAccountStore store;

    EXPECT_CALL(processor, process(_, _))
        .WillOnce([](const Instruction&, AccountStore&) {
            std::this_thread::sleep_for(std::chrono::milliseconds{2});
            return ProcessResult{.error = INSUFFICIENT_FUNDS};
        })
        .WillOnce([](const Instruction&, AccountStore&) -> ProcessResult {
            std::this_thread::sleep_for(std::chrono::milliseconds{2});
            throw ProgramError{ACCOUNT_NOT_FOUND};
        });

    const auto reported = execute(processor, tagged_instruction(1), store);
    EXPECT_GE(execution_time_of(reported), std::chrono::milliseconds{2});

    const auto thrown = execute(processor, tagged_instruction(1), store);
    EXPECT_GE(execution_time_of(thrown), std::chrono::milliseconds{2});
}

TEST(execution, other_exceptions_propagate)
{
    MockProcessor processor;
    InMemoryAccountStore store;

    EXPECT_CALL(processor, process(_, _)).WillOnce(Throw(std::runtime_error{"store offline"}));

    EXPECT_THROW(execute(processor, tagged_instruction(1), store), std::runtime_error);
}

TEST(errors, category)
{
    const std::error_code ec = UNBALANCED_INSTRUCTION;
    EXPECT_STREQ(ec.category().name(), "svmkit");
    EXPECT_EQ(ec.message(), "sum of account balances before and after instruction do not match");
    EXPECT_FALSE(make_error_code(SUCCESS));
    EXPECT_EQ(make_error_code(SUCCESS).message(), "");
}
