// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <svmkit/runtime.hpp>
#include <svmkit/system_program.hpp>
#include <test/utils/utils.hpp>
#include <functional>

using namespace svmkit;
using namespace svmkit::test;
using testing::ElementsAre;

namespace
{
constexpr auto Alice = 0xa11c_bytes32;
constexpr auto Bob = 0xb0b0_bytes32;
constexpr auto Vault = 0x7a17_bytes32;
constexpr auto TestProgramId = 0x7e57_bytes32;

/// The program executing the given function.
class LambdaProgram : public Program
{
    std::function<std::error_code(InvokeContext&)> m_fn;

public:
    explicit LambdaProgram(std::function<std::error_code(InvokeContext&)> fn)
      : m_fn{std::move(fn)}
    {}

    std::error_code execute(InvokeContext& ctx) override { return m_fn(ctx); }
};

class runtime : public testing::Test
{
protected:
    Runtime rt;
    InMemoryAccountStore store{{
        {Alice, {.lamports = 1'000}},
        {Bob, {.lamports = 500}},
        {Vault, {.lamports = 2'000, .owner = TestProgramId, .data = bytes(4, 0)}},
    }};

    void set_program(std::function<std::error_code(InvokeContext&)> fn)
    {
        rt.add_program(TestProgramId, std::make_unique<LambdaProgram>(std::move(fn)));
    }

    ProcessResult run(std::vector<AccountMeta> accounts, bytes data = {})
    {
        return rt.process({TestProgramId, std::move(accounts), std::move(data)}, store);
    }
};
}  // namespace

TEST_F(runtime, unknown_program)
{
    const auto r = rt.process({.program_id = 0xbad0_bytes32}, store);
    EXPECT_EQ(r.error, UNSUPPORTED_PROGRAM_ID);
    EXPECT_EQ(r.compute_units_consumed, 0);
}

TEST_F(runtime, default_programs)
{
    EXPECT_TRUE(rt.has_program(SYSTEM_PROGRAM_ID));
    EXPECT_FALSE(rt.has_program(TestProgramId));
    set_program([](InvokeContext&) { return std::error_code{}; });
    EXPECT_TRUE(rt.has_program(TestProgramId));
}

TEST_F(runtime, program_logs)
{
    set_program([](InvokeContext& ctx) {
        ctx.log("hello");
        return ctx.consume(42);
    });

    const auto r = run({});
    EXPECT_FALSE(r.error);
    EXPECT_EQ(r.compute_units_consumed, 42);
    const auto id = hex0x(TestProgramId);
    EXPECT_THAT(r.logs, ElementsAre("Program " + id + " invoke [1]", "hello",
                            "Program " + id + " consumed 42 of 200000 compute units",
                            "Program " + id + " success"));
}

TEST_F(runtime, failure_logs)
{
    set_program([](InvokeContext&) { return make_error_code(CUSTOM_PROGRAM_ERROR); });

    const auto r = run({});
    EXPECT_EQ(r.error, CUSTOM_PROGRAM_ERROR);
    ASSERT_FALSE(r.logs.empty());
    EXPECT_EQ(r.logs.back(), "Program " + hex0x(TestProgramId) + " failed: custom program error");
}

TEST_F(runtime, return_data)
{
    set_program([](InvokeContext& ctx) {
        ctx.set_return_data("cafe"_hex);
        return std::error_code{};
    });
    EXPECT_EQ(run({}).return_data, "cafe"_hex);
}

TEST_F(runtime, owner_moves_lamports)
{
    set_program([](InvokeContext& ctx) {
        ctx.account(0)->account.lamports -= 300;
        ctx.account(1)->account.lamports += 300;
        return std::error_code{};
    });

    const auto r = run({writable(Vault), writable(Bob)});
    EXPECT_FALSE(r.error);
    EXPECT_EQ(store.get_balance(Vault), 1'700);
    EXPECT_EQ(store.get_balance(Bob), 800);
}

TEST_F(runtime, owner_modifies_data)
{
    set_program([](InvokeContext& ctx) {
        ctx.account(0)->account.data = "01020304"_hex;
        return std::error_code{};
    });

    EXPECT_FALSE(run({writable(Vault)}).error);
    EXPECT_EQ(store.get_account(Vault)->data, "01020304"_hex);
}

TEST_F(runtime, failed_instruction_leaves_store_untouched)
{
    set_program([](InvokeContext& ctx) {
        ctx.account(0)->account.data = "ffffffff"_hex;
        return make_error_code(CUSTOM_PROGRAM_ERROR);
    });

    const InMemoryAccountStore pre = store;
    EXPECT_EQ(run({writable(Vault)}).error, CUSTOM_PROGRAM_ERROR);
    EXPECT_EQ(store, pre);
}

TEST_F(runtime, readonly_lamport_change)
{
    set_program([](InvokeContext& ctx) {
        ctx.account(0)->account.lamports -= 1;
        ctx.account(1)->account.lamports += 1;
        return std::error_code{};
    });
    EXPECT_EQ(run({readonly(Vault), writable(Bob)}).error, READONLY_LAMPORT_CHANGE);
}

TEST_F(runtime, readonly_data_modified)
{
    set_program([](InvokeContext& ctx) {
        ctx.account(0)->account.data[0] = 1;
        return std::error_code{};
    });
    EXPECT_EQ(run({readonly(Vault)}).error, READONLY_DATA_MODIFIED);
}

TEST_F(runtime, flags_changed_by_program_are_ignored)
{
    set_program([](InvokeContext& ctx) {
        ctx.account(0)->is_writable = true;
        ctx.account(0)->account.data[0] = 1;
        return std::error_code{};
    });
    EXPECT_EQ(run({readonly(Vault)}).error, READONLY_DATA_MODIFIED);
}

TEST_F(runtime, address_changed_by_program_is_ignored)
{
    set_program([](InvokeContext& ctx) {
        ctx.account(0)->account.lamports -= 300;
        ctx.account(1)->account.lamports += 300;
        ctx.account(1)->address = Alice;
        return std::error_code{};
    });

    EXPECT_FALSE(run({writable(Vault), writable(Bob)}).error);
    EXPECT_EQ(store.get_balance(Vault), 1'700);
    EXPECT_EQ(store.get_balance(Bob), 800);
    EXPECT_EQ(store.get_balance(Alice), 1'000);
}

TEST_F(runtime, drained_account_purged_at_loaded_address)
{
    set_program([](InvokeContext& ctx) {
        ctx.account(1)->account.lamports += ctx.account(0)->account.lamports;
        ctx.account(0)->account.lamports = 0;
        ctx.account(0)->address = Alice;
        return std::error_code{};
    });

    EXPECT_FALSE(run({writable(Vault), writable(Bob)}).error);
    EXPECT_FALSE(store.contains(Vault));
    EXPECT_EQ(store.get_balance(Bob), 2'500);
    EXPECT_EQ(store.get_balance(Alice), 1'000);
}

TEST_F(runtime, external_lamport_spend)
{
    set_program([](InvokeContext& ctx) {
        ctx.account(0)->account.lamports -= 10;
        ctx.account(1)->account.lamports += 10;
        return std::error_code{};
    });
    EXPECT_EQ(run({writable(Alice), writable(Vault)}).error, EXTERNAL_ACCOUNT_LAMPORT_SPEND);
    EXPECT_EQ(store.get_balance(Alice), 1'000);
}

TEST_F(runtime, external_data_modified)
{
    set_program([](InvokeContext& ctx) {
        ctx.account(0)->account.data = "00"_hex;
        return std::error_code{};
    });
    EXPECT_EQ(run({writable(Alice)}).error, EXTERNAL_ACCOUNT_DATA_MODIFIED);
}

TEST_F(runtime, invalid_owner_change)
{
    set_program([](InvokeContext& ctx) {
        ctx.account(0)->account.owner = TestProgramId;
        return std::error_code{};
    });
    EXPECT_EQ(run({writable(Alice)}).error, INVALID_ACCOUNT_OWNER);
}

TEST_F(runtime, unbalanced_instruction)
{
    set_program([](InvokeContext& ctx) {
        ctx.account(0)->account.lamports += 1;
        return std::error_code{};
    });
    EXPECT_EQ(run({writable(Vault)}).error, UNBALANCED_INSTRUCTION);
    EXPECT_EQ(store.get_balance(Vault), 2'000);
}

TEST_F(runtime, duplicate_accounts_share_working_copy)
{
    set_program([](InvokeContext& ctx) {
        EXPECT_EQ(ctx.num_accounts(), 2);
        EXPECT_EQ(ctx.accounts().size(), 1);
        EXPECT_EQ(ctx.account(0), ctx.account(1));
        EXPECT_TRUE(ctx.account(0)->is_writable);
        EXPECT_TRUE(ctx.account(0)->is_signer);
        EXPECT_EQ(ctx.account(2), nullptr);
        return std::error_code{};
    });
    EXPECT_FALSE(run({readonly(Vault, true), writable(Vault)}).error);
}

TEST_F(runtime, missing_account_loaded_empty)
{
    constexpr auto Nobody = 0x0b0d_bytes32;
    rt.warp_to_slot(3 * SLOTS_PER_EPOCH + 1);
    set_program([](InvokeContext& ctx) {
        const auto& a = ctx.account(0)->account;
        EXPECT_EQ(a.lamports, 0);
        EXPECT_EQ(a.owner, SYSTEM_PROGRAM_ID);
        EXPECT_EQ(a.rent_epoch, 3);
        return std::error_code{};
    });
    EXPECT_FALSE(run({writable(Nobody)}).error);
    EXPECT_FALSE(store.contains(Nobody));
}

TEST_F(runtime, zero_lamport_account_purged_only_when_modified)
{
    constexpr auto Empty = 0xe0e0_bytes32;
    store.store_account(Empty, {.lamports = 0});

    set_program([](InvokeContext&) { return std::error_code{}; });
    EXPECT_FALSE(run({writable(Empty)}).error);
    EXPECT_TRUE(store.contains(Empty));

    set_program([](InvokeContext& ctx) {
        ctx.account(0)->account.lamports = 0;
        ctx.account(1)->account.lamports += 2'000;
        return std::error_code{};
    });
    EXPECT_FALSE(run({writable(Vault), writable(Bob)}).error);
    EXPECT_FALSE(store.contains(Vault));
    EXPECT_EQ(store.get_balance(Bob), 2'500);
}

TEST_F(runtime, compute_limit)
{
    rt.compute_limit = 100;
    set_program([](InvokeContext& ctx) {
        if (const auto err = ctx.consume(60))
            return err;
        return ctx.consume(60);
    });

    const auto r = run({});
    EXPECT_EQ(r.error, COMPUTE_BUDGET_EXCEEDED);
    EXPECT_EQ(r.compute_units_consumed, 100);
}

TEST_F(runtime, warp_to_slot)
{
    rt.warp_to_slot(SLOTS_PER_EPOCH * 2 - 1);
    EXPECT_EQ(rt.clock.slot, SLOTS_PER_EPOCH * 2 - 1);
    EXPECT_EQ(rt.clock.epoch, 1);
    rt.warp_to_slot(SLOTS_PER_EPOCH * 2);
    EXPECT_EQ(rt.clock.epoch, 2);
}

TEST_F(runtime, set_option)
{
    EXPECT_EQ(rt.set_option("compute_limit", "1000"), EVMC_SET_OPTION_SUCCESS);
    EXPECT_EQ(rt.compute_limit, 1000);
    EXPECT_EQ(rt.set_option("compute_limit", "0"), EVMC_SET_OPTION_INVALID_VALUE);
    EXPECT_EQ(rt.set_option("compute_limit", "12x"), EVMC_SET_OPTION_INVALID_VALUE);
    EXPECT_EQ(rt.set_option("compute_limit", ""), EVMC_SET_OPTION_INVALID_VALUE);
    EXPECT_EQ(rt.compute_limit, 1000);

    EXPECT_EQ(rt.set_option("unix_timestamp", "-86400"), EVMC_SET_OPTION_SUCCESS);
    EXPECT_EQ(rt.clock.unix_timestamp, -86400);
    EXPECT_EQ(rt.set_option("unix_timestamp", "now"), EVMC_SET_OPTION_INVALID_VALUE);

    EXPECT_EQ(rt.get_tracer(), nullptr);
    EXPECT_EQ(rt.set_option("histogram", ""), EVMC_SET_OPTION_SUCCESS);
    const auto* const histogram = rt.get_tracer();
    ASSERT_NE(histogram, nullptr);
    EXPECT_EQ(rt.set_option("trace", ""), EVMC_SET_OPTION_SUCCESS);
    EXPECT_EQ(rt.get_tracer(), histogram);

    EXPECT_EQ(rt.set_option("o", ""), EVMC_SET_OPTION_INVALID_NAME);
}

TEST_F(runtime, clock_visible_to_programs)
{
    rt.clock.unix_timestamp = 1'700'000'000;
    set_program([](InvokeContext& ctx) {
        EXPECT_EQ(ctx.clock().unix_timestamp, 1'700'000'000);
        EXPECT_EQ(ctx.data(), "ab"_hex);
        EXPECT_EQ(ctx.program_id(), TestProgramId);
        return std::error_code{};
    });
    EXPECT_FALSE(run({}, "ab"_hex).error);
}
