// svmkit: Solana-style program test harness
// Copyright 2026 The svmkit Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cassert>
#include <system_error>

namespace svmkit
{

enum ErrorCode : int
{
    SUCCESS = 0,
    INSUFFICIENT_FUNDS,
    MISSING_REQUIRED_SIGNATURE,
    NOT_ENOUGH_ACCOUNT_KEYS,
    INVALID_INSTRUCTION_DATA,
    INVALID_ACCOUNT_DATA,
    ACCOUNT_ALREADY_IN_USE,
    INVALID_ACCOUNT_OWNER,
    UNSUPPORTED_PROGRAM_ID,
    COMPUTE_BUDGET_EXCEEDED,
    READONLY_LAMPORT_CHANGE,
    READONLY_DATA_MODIFIED,
    EXTERNAL_ACCOUNT_LAMPORT_SPEND,
    EXTERNAL_ACCOUNT_DATA_MODIFIED,
    UNBALANCED_INSTRUCTION,
    ARITHMETIC_OVERFLOW,
    MAX_ACCOUNT_DATA_SIZE_EXCEEDED,
    ACCOUNT_NOT_FOUND,
    CUSTOM_PROGRAM_ERROR,
    UNKNOWN_ERROR,
};

/// Obtains a reference to the static error category object for svmkit errors.
inline const std::error_category& svmkit_category() noexcept
{
    struct Category : std::error_category
    {
        [[nodiscard]] const char* name() const noexcept final { return "svmkit"; }

        [[nodiscard]] std::string message(int ev) const noexcept final
        {
            switch (ev)
            {
            case SUCCESS:
                return "";
            case INSUFFICIENT_FUNDS:
                return "insufficient funds for instruction";
            case MISSING_REQUIRED_SIGNATURE:
                return "missing required signature for instruction";
            case NOT_ENOUGH_ACCOUNT_KEYS:
                return "insufficient account keys for instruction";
            case INVALID_INSTRUCTION_DATA:
                return "invalid instruction data";
            case INVALID_ACCOUNT_DATA:
                return "invalid account data for instruction";
            case ACCOUNT_ALREADY_IN_USE:
                return "account already in use";
            case INVALID_ACCOUNT_OWNER:
                return "invalid account owner";
            case UNSUPPORTED_PROGRAM_ID:
                return "unsupported program id";
            case COMPUTE_BUDGET_EXCEEDED:
                return "computational budget exceeded";
            case READONLY_LAMPORT_CHANGE:
                return "instruction changed the balance of a read-only account";
            case READONLY_DATA_MODIFIED:
                return "instruction modified data of a read-only account";
            case EXTERNAL_ACCOUNT_LAMPORT_SPEND:
                return "instruction spent from the balance of an account it does not own";
            case EXTERNAL_ACCOUNT_DATA_MODIFIED:
                return "instruction modified data of an account it does not own";
            case UNBALANCED_INSTRUCTION:
                return "sum of account balances before and after instruction do not match";
            case ARITHMETIC_OVERFLOW:
                return "program arithmetic overflowed";
            case MAX_ACCOUNT_DATA_SIZE_EXCEEDED:
                return "account data size limit exceeded";
            case ACCOUNT_NOT_FOUND:
                return "account not found";
            case CUSTOM_PROGRAM_ERROR:
                return "custom program error";
            case UNKNOWN_ERROR:
                return "Unknown error";
            default:
                assert(false);
                return "Wrong error code";
            }
        }
    };

    static const Category category_instance;
    return category_instance;
}

/// Creates error_code object out of an svmkit error code value.
/// This is used by std::error_code to implement implicit conversion
/// svmkit::ErrorCode -> std::error_code.
inline std::error_code make_error_code(ErrorCode errc) noexcept
{
    return {errc, svmkit_category()};
}

/// The error an execution engine may throw instead of returning a failed result.
class ProgramError : public std::system_error
{
public:
    using std::system_error::system_error;
    explicit ProgramError(ErrorCode errc) : std::system_error{make_error_code(errc)} {}
};

}  // namespace svmkit

template <>
struct std::is_error_code_enum<svmkit::ErrorCode> : std::true_type
{};
