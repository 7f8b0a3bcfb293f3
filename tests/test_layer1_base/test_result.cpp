/**
 * @file test_result.cpp
 * @brief Layer 1 tests for Result<T, E> and Status<E>.
 */
#include "test_patterns.h"
#include "utils/result.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

using namespace mydiarelay::tests;
using mydiarelay::utils::ClaimError;
using mydiarelay::utils::LedgerError;
using mydiarelay::utils::MediaError;
using mydiarelay::utils::Result;
using mydiarelay::utils::Status;
using mydiarelay::utils::TunnelError;

class ResultTest : public PureApiTest
{
};

TEST_F(ResultTest, OkHoldsValue)
{
    auto r = Result<std::string, ClaimError>::ok("ABCD2345");
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.is_error());
    EXPECT_EQ(r.content(), "ABCD2345");
    EXPECT_THROW((void)r.error(), std::logic_error);
    EXPECT_THROW((void)r.error_code(), std::logic_error);
}

TEST_F(ResultTest, ErrorHoldsEnumAndCode)
{
    auto r = Result<std::string, ClaimError>::error(ClaimError::Locked, 409);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), ClaimError::Locked);
    EXPECT_EQ(r.error_code(), 409);
    EXPECT_THROW((void)r.content(), std::logic_error);
    EXPECT_EQ(r.value_or("fallback"), "fallback");
}

TEST_F(ResultTest, MoveOnlyPayloadCanBeMovedOut)
{
    auto r = Result<std::unique_ptr<int>, LedgerError>::ok(std::make_unique<int>(7));
    std::unique_ptr<int> p = std::move(r).content();
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(*p, 7);
}

TEST_F(ResultTest, DefaultConstructedIsError)
{
    Result<int, LedgerError> r;
    EXPECT_TRUE(r.is_error());
}

TEST_F(ResultTest, StatusCarriesNoValue)
{
    auto ok = Status<TunnelError>::ok({});
    auto bad = Status<TunnelError>::error(TunnelError::NegotiationFailed);
    EXPECT_TRUE(ok.is_ok());
    EXPECT_EQ(bad.error(), TunnelError::NegotiationFailed);
}

TEST_F(ResultTest, ErrorNamesMatchWireStrings)
{
    using mydiarelay::utils::to_string;
    EXPECT_STREQ(to_string(ClaimError::AlreadyConsumed), "already_consumed");
    EXPECT_STREQ(to_string(ClaimError::Locked), "locked");
    EXPECT_STREQ(to_string(LedgerError::TunnelDisconnected), "tunnel_disconnected");
    EXPECT_STREQ(to_string(LedgerError::Timeout), "timeout");
    EXPECT_STREQ(to_string(TunnelError::InvalidNamespace), "invalid_namespace");
    EXPECT_STREQ(to_string(MediaError::OutsideRoot), "Access denied");
    EXPECT_STREQ(to_string(MediaError::FileMissing), "File missing on disk");
}
