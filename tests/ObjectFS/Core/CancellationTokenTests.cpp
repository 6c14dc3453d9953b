// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ObjectFS/Core/CancellationToken.hpp"
#include "ObjectFS/Core/ObjectError.hpp"

#include <gtest/gtest.h>

using ObjectFS::Core::CancellationToken;
using ObjectFS::Core::ObjectError;
using ObjectFS::Core::ObjectErrorCode;

TEST(CancellationTokenTests, Default_NeverCancels)
{
    const CancellationToken token;

    EXPECT_FALSE(token.IsCancellationRequested());
    EXPECT_FALSE(token.GetDeadline().has_value());
    EXPECT_NO_THROW(token.ThrowIfCancellationRequested());
}

TEST(CancellationTokenTests, StopRequested_ThrowsCancelled)
{
    // Arrange
    std::stop_source source;
    const CancellationToken token{ source.get_token() };
    EXPECT_FALSE(token.IsStopRequested());

    // Act
    source.request_stop();

    // Assert
    EXPECT_TRUE(token.IsStopRequested());
    EXPECT_TRUE(token.IsCancellationRequested());
    try
    {
        token.ThrowIfCancellationRequested();
        FAIL() << "Expected ObjectError";
    }
    catch (const ObjectError& ex)
    {
        EXPECT_EQ(ObjectErrorCode::Cancelled, ex.GetCode());
        EXPECT_STREQ("Operation was cancelled", ex.what());
    }
}

TEST(CancellationTokenTests, PassedDeadline_ThrowsCancelled)
{
    // Arrange
    const auto token = CancellationToken::WithTimeout(std::chrono::milliseconds(-1000));

    // Act & Assert
    EXPECT_TRUE(token.IsExpired());
    EXPECT_FALSE(token.IsStopRequested());
    try
    {
        token.ThrowIfCancellationRequested();
        FAIL() << "Expected ObjectError";
    }
    catch (const ObjectError& ex)
    {
        EXPECT_EQ(ObjectErrorCode::Cancelled, ex.GetCode());
        EXPECT_STREQ("Operation deadline expired", ex.what());
    }
}

TEST(CancellationTokenTests, FutureDeadline_DoesNotCancel)
{
    const auto token = CancellationToken::WithTimeout(std::chrono::hours(1));

    ASSERT_TRUE(token.GetDeadline().has_value());
    EXPECT_FALSE(token.IsCancellationRequested());
}
