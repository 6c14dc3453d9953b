// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ObjectFS/RocksDB/ObjectErrorTranslator.hpp"

#include <gtest/gtest.h>

using ObjectFS::Core::ObjectError;
using ObjectFS::Core::ObjectErrorCode;
using ObjectFS::RocksDB::ObjectErrorTranslator;

TEST(ObjectErrorTranslatorTests, NotFound_IsNotFound)
{
    const auto status = ObjectErrorTranslator::IOStatusFromError(ObjectError(ObjectErrorCode::NotFound, "missing"));

    EXPECT_TRUE(status.IsNotFound());
}

TEST(ObjectErrorTranslatorTests, InvalidArgument_IsInvalidArgument)
{
    const auto status = ObjectErrorTranslator::IOStatusFromError(ObjectError(ObjectErrorCode::InvalidArgument, "bad seek"));

    EXPECT_TRUE(status.IsInvalidArgument());
}

TEST(ObjectErrorTranslatorTests, Cancelled_IsAborted)
{
    const auto status = ObjectErrorTranslator::IOStatusFromError(ObjectError(ObjectErrorCode::Cancelled, "stopped"));

    EXPECT_TRUE(status.IsAborted());
}

TEST(ObjectErrorTranslatorTests, TransportFailure_IsRetryableIOError)
{
    const auto status = ObjectErrorTranslator::IOStatusFromError(ObjectError(ObjectErrorCode::TransportFailure, "connection reset"));

    EXPECT_TRUE(status.IsIOError());
    EXPECT_TRUE(status.GetRetryable());
}

TEST(ObjectErrorTranslatorTests, OtherCodes_AreIOErrors)
{
    for (const auto code : { ObjectErrorCode::RangeNotSatisfiable,
        ObjectErrorCode::MalformedResponse,
        ObjectErrorCode::ObjectChanged,
        ObjectErrorCode::PermissionDenied })
    {
        const auto status = ObjectErrorTranslator::IOStatusFromError(ObjectError(code, "failed"));

        EXPECT_TRUE(status.IsIOError()) << ObjectFS::Core::ToString(code);
        EXPECT_FALSE(status.GetRetryable()) << ObjectFS::Core::ToString(code);
        EXPECT_NE(std::string::npos, status.ToString().find("failed"));
    }
}
