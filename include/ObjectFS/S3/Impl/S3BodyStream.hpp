// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ObjectFS/Core/BodyStream.hpp"

#include <aws/s3/model/GetObjectResult.h>

#include <string>
namespace ObjectFS::S3::Impl
{
    /// <summary>
    /// Owns a GetObject result and reads its body. A short read at the end of the body is
    /// returned as is; only a broken stream is an error.
    /// </summary>
    class S3BodyStream final : public Core::BodyStream
    {
        std::string m_key;
        Aws::S3::Model::GetObjectResult m_result;

    public:
        S3BodyStream(std::string key, Aws::S3::Model::GetObjectResult result);

        virtual int64_t Read(std::span<char> buffer) override;
    };
}
