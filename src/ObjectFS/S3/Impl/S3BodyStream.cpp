// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ObjectFS/S3/Impl/S3BodyStream.hpp"
#include "ObjectFS/Core/ObjectError.hpp"
namespace ObjectFS::S3::Impl
{
    S3BodyStream::S3BodyStream(std::string key, Aws::S3::Model::GetObjectResult result)
        : m_key(std::move(key)),
        m_result(std::move(result))
    {
    }

    int64_t S3BodyStream::Read(std::span<char> buffer)
    {
        auto& body = m_result.GetBody();
        body.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));

        // eof and fail are set by the final short read, gcount still holds its length.
        if (body.bad())
        {
            throw Core::ObjectError(Core::ObjectErrorCode::TransportFailure, "Failed to read the body of '" + m_key + "'");
        }

        return static_cast<int64_t>(body.gcount());
    }
}
