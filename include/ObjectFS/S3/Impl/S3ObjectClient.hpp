// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ObjectFS/Core/ObjectClient.hpp"

#include <aws/s3/S3Client.h>
#include <aws/s3/model/GetObjectResult.h>

#include <memory>
#include <string>
namespace ObjectFS::S3::Impl
{
    /// <summary>
    /// Fetches the objects of one bucket with GetObject. Ranges are sent as a "bytes=a-b" Range header.
    /// </summary>
    class S3ObjectClient final : public Core::ObjectClient
    {
        std::shared_ptr<const Aws::S3::S3Client> m_client;
        std::string m_bucket;

    public:
        S3ObjectClient(std::shared_ptr<const Aws::S3::S3Client> client, std::string bucket);

        virtual Core::FetchResponse Fetch(const std::string& key,
            const std::optional<Core::ByteRange>& range,
            const Core::CancellationToken& cancellation) override;

        // NOTE: Content-Range is only kept for ranged requests.
        [[nodiscard]] static Core::FetchResponse ToFetchResponse(const std::string& key,
            const std::optional<Core::ByteRange>& range,
            Aws::S3::Model::GetObjectResult result);
    };
}
