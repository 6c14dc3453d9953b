// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <string>
namespace ObjectFS::S3::Models
{
    /// <summary>
    /// Connection settings for an S3 compatible bucket.
    ///
    /// An empty endpoint targets AWS itself with virtual hosted addressing, any other endpoint
    /// (MinIO, Ceph, ...) is addressed path style. Without an access key the SDK's default
    /// credential chain is used.
    /// </summary>
    class S3StorageInfo
    {
        std::string m_bucket;
        std::string m_endpoint;
        std::string m_region;
        std::string m_accessKeyId;
        std::string m_secretAccessKey;
    public:
        static constexpr const char* DefaultRegion = "us-east-1";

        S3StorageInfo(std::string bucket,
            std::string endpoint = {},
            std::string region = {},
            std::string accessKeyId = {},
            std::string secretAccessKey = {});

        const std::string& GetBucket() const noexcept;
        const std::string& GetEndpoint() const noexcept;

        // NOTE: Falls back to DefaultRegion when none was given.
        const std::string& GetRegion() const noexcept;
        const std::string& GetAccessKeyId() const noexcept;
        const std::string& GetSecretAccessKey() const noexcept;
        bool HasCredentials() const noexcept;
    };
}
