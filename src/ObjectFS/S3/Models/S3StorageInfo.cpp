// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ObjectFS/S3/Models/S3StorageInfo.hpp"
namespace ObjectFS::S3::Models
{
    S3StorageInfo::S3StorageInfo(std::string bucket,
        std::string endpoint,
        std::string region,
        std::string accessKeyId,
        std::string secretAccessKey)
        : m_bucket(std::move(bucket)),
        m_endpoint(std::move(endpoint)),
        m_region(region.empty() ? std::string(DefaultRegion) : std::move(region)),
        m_accessKeyId(std::move(accessKeyId)),
        m_secretAccessKey(std::move(secretAccessKey))
    {
    }

    const std::string& S3StorageInfo::GetBucket() const noexcept
    {
        return m_bucket;
    }

    const std::string& S3StorageInfo::GetEndpoint() const noexcept
    {
        return m_endpoint;
    }

    const std::string& S3StorageInfo::GetRegion() const noexcept
    {
        return m_region;
    }

    const std::string& S3StorageInfo::GetAccessKeyId() const noexcept
    {
        return m_accessKeyId;
    }

    const std::string& S3StorageInfo::GetSecretAccessKey() const noexcept
    {
        return m_secretAccessKey;
    }

    bool S3StorageInfo::HasCredentials() const noexcept
    {
        return !m_accessKeyId.empty();
    }
}
