// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ObjectFS/Azure/Models/SharedKeyStorageInfo.hpp"
namespace ObjectFS::Azure::Models
{
    SharedKeyStorageInfo::SharedKeyStorageInfo(std::string containerName,
        std::string storageAccountUrl,
        std::string accountName,
        std::optional<std::string> accountKey)
        : m_containerName(std::move(containerName)),
        m_storageAccountUrl(std::move(storageAccountUrl)),
        m_accountName(std::move(accountName)),
        m_accountKey(std::move(accountKey))
    {
    }

    const std::string& SharedKeyStorageInfo::GetContainerName() const noexcept
    {
        return m_containerName;
    }

    const std::string& SharedKeyStorageInfo::GetStorageAccountUrl() const noexcept
    {
        return m_storageAccountUrl;
    }

    const std::string& SharedKeyStorageInfo::GetAccountName() const noexcept
    {
        return m_accountName;
    }

    std::optional<std::string_view> SharedKeyStorageInfo::GetAccountKey() const noexcept
    {
        return m_accountKey;
    }
}
