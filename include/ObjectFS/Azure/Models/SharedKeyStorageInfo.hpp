// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <optional>
#include <string>
#include <string_view>
namespace ObjectFS::Azure::Models
{
    /// <summary>
    /// Connection settings for a storage account addressed with its account key.
    ///
    /// Without a key the account URL is used as is, which is how SAS token URLs
    /// ("https://account.blob.core.windows.net?sv=...") are accessed.
    /// </summary>
    class SharedKeyStorageInfo
    {
        std::string m_containerName;
        std::string m_storageAccountUrl;
        std::string m_accountName;
        std::optional<std::string> m_accountKey;
    public:
        SharedKeyStorageInfo(std::string containerName,
            std::string storageAccountUrl,
            std::string accountName,
            std::optional<std::string> accountKey = {});

        const std::string& GetContainerName() const noexcept;
        const std::string& GetStorageAccountUrl() const noexcept;
        const std::string& GetAccountName() const noexcept;
        std::optional<std::string_view> GetAccountKey() const noexcept;
    };
}
