// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <optional>
#include <string>
#include <string_view>
namespace ObjectFS::Azure::Models
{
    /// <summary>
    /// Connection settings for a storage account accessed through an Entra ID application.
    /// The tenant, client id, client secret and account URL are required; construction throws
    /// an InvalidArgument ObjectError naming the first one that is empty.
    /// </summary>
    class ServicePrincipalStorageInfo
    {
        std::string m_containerName;
        std::string m_storageAccountUrl;
        std::string m_tenantId;
        std::string m_clientId;
        std::string m_clientSecret;
        std::optional<std::string> m_authorityHost;
    public:
        /// <param name="authorityHost">Token endpoint for sovereign clouds, e.g. "https://login.chinacloudapi.cn/". The public cloud is used when empty.</param>
        ServicePrincipalStorageInfo(std::string containerName,
            std::string storageAccountUrl,
            std::string tenantId,
            std::string clientId,
            std::string clientSecret,
            std::optional<std::string> authorityHost = {});

        const std::string& GetContainerName() const noexcept;
        const std::string& GetStorageAccountUrl() const noexcept;
        const std::string& GetTenantId() const noexcept;
        const std::string& GetClientId() const noexcept;
        const std::string& GetClientSecret() const noexcept;
        std::optional<std::string_view> GetAuthorityHost() const noexcept;
    };
}
