// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ObjectFS/Azure/Models/ServicePrincipalStorageInfo.hpp"
#include "ObjectFS/Core/ObjectError.hpp"
namespace ObjectFS::Azure::Models
{
    static void RequireSetting(const std::string& value, const char* name)
    {
        if (value.empty())
        {
            throw Core::ObjectError(Core::ObjectErrorCode::InvalidArgument, std::string("Service principal setting '") + name + "' is empty");
        }
    }

    ServicePrincipalStorageInfo::ServicePrincipalStorageInfo(std::string containerName,
        std::string storageAccountUrl,
        std::string tenantId,
        std::string clientId,
        std::string clientSecret,
        std::optional<std::string> authorityHost)
        : m_containerName(std::move(containerName)),
        m_storageAccountUrl(std::move(storageAccountUrl)),
        m_tenantId(std::move(tenantId)),
        m_clientId(std::move(clientId)),
        m_clientSecret(std::move(clientSecret)),
        m_authorityHost(std::move(authorityHost))
    {
        RequireSetting(m_storageAccountUrl, "storageAccountUrl");
        RequireSetting(m_tenantId, "tenantId");
        RequireSetting(m_clientId, "clientId");
        RequireSetting(m_clientSecret, "clientSecret");
    }

    const std::string& ServicePrincipalStorageInfo::GetContainerName() const noexcept
    {
        return m_containerName;
    }

    const std::string& ServicePrincipalStorageInfo::GetStorageAccountUrl() const noexcept
    {
        return m_storageAccountUrl;
    }

    const std::string& ServicePrincipalStorageInfo::GetTenantId() const noexcept
    {
        return m_tenantId;
    }

    const std::string& ServicePrincipalStorageInfo::GetClientId() const noexcept
    {
        return m_clientId;
    }

    const std::string& ServicePrincipalStorageInfo::GetClientSecret() const noexcept
    {
        return m_clientSecret;
    }

    std::optional<std::string_view> ServicePrincipalStorageInfo::GetAuthorityHost() const noexcept
    {
        if (!m_authorityHost || m_authorityHost->empty())
        {
            return std::nullopt;
        }

        return *m_authorityHost;
    }
}
