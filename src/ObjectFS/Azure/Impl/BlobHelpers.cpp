// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ObjectFS/Azure/Impl/BlobHelpers.hpp"
#include "ObjectFS/Core/Configuration.hpp"
#include "ObjectFS/Core/ObjectError.hpp"

#include <azure/storage/common/storage_credential.hpp>

#include <memory>
namespace ObjectFS::Azure::Impl
{
    ::Azure::Storage::Blobs::BlobClientOptions BlobHelpers::CreateBlobClientOptions()
    {
        auto opts = ::Azure::Storage::Blobs::BlobClientOptions();
        opts.Retry.MaxRetries = Core::Configuration::MaxClientRetries;
        return opts;
    }

    ::Azure::Identity::ClientSecretCredentialOptions BlobHelpers::CreateClientSecretCredentialOptions()
    {
        auto opts = ::Azure::Identity::ClientSecretCredentialOptions();
        opts.Retry.MaxRetries = Core::Configuration::MaxClientRetries;
        return opts;
    }

    ::Azure::Identity::ClientSecretCredentialOptions BlobHelpers::CreateClientSecretCredentialOptions(const Models::ServicePrincipalStorageInfo& servicePrincipal)
    {
        auto opts = CreateClientSecretCredentialOptions();
        if (const auto authorityHost = servicePrincipal.GetAuthorityHost())
        {
            opts.AuthorityHost = std::string(*authorityHost);
        }

        return opts;
    }

    ::Azure::Storage::Blobs::BlobServiceClient BlobHelpers::CreateServiceClient(const Models::ServicePrincipalStorageInfo& servicePrincipal)
    {
        auto cred = std::make_shared<::Azure::Identity::ClientSecretCredential>(servicePrincipal.GetTenantId(),
            servicePrincipal.GetClientId(),
            servicePrincipal.GetClientSecret(),
            CreateClientSecretCredentialOptions(servicePrincipal));

        return ::Azure::Storage::Blobs::BlobServiceClient
        {
            servicePrincipal.GetStorageAccountUrl(),
            std::move(cred),
            CreateBlobClientOptions()
        };
    }

    ::Azure::Storage::Blobs::BlobServiceClient BlobHelpers::CreateServiceClient(const Models::SharedKeyStorageInfo& sharedKey)
    {
        const auto accountKey = sharedKey.GetAccountKey();
        if (!accountKey || accountKey->empty())
        {
            // SAS token or public access, the URL carries everything.
            return ::Azure::Storage::Blobs::BlobServiceClient
            {
                sharedKey.GetStorageAccountUrl(),
                CreateBlobClientOptions()
            };
        }

        return ::Azure::Storage::Blobs::BlobServiceClient
        {
            sharedKey.GetStorageAccountUrl(),
            std::make_shared<::Azure::Storage::StorageSharedKeyCredential>(sharedKey.GetAccountName(), std::string(*accountKey)),
            CreateBlobClientOptions()
        };
    }

    ::Azure::Storage::Blobs::BlobContainerClient BlobHelpers::GetContainerClient(const ::Azure::Storage::Blobs::BlobServiceClient& blobServiceClient, const std::string& name)
    {
        if (name.empty())
        {
            throw Core::ObjectError(Core::ObjectErrorCode::InvalidArgument, "A container name is required");
        }

        return blobServiceClient.GetBlobContainerClient(name);
    }
}
