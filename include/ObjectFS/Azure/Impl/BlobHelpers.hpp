// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ObjectFS/Azure/Models/ServicePrincipalStorageInfo.hpp"
#include "ObjectFS/Azure/Models/SharedKeyStorageInfo.hpp"

#include <azure/identity/client_secret_credential.hpp>
#include <azure/storage/blobs/blob_container_client.hpp>
#include <azure/storage/blobs/blob_service_client.hpp>

#include <string>
namespace ObjectFS::Azure::Impl
{
    struct BlobHelpers
    {
        static ::Azure::Storage::Blobs::BlobClientOptions CreateBlobClientOptions();
        static ::Azure::Identity::ClientSecretCredentialOptions CreateClientSecretCredentialOptions();
        static ::Azure::Identity::ClientSecretCredentialOptions CreateClientSecretCredentialOptions(const Models::ServicePrincipalStorageInfo& servicePrincipal);
        static ::Azure::Storage::Blobs::BlobServiceClient CreateServiceClient(const Models::ServicePrincipalStorageInfo& servicePrincipal);
        static ::Azure::Storage::Blobs::BlobServiceClient CreateServiceClient(const Models::SharedKeyStorageInfo& sharedKey);
        static ::Azure::Storage::Blobs::BlobContainerClient GetContainerClient(const ::Azure::Storage::Blobs::BlobServiceClient& blobServiceClient, const std::string& name);
    };
}
