// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ObjectFS/S3/Impl/S3Helpers.hpp"
#include "ObjectFS/Core/Configuration.hpp"

#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/auth/AWSCredentialsProviderChain.h>
#include <aws/core/client/DefaultRetryStrategy.h>
namespace ObjectFS::S3::Impl
{
    Aws::Client::ClientConfiguration S3Helpers::CreateClientConfiguration(const Models::S3StorageInfo& storage)
    {
        Aws::Client::ClientConfiguration config;
        config.region = storage.GetRegion();
        if (!storage.GetEndpoint().empty())
        {
            config.endpointOverride = storage.GetEndpoint();
        }

        config.retryStrategy = std::make_shared<Aws::Client::DefaultRetryStrategy>(Core::Configuration::MaxClientRetries);
        return config;
    }

    std::shared_ptr<const Aws::S3::S3Client> S3Helpers::CreateClient(const Models::S3StorageInfo& storage)
    {
        const auto config = CreateClientConfiguration(storage);
        const bool useVirtualAddressing = storage.GetEndpoint().empty();

        if (storage.HasCredentials())
        {
            const Aws::Auth::AWSCredentials credentials(storage.GetAccessKeyId(), storage.GetSecretAccessKey());
            return std::make_shared<const Aws::S3::S3Client>(credentials,
                config,
                Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
                useVirtualAddressing);
        }

        return std::make_shared<const Aws::S3::S3Client>(std::make_shared<Aws::Auth::DefaultAWSCredentialsProviderChain>(),
            config,
            Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
            useVirtualAddressing);
    }
}
