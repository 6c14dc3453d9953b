// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ObjectFS/Azure/BlobStore.hpp"
#include "ObjectFS/Azure/Impl/AzureObjectClient.hpp"
#include "ObjectFS/Azure/Impl/BlobHelpers.hpp"
using namespace boost::log::trivial;
namespace ObjectFS::Azure
{
    std::shared_ptr<Core::ObjectFilesystem> BlobStore::CreateFilesystem(const Models::SharedKeyStorageInfo& storage,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
        const int64_t chunkSize)
    {
        const auto serviceClient = Impl::BlobHelpers::CreateServiceClient(storage);
        auto containerClient = Impl::BlobHelpers::GetContainerClient(serviceClient, storage.GetContainerName());
        auto filesystem = std::make_shared<Core::ObjectFilesystem>(std::make_shared<Impl::AzureObjectClient>(std::move(containerClient)), chunkSize, std::move(logger));
        BOOST_LOG_SEV(*filesystem->GetLogger(), info) << "Using container '" << storage.GetContainerName() << "' of " << storage.GetAccountName();
        return filesystem;
    }

    std::shared_ptr<Core::ObjectFilesystem> BlobStore::CreateFilesystem(const Models::ServicePrincipalStorageInfo& storage,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
        const int64_t chunkSize)
    {
        const auto serviceClient = Impl::BlobHelpers::CreateServiceClient(storage);
        auto containerClient = Impl::BlobHelpers::GetContainerClient(serviceClient, storage.GetContainerName());
        auto filesystem = std::make_shared<Core::ObjectFilesystem>(std::make_shared<Impl::AzureObjectClient>(std::move(containerClient)), chunkSize, std::move(logger));
        BOOST_LOG_SEV(*filesystem->GetLogger(), info) << "Using container '" << storage.GetContainerName() << "' of " << storage.GetStorageAccountUrl();
        return filesystem;
    }
}
