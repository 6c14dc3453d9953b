// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ObjectFS/S3/S3Store.hpp"
#include "ObjectFS/Core/ObjectError.hpp"
#include "ObjectFS/S3/Impl/S3Helpers.hpp"
#include "ObjectFS/S3/Impl/S3ObjectClient.hpp"
using namespace boost::log::trivial;
namespace ObjectFS::S3
{
    std::shared_ptr<Core::ObjectFilesystem> S3Store::CreateFilesystem(const Models::S3StorageInfo& storage,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
        const int64_t chunkSize)
    {
        if (storage.GetBucket().empty())
        {
            throw Core::ObjectError(Core::ObjectErrorCode::InvalidArgument, "A bucket name is required");
        }

        auto client = std::make_shared<Impl::S3ObjectClient>(Impl::S3Helpers::CreateClient(storage), storage.GetBucket());
        auto filesystem = std::make_shared<Core::ObjectFilesystem>(std::move(client), chunkSize, std::move(logger));
        BOOST_LOG_SEV(*filesystem->GetLogger(), info) << "Using bucket '" << storage.GetBucket() << "' in " << storage.GetRegion()
            << (storage.GetEndpoint().empty() ? std::string() : " at " + storage.GetEndpoint());
        return filesystem;
    }
}
