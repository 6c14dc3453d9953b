// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ObjectFS/Core/Configuration.hpp"
#include "ObjectFS/Core/ObjectFilesystem.hpp"
#include "ObjectFS/Azure/Models/ServicePrincipalStorageInfo.hpp"
#include "ObjectFS/Azure/Models/SharedKeyStorageInfo.hpp"

#include <boost/log/trivial.hpp>

#include <cstdint>
#include <memory>
namespace ObjectFS::Azure
{
    struct BlobStore
    {
        static std::shared_ptr<Core::ObjectFilesystem> CreateFilesystem(const Models::SharedKeyStorageInfo& storage,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
            int64_t chunkSize = Core::Configuration::Reader::DefaultChunkSize);
        static std::shared_ptr<Core::ObjectFilesystem> CreateFilesystem(const Models::ServicePrincipalStorageInfo& storage,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
            int64_t chunkSize = Core::Configuration::Reader::DefaultChunkSize);
    };
}
