// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ObjectFS/Core/Configuration.hpp"
#include "ObjectFS/Core/ObjectFilesystem.hpp"
#include "ObjectFS/S3/Models/S3StorageInfo.hpp"

#include <boost/log/trivial.hpp>

#include <cstdint>
#include <memory>
namespace ObjectFS::S3
{
    struct S3Store
    {
        // NOTE: Requires a live SdkGuard.
        static std::shared_ptr<Core::ObjectFilesystem> CreateFilesystem(const Models::S3StorageInfo& storage,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
            int64_t chunkSize = Core::Configuration::Reader::DefaultChunkSize);
    };
}
