// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ObjectFS/S3/Models/S3StorageInfo.hpp"

#include <aws/core/client/ClientConfiguration.h>
#include <aws/s3/S3Client.h>

#include <memory>
namespace ObjectFS::S3::Impl
{
    struct S3Helpers
    {
        static Aws::Client::ClientConfiguration CreateClientConfiguration(const Models::S3StorageInfo& storage);
        static std::shared_ptr<const Aws::S3::S3Client> CreateClient(const Models::S3StorageInfo& storage);
    };
}
