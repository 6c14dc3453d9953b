// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ObjectFS/RocksDB/Plugin.hpp"
#include "ObjectFS/RocksDB/ObjectStoreFilesystem.hpp"

#include <rocksdb/file_system.h>
#include <rocksdb/utilities/object_registry.h>

namespace ObjectFS::RocksDB
{
    rocksdb::Status Plugin::Register(rocksdb::ConfigOptions& configOptions,
        rocksdb::Env** env,
        std::shared_ptr<rocksdb::Env>* guard,
        std::string_view storeName,
        std::shared_ptr<Core::ObjectFilesystem> filesystem,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger)
    {
        if (!filesystem)
        {
            return rocksdb::Status::InvalidArgument("An object filesystem is required");
        }

        const auto pluginName = std::string(Name) + std::string(storeName);
        if (rocksdb::ObjectLibrary::Default()->FindFactory<rocksdb::FileSystem>(pluginName) == nullptr)
        {
            rocksdb::ObjectLibrary::Default()->AddFactory<rocksdb::FileSystem>(pluginName,
                [filesystem = std::move(filesystem), logger = std::move(logger)](const std::string& /* uri */, std::unique_ptr<rocksdb::FileSystem>* f, std::string* /* errmsg */)
                {
                    *f = std::make_unique<ObjectStoreFilesystem>(rocksdb::FileSystem::Default(), filesystem, logger);
                    return f->get();
                });
        }

        return rocksdb::Env::CreateFromUri(configOptions, "", pluginName, env, guard);
    }
}
