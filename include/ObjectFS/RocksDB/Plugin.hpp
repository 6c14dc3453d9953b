// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ObjectFS/Core/ObjectFilesystem.hpp"

#include <boost/log/trivial.hpp>
#include <rocksdb/convenience.h>
#include <rocksdb/env.h>

#include <memory>
#include <string_view>
namespace ObjectFS::RocksDB
{
    struct Plugin
    {
        static const constexpr std::string_view Name = "objectfs";

        /// <summary>
        /// Registers a read only filesystem over the store under "objectfs" + storeName and creates an Env for it.
        /// Open the database with rocksdb::DB::OpenForReadOnly using the returned Env.
        /// </summary>
        static rocksdb::Status Register(rocksdb::ConfigOptions& configOptions,
            rocksdb::Env** env,
            std::shared_ptr<rocksdb::Env>* guard,
            std::string_view storeName,
            std::shared_ptr<Core::ObjectFilesystem> filesystem,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger);
    };
}
