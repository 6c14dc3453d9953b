// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ObjectFS/Core/CancellationToken.hpp"
#include "ObjectFS/Core/Configuration.hpp"
#include "ObjectFS/Core/ObjectAttributes.hpp"
#include "ObjectFS/Core/ObjectClient.hpp"
#include "ObjectFS/Core/ObjectReader.hpp"

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
namespace ObjectFS::Core
{
    /// <summary>
    /// Read only file access to the objects of one bucket or container.
    /// </summary>
    class ObjectFilesystem
    {
        std::shared_ptr<ObjectClient> m_client;
        int64_t m_chunkSize;
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> m_logger;

    public:
        ObjectFilesystem(std::shared_ptr<ObjectClient> client,
            int64_t chunkSize,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger);

        /// <summary>
        /// Opens an object for reading. The first chunk is fetched before this returns.
        /// </summary>
        [[nodiscard]] ObjectReader Open(const std::string& key, CancellationToken cancellation = {}) const;

        /// <summary>
        /// Downloads a whole object with one request regardless of the configured chunk size.
        /// </summary>
        [[nodiscard]] std::vector<char> ReadAll(const std::string& key, CancellationToken cancellation = {}) const;

        /// <summary>
        /// Fetches the first byte of an object to learn its size and modification time.
        /// </summary>
        [[nodiscard]] ObjectAttributes Stat(const std::string& key, CancellationToken cancellation = {}) const;

        [[nodiscard]] bool Exists(const std::string& key, CancellationToken cancellation = {}) const;

        [[nodiscard]] int64_t GetChunkSize() const noexcept;
        [[nodiscard]] const std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>>& GetLogger() const noexcept;
    };
}
