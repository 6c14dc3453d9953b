// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ObjectFS/Core/ObjectFilesystem.hpp"
#include "ObjectFS/Core/ObjectError.hpp"
using namespace boost::log::trivial;
namespace ObjectFS::Core
{
    ObjectFilesystem::ObjectFilesystem(std::shared_ptr<ObjectClient> client,
        const int64_t chunkSize,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger)
        : m_client(std::move(client)),
        m_chunkSize(chunkSize),
        m_logger(std::move(logger))
    {
        if (!m_client)
        {
            throw ObjectError(ObjectErrorCode::InvalidArgument, "An object client is required");
        }

        if (m_chunkSize < 0)
        {
            throw ObjectError(ObjectErrorCode::InvalidArgument, "Chunk size must not be negative");
        }

        if (!m_logger)
        {
            throw ObjectError(ObjectErrorCode::InvalidArgument, "A logger is required");
        }
    }

    ObjectReader ObjectFilesystem::Open(const std::string& key, CancellationToken cancellation) const
    {
        BOOST_LOG_SEV(*m_logger, debug) << "Opening '" << key << "' with chunk size " << m_chunkSize;
        return ObjectReader{ key, m_client, m_chunkSize, std::move(cancellation), m_logger };
    }

    std::vector<char> ObjectFilesystem::ReadAll(const std::string& key, CancellationToken cancellation) const
    {
        return ObjectReader::ReadAll(key, m_client, std::move(cancellation), m_logger);
    }

    ObjectAttributes ObjectFilesystem::Stat(const std::string& key, CancellationToken cancellation) const
    {
        const ObjectReader reader{ key, m_client, Configuration::Reader::StatProbeChunkSize, std::move(cancellation), m_logger };
        return reader.Stat();
    }

    bool ObjectFilesystem::Exists(const std::string& key, CancellationToken cancellation) const
    {
        try
        {
            [[maybe_unused]] const auto attributes = Stat(key, std::move(cancellation));
            return true;
        }
        catch (const ObjectError& ex)
        {
            if (ex.GetCode() == ObjectErrorCode::NotFound)
            {
                return false;
            }

            throw;
        }
    }

    int64_t ObjectFilesystem::GetChunkSize() const noexcept
    {
        return m_chunkSize;
    }

    const std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>>& ObjectFilesystem::GetLogger() const noexcept
    {
        return m_logger;
    }
}
