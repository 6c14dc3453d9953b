// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ObjectFS/RocksDB/ReadableFile.hpp"
#include "ObjectFS/RocksDB/ObjectErrorTranslator.hpp"
#include "ObjectFS/RocksDB/ObjectStoreFilesystem.hpp"

#include <cassert>
#include <limits>
namespace ObjectFS::RocksDB
{
    ReadableFile::ReadableFile(Core::ObjectReader reader)
        : m_reader(std::move(reader))
    {
    }

    size_t ReadableFile::ReadFully(const size_t n, char* scratch) const
    {
        size_t total = 0;
        while (total < n)
        {
            const auto bytesRead = m_reader.Read(std::span<char>(scratch + total, n - total));
            if (bytesRead == 0)
            {
                break;
            }

            assert(bytesRead > 0 && "Read should not return negative values");
            total += static_cast<size_t>(bytesRead);
        }

        return total;
    }

    rocksdb::IOStatus ReadableFile::Read(const size_t n,
        const rocksdb::IOOptions& options,
        rocksdb::Slice* result,
        char* scratch,
        rocksdb::IODebugContext*)
    {
        try
        {
            std::lock_guard lock(m_mutex);
            m_reader.SetCancellation(ObjectStoreFilesystem::ToCancellationToken(options));
            *result = rocksdb::Slice(scratch, ReadFully(n, scratch));
            return rocksdb::IOStatus::OK();
        }
        catch (const Core::ObjectError& e)
        {
            return ObjectErrorTranslator::IOStatusFromError(e);
        }
        catch (const std::exception& e)
        {
            return rocksdb::IOStatus::IOError(e.what());
        }
    }

    rocksdb::IOStatus ReadableFile::Read(const uint64_t offset,
        const size_t n,
        const rocksdb::IOOptions& options,
        rocksdb::Slice* result,
        char* scratch,
        rocksdb::IODebugContext*) const
    {
        try
        {
            assert(offset <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) &&
                "offset exceeds int64_t max value");
            std::lock_guard lock(m_mutex);
            m_reader.SetCancellation(ObjectStoreFilesystem::ToCancellationToken(options));
            m_reader.Seek(static_cast<int64_t>(offset), Core::SeekOrigin::Start);
            *result = rocksdb::Slice(scratch, ReadFully(n, scratch));
            return rocksdb::IOStatus::OK();
        }
        catch (const Core::ObjectError& e)
        {
            return ObjectErrorTranslator::IOStatusFromError(e);
        }
        catch (const std::exception& e)
        {
            return rocksdb::IOStatus::IOError(e.what());
        }
    }

    rocksdb::IOStatus ReadableFile::Skip(const uint64_t n)
    {
        try
        {
            assert(n <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) &&
                "skip value exceeds int64_t max value");
            std::lock_guard lock(m_mutex);
            m_reader.Seek(static_cast<int64_t>(n), Core::SeekOrigin::Current);
            return rocksdb::IOStatus::OK();
        }
        catch (const Core::ObjectError& e)
        {
            return ObjectErrorTranslator::IOStatusFromError(e);
        }
        catch (const std::exception& e)
        {
            return rocksdb::IOStatus::IOError(e.what());
        }
    }
}
