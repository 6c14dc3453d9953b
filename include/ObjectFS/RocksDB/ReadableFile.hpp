// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ObjectFS/Core/ObjectReader.hpp"

#include <rocksdb/file_system.h>

#include <mutex>
namespace ObjectFS::RocksDB
{
    /// <summary>
    /// Serves RocksDB's sequential and positional reads from one object reader.
    /// Positional reads seek the shared reader, so all reads are serialized.
    /// Each read is bounded by the timeout of its own IOOptions; the timeout given at open only
    /// covers the first fetch.
    /// </summary>
    class ReadableFile final : public rocksdb::FSSequentialFile, public rocksdb::FSRandomAccessFile
    {
        mutable std::mutex m_mutex;
        mutable Core::ObjectReader m_reader;
    public:
        explicit ReadableFile(Core::ObjectReader reader);

        virtual rocksdb::IOStatus Read(size_t n, const rocksdb::IOOptions& options, rocksdb::Slice* result, char* scratch, rocksdb::IODebugContext* dbg) override;
        virtual rocksdb::IOStatus Read(uint64_t offset, size_t n, const rocksdb::IOOptions& options, rocksdb::Slice* result, char* scratch, rocksdb::IODebugContext* dbg) const override;
        virtual rocksdb::IOStatus Skip(uint64_t n) override;

    private:
        // NOTE: Reads until n bytes are copied or the object ends. Caller holds m_mutex.
        size_t ReadFully(size_t n, char* scratch) const;
    };
}
