// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ObjectFS/Core/CancellationToken.hpp"
#include "ObjectFS/Core/ObjectFilesystem.hpp"

#include <boost/log/trivial.hpp>

#include <rocksdb/file_system.h>

#include <memory>
#include <string>
#include <vector>
namespace ObjectFS::RocksDB
{
    /// <summary>
    /// A read only rocksdb::FileSystem over a bucket or container. Paths map to keys with their
    /// leading separators removed. Every operation that would modify the store returns NotSupported.
    ///
    /// The stores have no listing capability, so every directory lists as empty. A read only open
    /// then finds no write ahead logs to replay and never touches the local disk.
    /// </summary>
    class ObjectStoreFilesystem final : public rocksdb::FileSystemWrapper
    {
        std::shared_ptr<Core::ObjectFilesystem> m_filesystem;
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> m_logger;

    public:
        ObjectStoreFilesystem(std::shared_ptr<rocksdb::FileSystem> rocksdbFs,
            std::shared_ptr<Core::ObjectFilesystem> filesystem,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger);
        ObjectStoreFilesystem(const ObjectStoreFilesystem&) = delete;
        ObjectStoreFilesystem& operator=(const ObjectStoreFilesystem&) = delete;

        [[nodiscard]] static std::string ToKey(const std::string& path);
        [[nodiscard]] static Core::CancellationToken ToCancellationToken(const rocksdb::IOOptions& options);

        virtual const char* Name() const override;
        virtual rocksdb::IOStatus NewSequentialFile(const std::string& f,
            const rocksdb::FileOptions& file_opts,
            std::unique_ptr<rocksdb::FSSequentialFile>* r,
            rocksdb::IODebugContext* dbg) override;
        virtual rocksdb::IOStatus NewRandomAccessFile(const std::string& f,
            const rocksdb::FileOptions& file_opts,
            std::unique_ptr<rocksdb::FSRandomAccessFile>* r,
            rocksdb::IODebugContext* dbg) override;
        virtual rocksdb::IOStatus NewWritableFile(const std::string& f,
            const rocksdb::FileOptions& file_opts,
            std::unique_ptr<rocksdb::FSWritableFile>* r,
            rocksdb::IODebugContext* dbg) override;
        virtual rocksdb::IOStatus ReopenWritableFile(const std::string& fname,
            const rocksdb::FileOptions& file_opts,
            std::unique_ptr<rocksdb::FSWritableFile>* result,
            rocksdb::IODebugContext* dbg) override;
        virtual rocksdb::IOStatus ReuseWritableFile(const std::string& fname,
            const std::string& old_fname,
            const rocksdb::FileOptions& file_opts,
            std::unique_ptr<rocksdb::FSWritableFile>* r,
            rocksdb::IODebugContext* dbg) override;
        virtual rocksdb::IOStatus NewRandomRWFile(const std::string& fname,
            const rocksdb::FileOptions& file_opts,
            std::unique_ptr<rocksdb::FSRandomRWFile>* result,
            rocksdb::IODebugContext* dbg) override;
        virtual rocksdb::IOStatus FileExists(const std::string& f,
            const rocksdb::IOOptions& io_opts,
            rocksdb::IODebugContext* dbg) override;
        virtual rocksdb::IOStatus GetChildren(const std::string& dir,
            const rocksdb::IOOptions& options,
            std::vector<std::string>* r,
            rocksdb::IODebugContext* dbg) override;
        virtual rocksdb::IOStatus GetChildrenFileAttributes(const std::string& dir,
            const rocksdb::IOOptions& options,
            std::vector<rocksdb::FileAttributes>* result,
            rocksdb::IODebugContext* dbg) override;
        virtual rocksdb::IOStatus IsDirectory(const std::string& path,
            const rocksdb::IOOptions& options,
            bool* is_dir,
            rocksdb::IODebugContext* dbg) override;
        virtual rocksdb::IOStatus DeleteFile(const std::string& f,
            const rocksdb::IOOptions& options,
            rocksdb::IODebugContext* dbg) override;
        virtual rocksdb::IOStatus Truncate(const std::string& fname,
            size_t size,
            const rocksdb::IOOptions& options,
            rocksdb::IODebugContext* dbg) override;
        virtual rocksdb::IOStatus CreateDir(const std::string& d,
            const rocksdb::IOOptions& options,
            rocksdb::IODebugContext* dbg) override;
        virtual rocksdb::IOStatus CreateDirIfMissing(const std::string& d,
            const rocksdb::IOOptions& options,
            rocksdb::IODebugContext* dbg) override;
        virtual rocksdb::IOStatus DeleteDir(const std::string& d,
            const rocksdb::IOOptions& options,
            rocksdb::IODebugContext* dbg) override;
        virtual rocksdb::IOStatus GetFileSize(const std::string& f,
            const rocksdb::IOOptions& options,
            uint64_t* s,
            rocksdb::IODebugContext* dbg) override;
        virtual rocksdb::IOStatus GetFileModificationTime(const std::string& fname,
            const rocksdb::IOOptions& options,
            uint64_t* file_mtime,
            rocksdb::IODebugContext* dbg) override;
        virtual rocksdb::IOStatus RenameFile(const std::string& s,
            const std::string& t,
            const rocksdb::IOOptions& options,
            rocksdb::IODebugContext* dbg) override;
        virtual rocksdb::IOStatus LinkFile(const std::string& s,
            const std::string& t,
            const rocksdb::IOOptions& options,
            rocksdb::IODebugContext* dbg) override;

    private:
        rocksdb::IOStatus LogAndTranslate(const char* operation, const std::string& path, const std::exception& ex) const;
    };
}
