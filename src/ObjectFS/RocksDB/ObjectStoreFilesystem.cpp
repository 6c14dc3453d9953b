// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ObjectFS/RocksDB/ObjectStoreFilesystem.hpp"
#include "ObjectFS/RocksDB/ObjectErrorTranslator.hpp"
#include "ObjectFS/RocksDB/ReadableFile.hpp"

#include <chrono>
namespace ObjectFS::RocksDB
{
    using namespace boost::log::trivial;

    static const constexpr char* ReadOnlyMessage = "Object store filesystems are read only";

    ObjectStoreFilesystem::ObjectStoreFilesystem(std::shared_ptr<rocksdb::FileSystem> rocksdbFs,
        std::shared_ptr<Core::ObjectFilesystem> filesystem,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger)
        : rocksdb::FileSystemWrapper(std::move(rocksdbFs)),
        m_filesystem(std::move(filesystem)),
        m_logger(std::move(logger))
    {
    }

    std::string ObjectStoreFilesystem::ToKey(const std::string& path)
    {
        const auto start = path.find_first_not_of('/');
        return start == std::string::npos ? std::string() : path.substr(start);
    }

    Core::CancellationToken ObjectStoreFilesystem::ToCancellationToken(const rocksdb::IOOptions& options)
    {
        if (options.timeout.count() <= 0)
        {
            return {};
        }

        return Core::CancellationToken::WithTimeout(std::chrono::duration_cast<std::chrono::milliseconds>(options.timeout));
    }

    rocksdb::IOStatus ObjectStoreFilesystem::LogAndTranslate(const char* operation, const std::string& path, const std::exception& ex) const
    {
        if (const auto* objectError = dynamic_cast<const Core::ObjectError*>(&ex))
        {
            // Missing files are routine for RocksDB probes.
            if (objectError->GetCode() != Core::ObjectErrorCode::NotFound)
            {
                BOOST_LOG_SEV(*m_logger, error) << operation << " failed for '" << path << "' (" << Core::ToString(objectError->GetCode()) << ") " << ex.what();
            }

            return ObjectErrorTranslator::IOStatusFromError(*objectError);
        }

        BOOST_LOG_SEV(*m_logger, error) << operation << " failed for '" << path << "' " << ex.what();
        return rocksdb::IOStatus::IOError(ex.what());
    }

    const char* ObjectStoreFilesystem::Name() const
    {
        return "ObjectStoreFileSystem";
    }

    rocksdb::IOStatus ObjectStoreFilesystem::NewSequentialFile(const std::string& f,
        const rocksdb::FileOptions& file_opts,
        std::unique_ptr<rocksdb::FSSequentialFile>* r,
        rocksdb::IODebugContext*)
    {
        try
        {
            *r = std::make_unique<ReadableFile>(m_filesystem->Open(ToKey(f), ToCancellationToken(file_opts.io_options)));
            return rocksdb::IOStatus::OK();
        }
        catch (const std::exception& ex)
        {
            return LogAndTranslate("NewSequentialFile", f, ex);
        }
    }

    rocksdb::IOStatus ObjectStoreFilesystem::NewRandomAccessFile(const std::string& f,
        const rocksdb::FileOptions& file_opts,
        std::unique_ptr<rocksdb::FSRandomAccessFile>* r,
        rocksdb::IODebugContext*)
    {
        try
        {
            *r = std::make_unique<ReadableFile>(m_filesystem->Open(ToKey(f), ToCancellationToken(file_opts.io_options)));
            return rocksdb::IOStatus::OK();
        }
        catch (const std::exception& ex)
        {
            return LogAndTranslate("NewRandomAccessFile", f, ex);
        }
    }

    rocksdb::IOStatus ObjectStoreFilesystem::NewWritableFile(const std::string&,
        const rocksdb::FileOptions&,
        std::unique_ptr<rocksdb::FSWritableFile>*,
        rocksdb::IODebugContext*)
    {
        return rocksdb::IOStatus::NotSupported(ReadOnlyMessage);
    }

    rocksdb::IOStatus ObjectStoreFilesystem::ReopenWritableFile(const std::string&,
        const rocksdb::FileOptions&,
        std::unique_ptr<rocksdb::FSWritableFile>*,
        rocksdb::IODebugContext*)
    {
        return rocksdb::IOStatus::NotSupported(ReadOnlyMessage);
    }

    rocksdb::IOStatus ObjectStoreFilesystem::ReuseWritableFile(const std::string&,
        const std::string&,
        const rocksdb::FileOptions&,
        std::unique_ptr<rocksdb::FSWritableFile>*,
        rocksdb::IODebugContext*)
    {
        return rocksdb::IOStatus::NotSupported(ReadOnlyMessage);
    }

    rocksdb::IOStatus ObjectStoreFilesystem::NewRandomRWFile(const std::string&,
        const rocksdb::FileOptions&,
        std::unique_ptr<rocksdb::FSRandomRWFile>*,
        rocksdb::IODebugContext*)
    {
        return rocksdb::IOStatus::NotSupported(ReadOnlyMessage);
    }

    rocksdb::IOStatus ObjectStoreFilesystem::FileExists(const std::string& f,
        const rocksdb::IOOptions& io_opts,
        rocksdb::IODebugContext*)
    {
        try
        {
            if (m_filesystem->Exists(ToKey(f), ToCancellationToken(io_opts)))
            {
                return rocksdb::IOStatus::OK();
            }
            else
            {
                return rocksdb::IOStatus::NotFound();
            }
        }
        catch (const std::exception& ex)
        {
            return LogAndTranslate("FileExists", f, ex);
        }
    }

    rocksdb::IOStatus ObjectStoreFilesystem::GetChildren(const std::string&,
        const rocksdb::IOOptions&,
        std::vector<std::string>* r,
        rocksdb::IODebugContext*)
    {
        r->clear();
        return rocksdb::IOStatus::OK();
    }

    rocksdb::IOStatus ObjectStoreFilesystem::GetChildrenFileAttributes(const std::string&,
        const rocksdb::IOOptions&,
        std::vector<rocksdb::FileAttributes>* result,
        rocksdb::IODebugContext*)
    {
        result->clear();
        return rocksdb::IOStatus::OK();
    }

    rocksdb::IOStatus ObjectStoreFilesystem::IsDirectory(const std::string& path,
        const rocksdb::IOOptions& options,
        bool* is_dir,
        rocksdb::IODebugContext*)
    {
        try
        {
            // Any path without an object behind it is a prefix.
            const auto key = ToKey(path);
            *is_dir = key.empty() || !m_filesystem->Exists(key, ToCancellationToken(options));
            return rocksdb::IOStatus::OK();
        }
        catch (const std::exception& ex)
        {
            return LogAndTranslate("IsDirectory", path, ex);
        }
    }

    rocksdb::IOStatus ObjectStoreFilesystem::DeleteFile(const std::string&,
        const rocksdb::IOOptions&,
        rocksdb::IODebugContext*)
    {
        return rocksdb::IOStatus::NotSupported(ReadOnlyMessage);
    }

    rocksdb::IOStatus ObjectStoreFilesystem::Truncate(const std::string&,
        size_t,
        const rocksdb::IOOptions&,
        rocksdb::IODebugContext*)
    {
        return rocksdb::IOStatus::NotSupported(ReadOnlyMessage);
    }

    rocksdb::IOStatus ObjectStoreFilesystem::CreateDir(const std::string&,
        const rocksdb::IOOptions&,
        rocksdb::IODebugContext*)
    {
        return rocksdb::IOStatus::NotSupported(ReadOnlyMessage);
    }

    rocksdb::IOStatus ObjectStoreFilesystem::CreateDirIfMissing(const std::string&,
        const rocksdb::IOOptions&,
        rocksdb::IODebugContext*)
    {
        return rocksdb::IOStatus::NotSupported(ReadOnlyMessage);
    }

    rocksdb::IOStatus ObjectStoreFilesystem::DeleteDir(const std::string&,
        const rocksdb::IOOptions&,
        rocksdb::IODebugContext*)
    {
        return rocksdb::IOStatus::NotSupported(ReadOnlyMessage);
    }

    rocksdb::IOStatus ObjectStoreFilesystem::GetFileSize(const std::string& f,
        const rocksdb::IOOptions& options,
        uint64_t* s,
        rocksdb::IODebugContext*)
    {
        try
        {
            const auto attributes = m_filesystem->Stat(ToKey(f), ToCancellationToken(options));
            *s = static_cast<uint64_t>(attributes.GetSize());
            return rocksdb::IOStatus::OK();
        }
        catch (const std::exception& ex)
        {
            return LogAndTranslate("GetFileSize", f, ex);
        }
    }

    rocksdb::IOStatus ObjectStoreFilesystem::GetFileModificationTime(const std::string& fname,
        const rocksdb::IOOptions& options,
        uint64_t* file_mtime,
        rocksdb::IODebugContext*)
    {
        try
        {
            const auto attributes = m_filesystem->Stat(ToKey(fname), ToCancellationToken(options));
            const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(attributes.GetLastModified().time_since_epoch());
            *file_mtime = static_cast<uint64_t>(seconds.count());
            return rocksdb::IOStatus::OK();
        }
        catch (const std::exception& ex)
        {
            return LogAndTranslate("GetFileModificationTime", fname, ex);
        }
    }

    rocksdb::IOStatus ObjectStoreFilesystem::RenameFile(const std::string&,
        const std::string&,
        const rocksdb::IOOptions&,
        rocksdb::IODebugContext*)
    {
        return rocksdb::IOStatus::NotSupported(ReadOnlyMessage);
    }

    rocksdb::IOStatus ObjectStoreFilesystem::LinkFile(const std::string&,
        const std::string&,
        const rocksdb::IOOptions&,
        rocksdb::IODebugContext*)
    {
        return rocksdb::IOStatus::NotSupported(ReadOnlyMessage);
    }
}
