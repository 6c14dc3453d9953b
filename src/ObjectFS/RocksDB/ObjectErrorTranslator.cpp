// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ObjectFS/RocksDB/ObjectErrorTranslator.hpp"
namespace ObjectFS::RocksDB
{
    rocksdb::IOStatus ObjectErrorTranslator::IOStatusFromError(const Core::ObjectError& error)
    {
        using Core::ObjectErrorCode;
        using rocksdb::IOStatus;

        const std::string context = error.what();
        IOStatus status;
        switch (error.GetCode())
        {
        case ObjectErrorCode::NotFound:
            return IOStatus::NotFound(context);
        case ObjectErrorCode::InvalidArgument:
            return IOStatus::InvalidArgument(context);
        case ObjectErrorCode::Cancelled:
            return IOStatus::Aborted(context);
        case ObjectErrorCode::TransportFailure:
            status = IOStatus::IOError(context);
            status.SetRetryable(true);
            return status;
        default:
            return IOStatus::IOError(context);
        }
    }
}
