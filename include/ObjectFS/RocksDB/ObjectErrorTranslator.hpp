// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ObjectFS/Core/ObjectError.hpp"

#include <rocksdb/io_status.h>
namespace ObjectFS::RocksDB
{
    struct ObjectErrorTranslator
    {
        static rocksdb::IOStatus IOStatusFromError(const Core::ObjectError& error);
    };
}
