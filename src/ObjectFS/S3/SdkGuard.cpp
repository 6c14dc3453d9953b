// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ObjectFS/S3/SdkGuard.hpp"
namespace ObjectFS::S3
{
    SdkGuard::SdkGuard()
    {
        m_options.httpOptions.installSigPipeHandler = true;
        Aws::InitAPI(m_options);
    }

    SdkGuard::~SdkGuard()
    {
        Aws::ShutdownAPI(m_options);
    }
}
