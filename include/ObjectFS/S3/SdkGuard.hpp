// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <aws/core/Aws.h>
namespace ObjectFS::S3
{
    /// <summary>
    /// Initializes the AWS SDK for its lifetime. Every S3 filesystem must be destroyed before the guard.
    /// </summary>
    class SdkGuard
    {
        Aws::SDKOptions m_options;

    public:
        SdkGuard();
        ~SdkGuard();
        SdkGuard(const SdkGuard&) = delete;
        SdkGuard& operator=(const SdkGuard&) = delete;
    };
}
