// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <cstddef>
#include <cstdint>
namespace ObjectFS::Core
{
    struct Configuration
    {
        struct Reader
        {
            // 0 downloads the whole object on open.
            static const constexpr int64_t DefaultChunkSize = 0;
            static const constexpr int64_t StatProbeChunkSize = 1;
            static const constexpr size_t DrainBufferSize = static_cast<size_t>(64) * 1024;
        };

        static const constexpr int MaxClientRetries = 8;
    };
}
