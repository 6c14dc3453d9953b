// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <cstdint>
#include <span>
namespace ObjectFS::Core
{
    class BodyStream
    {
    public:
        virtual ~BodyStream() = default;

        /// <summary>
        /// Reads the next bytes of a response body.
        /// </summary>
        /// <param name="buffer">Destination for the bytes.</param>
        /// <returns>The number of bytes written to the buffer, 0 once the body is exhausted.</returns>
        virtual int64_t Read(std::span<char> buffer) = 0;
    };
}
