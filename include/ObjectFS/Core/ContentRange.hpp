// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
namespace ObjectFS::Core
{
    /// <summary>
    /// The value of an HTTP Content-Range response header: "bytes start-end/total".
    ///
    /// end is the index of the last byte included in the response and total is the full
    /// length of the object, so a well formed range always satisfies start <= end < total.
    /// </summary>
    struct ContentRange
    {
        int64_t start;
        int64_t end;
        int64_t total;

        /// <returns>The parsed range, or nothing when the header is absent or malformed.</returns>
        [[nodiscard]] static std::optional<ContentRange> Parse(std::string_view header) noexcept;
        [[nodiscard]] static std::optional<ContentRange> Parse(const std::optional<std::string>& header) noexcept;

        [[nodiscard]] std::string ToString() const;

        /// <returns>The number of bytes covered by the range.</returns>
        int64_t Length() const noexcept { return end - start + 1; }
    };

    /// <summary>
    /// An inclusive byte interval requested from a store, the counterpart of ContentRange on the request side.
    /// </summary>
    struct ByteRange
    {
        int64_t offset;
        int64_t endInclusive;

        /// <returns>The value of an HTTP Range request header: "bytes=offset-end".</returns>
        [[nodiscard]] std::string ToHeader() const;

        int64_t Length() const noexcept { return endInclusive - offset + 1; }
    };
}
