// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ObjectFS/Core/ContentRange.hpp"

#include <charconv>
namespace ObjectFS::Core
{
    static const constexpr std::string_view g_unitPrefix = "bytes ";
    static const constexpr std::string_view g_whitespace = " \t";

    // Consumes the leading run of digits in text. Signs are not accepted.
    static std::optional<int64_t> ConsumeNumber(std::string_view& text) noexcept
    {
        if (text.empty() || text.front() < '0' || text.front() > '9')
        {
            return std::nullopt;
        }

        int64_t value = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc())
        {
            return std::nullopt;
        }

        text.remove_prefix(static_cast<size_t>(ptr - text.data()));
        return value;
    }

    static bool ConsumeChar(std::string_view& text, const char expected) noexcept
    {
        if (text.empty() || text.front() != expected)
        {
            return false;
        }

        text.remove_prefix(1);
        return true;
    }

    std::optional<ContentRange> ContentRange::Parse(std::string_view header) noexcept
    {
        const auto first = header.find_first_not_of(g_whitespace);
        if (first == std::string_view::npos)
        {
            return std::nullopt;
        }

        header.remove_prefix(first);
        header.remove_suffix(header.size() - header.find_last_not_of(g_whitespace) - 1);

        if (!header.starts_with(g_unitPrefix))
        {
            return std::nullopt;
        }

        header.remove_prefix(g_unitPrefix.size());
        const auto start = ConsumeNumber(header);
        if (!start || !ConsumeChar(header, '-'))
        {
            return std::nullopt;
        }

        const auto end = ConsumeNumber(header);
        if (!end || !ConsumeChar(header, '/'))
        {
            return std::nullopt;
        }

        const auto total = ConsumeNumber(header);
        if (!total || !header.empty())
        {
            return std::nullopt;
        }

        if (*start > *end || *end >= *total)
        {
            return std::nullopt;
        }

        return ContentRange{ *start, *end, *total };
    }

    std::optional<ContentRange> ContentRange::Parse(const std::optional<std::string>& header) noexcept
    {
        if (!header)
        {
            return std::nullopt;
        }

        return Parse(std::string_view(*header));
    }

    std::string ContentRange::ToString() const
    {
        return std::string(g_unitPrefix) + std::to_string(start) + '-' + std::to_string(end) + '/' + std::to_string(total);
    }

    std::string ByteRange::ToHeader() const
    {
        return "bytes=" + std::to_string(offset) + '-' + std::to_string(endInclusive);
    }
}
