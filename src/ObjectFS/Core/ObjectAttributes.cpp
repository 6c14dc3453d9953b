// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ObjectFS/Core/ObjectAttributes.hpp"
namespace ObjectFS::Core
{
    ObjectAttributes::ObjectAttributes(std::string name, const int64_t size, const std::chrono::system_clock::time_point lastModified)
        : m_name(std::move(name)), m_size(size), m_lastModified(lastModified)
    {
    }

    const std::string& ObjectAttributes::GetName() const noexcept
    {
        return m_name;
    }

    int64_t ObjectAttributes::GetSize() const noexcept
    {
        return m_size;
    }

    std::chrono::system_clock::time_point ObjectAttributes::GetLastModified() const noexcept
    {
        return m_lastModified;
    }
}
