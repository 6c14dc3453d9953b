// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <chrono>
#include <cstdint>
#include <string>
namespace ObjectFS::Core
{
    class ObjectAttributes
    {
        std::string m_name;
        int64_t m_size;
        std::chrono::system_clock::time_point m_lastModified;

    public:
        ObjectAttributes(std::string name, int64_t size, std::chrono::system_clock::time_point lastModified);
        [[nodiscard]] const std::string& GetName() const noexcept;
        [[nodiscard]] int64_t GetSize() const noexcept;
        [[nodiscard]] std::chrono::system_clock::time_point GetLastModified() const noexcept;
    };
}
