// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <stdexcept>
#include <string>
#include <string_view>
namespace ObjectFS::Core
{
    enum class ObjectErrorCode
    {
        NotFound,
        RangeNotSatisfiable,
        MalformedResponse,
        ObjectChanged,
        InvalidArgument,
        Cancelled,
        PermissionDenied,
        TransportFailure
    };

    [[nodiscard]] std::string_view ToString(ObjectErrorCode code) noexcept;

    /// <summary>
    /// The single error type raised by the object reader, the filesystem facade and every store adapter.
    /// Provider specific failures are translated into one of the codes above before leaving an adapter.
    /// </summary>
    class ObjectError : public std::runtime_error
    {
        ObjectErrorCode m_code;

    public:
        ObjectError(ObjectErrorCode code, const std::string& message);

        [[nodiscard]] ObjectErrorCode GetCode() const noexcept;
    };
}
