// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ObjectFS/Core/ObjectError.hpp"
namespace ObjectFS::Core
{
    std::string_view ToString(const ObjectErrorCode code) noexcept
    {
        switch (code)
        {
        case ObjectErrorCode::NotFound:
            return "NotFound";
        case ObjectErrorCode::RangeNotSatisfiable:
            return "RangeNotSatisfiable";
        case ObjectErrorCode::MalformedResponse:
            return "MalformedResponse";
        case ObjectErrorCode::ObjectChanged:
            return "ObjectChanged";
        case ObjectErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ObjectErrorCode::Cancelled:
            return "Cancelled";
        case ObjectErrorCode::PermissionDenied:
            return "PermissionDenied";
        case ObjectErrorCode::TransportFailure:
            return "TransportFailure";
        }

        return "Unknown";
    }

    ObjectError::ObjectError(const ObjectErrorCode code, const std::string& message)
        : std::runtime_error(message),
        m_code(code)
    {
    }

    ObjectErrorCode ObjectError::GetCode() const noexcept
    {
        return m_code;
    }
}
