// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ObjectFS/Azure/AzureErrorTranslator.hpp"
namespace ObjectFS::Azure
{
    Core::ObjectErrorCode AzureErrorTranslator::ObjectErrorCodeFromStatus(const ::Azure::Core::Http::HttpStatusCode& statusCode)
    {
        using ::Azure::Core::Http::HttpStatusCode;
        using Core::ObjectErrorCode;

        switch (statusCode)
        {
        case HttpStatusCode::NotFound:
            return ObjectErrorCode::NotFound;
        case HttpStatusCode::RangeNotSatisfiable:
            return ObjectErrorCode::RangeNotSatisfiable;
        case HttpStatusCode::Unauthorized:
        case HttpStatusCode::Forbidden:
            return ObjectErrorCode::PermissionDenied;
        case HttpStatusCode::BadRequest:
            return ObjectErrorCode::InvalidArgument;
        default:
            return ObjectErrorCode::TransportFailure;
        }
    }

    Core::ObjectError AzureErrorTranslator::ObjectErrorFromException(const std::string& context, const ::Azure::Core::RequestFailedException& ex)
    {
        return Core::ObjectError(ObjectErrorCodeFromStatus(ex.StatusCode),
            context + ": [" + ex.ErrorCode + "] (Status Code: " + std::to_string(static_cast<int>(ex.StatusCode)) + ") " + ex.Message);
    }
}
