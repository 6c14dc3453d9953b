// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ObjectFS/S3/S3ErrorTranslator.hpp"
namespace ObjectFS::S3
{
    Core::ObjectErrorCode S3ErrorTranslator::ObjectErrorCodeFromError(const Aws::S3::S3Errors errorType, const Aws::Http::HttpResponseCode responseCode)
    {
        using Aws::Http::HttpResponseCode;
        using Aws::S3::S3Errors;
        using Core::ObjectErrorCode;

        switch (responseCode)
        {
        case HttpResponseCode::REQUESTED_RANGE_NOT_SATISFIABLE:
            return ObjectErrorCode::RangeNotSatisfiable;
        case HttpResponseCode::NOT_FOUND:
            return ObjectErrorCode::NotFound;
        default:
            break;
        }

        switch (errorType)
        {
        case S3Errors::NO_SUCH_KEY:
        case S3Errors::NO_SUCH_BUCKET:
        case S3Errors::RESOURCE_NOT_FOUND:
            return ObjectErrorCode::NotFound;
        case S3Errors::ACCESS_DENIED:
        case S3Errors::INVALID_ACCESS_KEY_ID:
        case S3Errors::INVALID_CLIENT_TOKEN_ID:
        case S3Errors::MISSING_AUTHENTICATION_TOKEN:
        case S3Errors::SIGNATURE_DOES_NOT_MATCH:
        case S3Errors::UNRECOGNIZED_CLIENT:
            return ObjectErrorCode::PermissionDenied;
        case S3Errors::INVALID_PARAMETER_COMBINATION:
        case S3Errors::INVALID_PARAMETER_VALUE:
        case S3Errors::INVALID_QUERY_PARAMETER:
        case S3Errors::MISSING_PARAMETER:
            return ObjectErrorCode::InvalidArgument;
        default:
            return ObjectErrorCode::TransportFailure;
        }
    }

    Core::ObjectError S3ErrorTranslator::ObjectErrorFromError(const std::string& context, const Aws::S3::S3Error& error)
    {
        return Core::ObjectError(ObjectErrorCodeFromError(error.GetErrorType(), error.GetResponseCode()),
            context + ": [" + std::string(error.GetExceptionName()) + "] (Status Code: " + std::to_string(static_cast<int>(error.GetResponseCode())) + ") " + std::string(error.GetMessage()));
    }
}
