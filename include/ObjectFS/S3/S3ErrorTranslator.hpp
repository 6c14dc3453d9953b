// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ObjectFS/Core/ObjectError.hpp"

#include <aws/core/http/HttpResponse.h>
#include <aws/s3/S3Errors.h>

#include <string>
namespace ObjectFS::S3
{
    struct S3ErrorTranslator
    {
        // NOTE: The HTTP status wins over the error type, the SDK reports a 416 as an unknown error.
        static Core::ObjectErrorCode ObjectErrorCodeFromError(Aws::S3::S3Errors errorType, Aws::Http::HttpResponseCode responseCode);
        static Core::ObjectError ObjectErrorFromError(const std::string& context, const Aws::S3::S3Error& error);
    };
}
