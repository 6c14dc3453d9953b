// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ObjectFS/Core/ObjectError.hpp"

#include <azure/core/exception.hpp>
#include <azure/core/http/http_status_code.hpp>

#include <string>
namespace ObjectFS::Azure
{
    struct AzureErrorTranslator
    {
        static Core::ObjectErrorCode ObjectErrorCodeFromStatus(const ::Azure::Core::Http::HttpStatusCode& statusCode);
        static Core::ObjectError ObjectErrorFromException(const std::string& context, const ::Azure::Core::RequestFailedException& ex);
    };
}
