// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ObjectFS/Azure/Impl/AzureBodyStream.hpp"
#include "ObjectFS/Azure/AzureErrorTranslator.hpp"

#include <azure/core/exception.hpp>
namespace ObjectFS::Azure::Impl
{
    AzureBodyStream::AzureBodyStream(std::string key,
        std::unique_ptr<::Azure::Core::IO::BodyStream> stream,
        ::Azure::Core::Context context,
        std::unique_ptr<StopCallback> stopCallback)
        : m_key(std::move(key)),
        m_stream(std::move(stream)),
        m_context(std::move(context)),
        m_stopCallback(std::move(stopCallback))
    {
    }

    int64_t AzureBodyStream::Read(std::span<char> buffer)
    {
        try
        {
            const auto bytesRead = m_stream->Read(reinterpret_cast<uint8_t*>(buffer.data()), buffer.size(), m_context);
            return static_cast<int64_t>(bytesRead);
        }
        catch (const ::Azure::Core::OperationCancelledException& ex)
        {
            throw Core::ObjectError(Core::ObjectErrorCode::Cancelled, "Reading '" + m_key + "' was cancelled: " + ex.what());
        }
        catch (const ::Azure::Core::RequestFailedException& ex)
        {
            throw AzureErrorTranslator::ObjectErrorFromException("Failed to read '" + m_key + "'", ex);
        }
    }
}
