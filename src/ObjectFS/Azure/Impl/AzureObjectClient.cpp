// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ObjectFS/Azure/Impl/AzureObjectClient.hpp"
#include "ObjectFS/Azure/Impl/AzureBodyStream.hpp"
#include "ObjectFS/Azure/AzureErrorTranslator.hpp"

#include <azure/core/context.hpp>
#include <azure/core/datetime.hpp>
#include <azure/core/exception.hpp>
namespace ObjectFS::Azure::Impl
{
    static ::Azure::Core::Context CreateContext(const Core::CancellationToken& cancellation)
    {
        const auto& deadline = cancellation.GetDeadline();
        return deadline
            ? ::Azure::Core::Context{}.WithDeadline(::Azure::DateTime(*deadline))
            : ::Azure::Core::Context{};
    }

    AzureObjectClient::AzureObjectClient(::Azure::Storage::Blobs::BlobContainerClient client)
        : m_client(std::move(client))
    {
    }

    Core::FetchResponse AzureObjectClient::Fetch(const std::string& key,
        const std::optional<Core::ByteRange>& range,
        const Core::CancellationToken& cancellation)
    {
        cancellation.ThrowIfCancellationRequested();

        auto context = CreateContext(cancellation);
        auto stopCallback = std::make_unique<StopCallback>(cancellation.GetStopToken(), [context]() mutable
            {
                context.Cancel();
            });

        ::Azure::Storage::Blobs::DownloadBlobOptions options;
        if (range)
        {
            options.Range = ::Azure::Core::Http::HttpRange{ range->offset, range->Length() };
        }

        try
        {
            auto response = m_client.GetBlobClient(key).Download(options, context);
            return ToFetchResponse(key, range, std::move(response), std::move(context), std::move(stopCallback));
        }
        catch (const ::Azure::Core::OperationCancelledException& ex)
        {
            throw Core::ObjectError(Core::ObjectErrorCode::Cancelled, "Downloading '" + key + "' was cancelled: " + ex.what());
        }
        catch (const ::Azure::Core::RequestFailedException& ex)
        {
            throw AzureErrorTranslator::ObjectErrorFromException("Failed to download '" + key + "'", ex);
        }
    }

    Core::FetchResponse AzureObjectClient::ToFetchResponse(const std::string& key,
        const std::optional<Core::ByteRange>& range,
        ::Azure::Response<::Azure::Storage::Blobs::Models::DownloadBlobResult> response,
        ::Azure::Core::Context context,
        std::unique_ptr<StopCallback> stopCallback)
    {
        Core::FetchResponse result;
        result.contentLength = response.Value.BodyStream->Length();
        result.lastModified = static_cast<std::chrono::system_clock::time_point>(response.Value.Details.LastModified);

        const auto& headers = response.RawResponse->GetHeaders();
        const auto contentRange = headers.find("Content-Range");
        if (range && contentRange != headers.end())
        {
            result.contentRange = contentRange->second;
        }

        result.body = std::make_unique<AzureBodyStream>(key, std::move(response.Value.BodyStream), std::move(context), std::move(stopCallback));
        return result;
    }
}
