// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ObjectFS/S3/Impl/S3ObjectClient.hpp"
#include "ObjectFS/S3/Impl/S3BodyStream.hpp"
#include "ObjectFS/S3/S3ErrorTranslator.hpp"

#include <aws/core/http/HttpRequest.h>
#include <aws/s3/model/GetObjectRequest.h>
namespace ObjectFS::S3::Impl
{
    S3ObjectClient::S3ObjectClient(std::shared_ptr<const Aws::S3::S3Client> client, std::string bucket)
        : m_client(std::move(client)),
        m_bucket(std::move(bucket))
    {
        if (!m_client)
        {
            throw Core::ObjectError(Core::ObjectErrorCode::InvalidArgument, "An S3 client is required");
        }
    }

    Core::FetchResponse S3ObjectClient::Fetch(const std::string& key,
        const std::optional<Core::ByteRange>& range,
        const Core::CancellationToken& cancellation)
    {
        cancellation.ThrowIfCancellationRequested();

        Aws::S3::Model::GetObjectRequest request;
        request.SetBucket(m_bucket);
        request.SetKey(key);
        if (range)
        {
            request.SetRange(range->ToHeader());
        }

        // The request only lives for this synchronous call.
        request.SetContinueRequestHandler([&cancellation](const Aws::Http::HttpRequest*)
            {
                return !cancellation.IsCancellationRequested();
            });

        auto outcome = m_client->GetObject(request);
        if (!outcome.IsSuccess())
        {
            if (cancellation.IsCancellationRequested())
            {
                throw Core::ObjectError(Core::ObjectErrorCode::Cancelled, "Downloading '" + key + "' was cancelled");
            }

            throw S3ErrorTranslator::ObjectErrorFromError("Failed to download '" + key + "'", outcome.GetError());
        }

        return ToFetchResponse(key, range, outcome.GetResultWithOwnership());
    }

    Core::FetchResponse S3ObjectClient::ToFetchResponse(const std::string& key,
        const std::optional<Core::ByteRange>& range,
        Aws::S3::Model::GetObjectResult result)
    {
        Core::FetchResponse response;
        response.contentLength = static_cast<int64_t>(result.GetContentLength());
        response.lastModified = std::chrono::system_clock::time_point(std::chrono::milliseconds(result.GetLastModified().Millis()));
        if (range && !result.GetContentRange().empty())
        {
            response.contentRange = std::string(result.GetContentRange());
        }

        response.body = std::make_unique<S3BodyStream>(key, std::move(result));
        return response;
    }
}
