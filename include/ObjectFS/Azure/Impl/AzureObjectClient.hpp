// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ObjectFS/Azure/Impl/AzureBodyStream.hpp"
#include "ObjectFS/Core/ObjectClient.hpp"

#include <azure/storage/blobs/blob_container_client.hpp>

#include <memory>
namespace ObjectFS::Azure::Impl
{
    /// <summary>
    /// Fetches blobs of one container with streaming downloads. Ranges are sent as an HttpRange.
    /// </summary>
    class AzureObjectClient final : public Core::ObjectClient
    {
        ::Azure::Storage::Blobs::BlobContainerClient m_client;

    public:
        explicit AzureObjectClient(::Azure::Storage::Blobs::BlobContainerClient client);

        virtual Core::FetchResponse Fetch(const std::string& key,
            const std::optional<Core::ByteRange>& range,
            const Core::CancellationToken& cancellation) override;

        // NOTE: Content-Range is only kept for ranged requests. The body keeps the context and stop callback alive.
        [[nodiscard]] static Core::FetchResponse ToFetchResponse(const std::string& key,
            const std::optional<Core::ByteRange>& range,
            ::Azure::Response<::Azure::Storage::Blobs::Models::DownloadBlobResult> response,
            ::Azure::Core::Context context,
            std::unique_ptr<StopCallback> stopCallback);
    };
}
