// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ObjectFS/Core/BodyStream.hpp"
#include "ObjectFS/Core/CancellationToken.hpp"
#include "ObjectFS/Core/ContentRange.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
namespace ObjectFS::Core
{
    struct FetchResponse
    {
        /// <summary>
        /// The response body. The caller drains and destroys it before issuing another fetch.
        /// </summary>
        std::unique_ptr<BodyStream> body;

        /// <summary>
        /// Number of bytes in the body.
        /// </summary>
        int64_t contentLength = 0;

        /// <summary>
        /// The raw Content-Range header. Only present for ranged responses.
        /// </summary>
        std::optional<std::string> contentRange;

        std::chrono::system_clock::time_point lastModified;
    };

    class ObjectClient
    {
    public:
        virtual ~ObjectClient() = default;

        /// <summary>
        /// Fetches an object, or a byte range of it, from the store.
        ///
        /// Throws ObjectError with ObjectErrorCode::NotFound when the key does not exist and
        /// ObjectErrorCode::RangeNotSatisfiable when a range is requested that the object cannot satisfy
        /// (every range of a zero length object).
        /// </summary>
        /// <param name="key">The key of the object in the bucket or container.</param>
        /// <param name="range">The inclusive range to fetch, or nothing to fetch the whole object.</param>
        /// <param name="cancellation">Stop request and deadline honoured by the transport.</param>
        virtual FetchResponse Fetch(const std::string& key, const std::optional<ByteRange>& range, const CancellationToken& cancellation) = 0;
    };
}
