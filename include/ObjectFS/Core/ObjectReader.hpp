// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ObjectFS/Core/CancellationToken.hpp"
#include "ObjectFS/Core/ObjectAttributes.hpp"
#include "ObjectFS/Core/ObjectClient.hpp"

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace ObjectFS::Core
{
    enum class SeekOrigin
    {
        Start,
        Current,
        End
    };

    /// <summary>
    /// A seekable, re-readable view of one remote object.
    ///
    /// Every byte fetched so far is kept in a single contiguous buffer starting at offset 0 of the
    /// object. Reads that run past the buffered prefix grow it by one chunk; a read after a forward
    /// seek beyond the prefix downloads the whole remainder in one request. All fetches of one reader
    /// must observe the same Last-Modified value.
    ///
    /// Not thread safe.
    /// </summary>
    class ObjectReader
    {
        enum class FetchKind
        {
            None,
            NextChunk,
            Remainder
        };

        std::string m_name;
        std::shared_ptr<ObjectClient> m_client;
        int64_t m_chunkSize;
        CancellationToken m_cancellation;
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> m_logger;

        std::vector<char> m_buffer;
        int64_t m_downloadOffset;
        int64_t m_readOffset;
        int64_t m_size;
        std::optional<std::chrono::system_clock::time_point> m_lastModified;
        bool m_complete;

    public:
        /// <summary>
        /// Creates the reader and performs the first fetch, so the size and modification time are known
        /// as soon as construction returns.
        /// </summary>
        /// <param name="chunkSize">Bytes requested per fetch, 0 downloads the whole object at once.</param>
        ObjectReader(std::string_view name,
            std::shared_ptr<ObjectClient> client,
            int64_t chunkSize,
            CancellationToken cancellation,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger);
        ObjectReader(const ObjectReader&) = delete;
        ObjectReader& operator=(const ObjectReader&) = delete;
        ObjectReader(ObjectReader&&) noexcept = default;
        ObjectReader& operator=(ObjectReader&&) noexcept = default;

        /// <summary>
        /// Downloads a whole object with a single request.
        /// </summary>
        [[nodiscard]] static std::vector<char> ReadAll(std::string_view name,
            std::shared_ptr<ObjectClient> client,
            CancellationToken cancellation,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger);

        // NOTE: Increments the read offset. Returns 0 at the end of the object.
        [[nodiscard]] int64_t Read(std::span<char> destination);

        // NOTE: Never fetches, the next Read does.
        int64_t Seek(int64_t offset, SeekOrigin origin);

        /// <summary>
        /// Replaces the token checked by later fetches. Callers that bound each read separately
        /// install a fresh token before every read.
        /// </summary>
        void SetCancellation(CancellationToken cancellation) noexcept;

        [[nodiscard]] ObjectAttributes Stat() const;
        [[nodiscard]] const std::string& GetName() const noexcept;
        [[nodiscard]] int64_t GetSize() const noexcept;
        [[nodiscard]] int64_t GetOffset() const noexcept;
        [[nodiscard]] int64_t GetDownloadOffset() const noexcept;
        [[nodiscard]] bool IsComplete() const noexcept;

    private:
        [[nodiscard]] FetchKind NextFetch(size_t requested) const noexcept;
        void FillChunk(bool full);
        void FetchWhole();
        void ApplyRangedResponse(FetchResponse response);
        void CheckConsistency(std::chrono::system_clock::time_point lastModified, int64_t size) const;
    };
}
