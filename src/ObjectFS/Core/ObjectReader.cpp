// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ObjectFS/Core/ObjectReader.hpp"
#include "ObjectFS/Core/Configuration.hpp"
#include "ObjectFS/Core/ObjectError.hpp"

#include <algorithm>
#include <limits>
using namespace boost::log::trivial;
namespace ObjectFS::Core
{
    static std::string FormatTime(const std::chrono::system_clock::time_point time)
    {
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
        return std::to_string(millis) + "ms";
    }

    // Reads a body to its end. expectedLength is only a capacity hint.
    static std::vector<char> Drain(BodyStream* body, const int64_t expectedLength)
    {
        std::vector<char> chunk;
        if (body == nullptr)
        {
            return chunk;
        }

        if (expectedLength > 0)
        {
            chunk.reserve(static_cast<size_t>(expectedLength));
        }

        size_t used = 0;
        while (true)
        {
            chunk.resize(used + Configuration::Reader::DrainBufferSize);
            const auto bytesRead = body->Read(std::span<char>(chunk.data() + used, Configuration::Reader::DrainBufferSize));
            if (bytesRead <= 0)
            {
                break;
            }

            used += static_cast<size_t>(bytesRead);
        }

        chunk.resize(used);
        return chunk;
    }

    ObjectReader::ObjectReader(std::string_view name,
        std::shared_ptr<ObjectClient> client,
        const int64_t chunkSize,
        CancellationToken cancellation,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger)
        : m_name(name),
        m_client(std::move(client)),
        m_chunkSize(chunkSize),
        m_cancellation(std::move(cancellation)),
        m_logger(std::move(logger)),
        m_downloadOffset(0),
        m_readOffset(0),
        m_size(0),
        m_complete(false)
    {
        if (!m_client)
        {
            throw ObjectError(ObjectErrorCode::InvalidArgument, "An object client is required to open '" + m_name + "'");
        }

        if (m_chunkSize < 0)
        {
            throw ObjectError(ObjectErrorCode::InvalidArgument, "Chunk size must not be negative");
        }

        if (!m_logger)
        {
            throw ObjectError(ObjectErrorCode::InvalidArgument, "A logger is required");
        }

        // The first chunk carries the object's size and modification time.
        FillChunk(false);
    }

    std::vector<char> ObjectReader::ReadAll(std::string_view name,
        std::shared_ptr<ObjectClient> client,
        CancellationToken cancellation,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger)
    {
        ObjectReader reader{ name, std::move(client), 0, std::move(cancellation), std::move(logger) };
        return std::move(reader.m_buffer);
    }

    int64_t ObjectReader::Read(const std::span<char> destination)
    {
        if (m_readOffset >= m_size || destination.empty())
        {
            return 0;
        }

        switch (NextFetch(destination.size()))
        {
        case FetchKind::Remainder:
            FillChunk(true);
            break;
        case FetchKind::NextChunk:
            FillChunk(false);
            break;
        case FetchKind::None:
            break;
        }

        if (m_readOffset >= m_downloadOffset)
        {
            return 0;
        }

        const auto bytesRead = std::min(m_downloadOffset - m_readOffset, static_cast<int64_t>(destination.size()));
        std::copy_n(m_buffer.data() + m_readOffset, static_cast<size_t>(bytesRead), destination.data());
        m_readOffset += bytesRead;
        return bytesRead;
    }

    int64_t ObjectReader::Seek(const int64_t offset, const SeekOrigin origin)
    {
        int64_t base = 0;
        switch (origin)
        {
        case SeekOrigin::Start:
            base = 0;
            break;
        case SeekOrigin::Current:
            base = m_readOffset;
            break;
        case SeekOrigin::End:
            base = m_size;
            break;
        default:
            throw ObjectError(ObjectErrorCode::InvalidArgument, "Invalid seek origin");
        }

        if (offset > 0 && base > std::numeric_limits<int64_t>::max() - offset)
        {
            throw ObjectError(ObjectErrorCode::InvalidArgument, "Seek position overflows");
        }

        const auto target = base + offset;
        if (target < 0)
        {
            throw ObjectError(ObjectErrorCode::InvalidArgument, "Seek to negative position " + std::to_string(target) + " in '" + m_name + "'");
        }

        m_readOffset = target;
        return target;
    }

    ObjectAttributes ObjectReader::Stat() const
    {
        return ObjectAttributes{ m_name, m_size, m_lastModified.value_or(std::chrono::system_clock::time_point{}) };
    }

    const std::string& ObjectReader::GetName() const noexcept
    {
        return m_name;
    }

    int64_t ObjectReader::GetSize() const noexcept
    {
        return m_size;
    }

    int64_t ObjectReader::GetOffset() const noexcept
    {
        return m_readOffset;
    }

    void ObjectReader::SetCancellation(CancellationToken cancellation) noexcept
    {
        m_cancellation = std::move(cancellation);
    }

    int64_t ObjectReader::GetDownloadOffset() const noexcept
    {
        return m_downloadOffset;
    }

    bool ObjectReader::IsComplete() const noexcept
    {
        return m_complete;
    }

    ObjectReader::FetchKind ObjectReader::NextFetch(const size_t requested) const noexcept
    {
        if (m_complete)
        {
            return FetchKind::None;
        }

        // The buffer only holds a contiguous prefix, so a gap left by a forward seek is closed by
        // downloading everything up to the end.
        if (m_readOffset > m_downloadOffset)
        {
            return FetchKind::Remainder;
        }

        if (m_downloadOffset - m_readOffset < static_cast<int64_t>(requested))
        {
            return FetchKind::NextChunk;
        }

        return FetchKind::None;
    }

    void ObjectReader::FillChunk(const bool full)
    {
        const bool firstFetch = !m_lastModified;
        if (firstFetch && m_chunkSize == 0)
        {
            FetchWhole();
            return;
        }

        auto end = (full || m_chunkSize == 0) ? m_size - 1 : m_downloadOffset + m_chunkSize - 1;
        if (!firstFetch)
        {
            end = std::min(end, m_size - 1);
        }

        const ByteRange range{ m_downloadOffset, end };
        m_cancellation.ThrowIfCancellationRequested();
        BOOST_LOG_SEV(*m_logger, debug) << "Fetching " << range.ToHeader() << " of '" << m_name << "'";

        FetchResponse response;
        bool rangeRejected = false;
        try
        {
            response = m_client->Fetch(m_name, range, m_cancellation);
        }
        catch (const ObjectError& ex)
        {
            // Only a zero length object rejects the very first range.
            if (ex.GetCode() != ObjectErrorCode::RangeNotSatisfiable || m_downloadOffset != 0)
            {
                throw;
            }

            rangeRejected = true;
        }

        if (rangeRejected)
        {
            BOOST_LOG_SEV(*m_logger, info) << "Range request for '" << m_name << "' was not satisfiable, downloading the whole object";
            FetchWhole();
            return;
        }

        ApplyRangedResponse(std::move(response));
    }

    void ObjectReader::FetchWhole()
    {
        m_cancellation.ThrowIfCancellationRequested();
        BOOST_LOG_SEV(*m_logger, debug) << "Fetching all of '" << m_name << "'";

        auto response = m_client->Fetch(m_name, std::nullopt, m_cancellation);
        CheckConsistency(response.lastModified, response.contentLength);

        auto chunk = Drain(response.body.get(), response.contentLength);
        response.body.reset();

        const auto received = static_cast<int64_t>(chunk.size());
        if (response.contentLength >= 0 && received != response.contentLength)
        {
            throw ObjectError(ObjectErrorCode::MalformedResponse,
                "Received " + std::to_string(received) + " bytes of '" + m_name + "', expected " + std::to_string(response.contentLength));
        }

        m_buffer = std::move(chunk);
        m_downloadOffset = received;
        m_size = received;
        m_lastModified = response.lastModified;
        m_complete = true;
    }

    void ObjectReader::ApplyRangedResponse(FetchResponse response)
    {
        const auto range = ContentRange::Parse(response.contentRange);
        if (!range)
        {
            throw ObjectError(ObjectErrorCode::MalformedResponse,
                "Unable to parse Content-Range '" + response.contentRange.value_or("") + "' returned for '" + m_name + "'");
        }

        if (range->start != m_downloadOffset)
        {
            throw ObjectError(ObjectErrorCode::MalformedResponse,
                "Content-Range '" + range->ToString() + "' returned for '" + m_name + "' does not start at offset " + std::to_string(m_downloadOffset));
        }

        CheckConsistency(response.lastModified, range->total);

        // Drain into a scratch chunk so a body that fails halfway never leaves a gap in the buffer.
        auto chunk = Drain(response.body.get(), range->Length());
        response.body.reset();

        if (static_cast<int64_t>(chunk.size()) != range->Length())
        {
            throw ObjectError(ObjectErrorCode::MalformedResponse,
                "Received " + std::to_string(chunk.size()) + " bytes of '" + m_name + "' for Content-Range '" + range->ToString() + "'");
        }

        m_buffer.insert(m_buffer.end(), chunk.begin(), chunk.end());
        m_downloadOffset = range->end + 1;
        m_size = range->total;
        m_lastModified = response.lastModified;
        m_complete = range->end == range->total - 1;
    }

    void ObjectReader::CheckConsistency(const std::chrono::system_clock::time_point lastModified, const int64_t size) const
    {
        if (!m_lastModified)
        {
            return;
        }

        if (*m_lastModified != lastModified)
        {
            BOOST_LOG_SEV(*m_logger, warning) << "Object '" << m_name << "' changed during read";
            throw ObjectError(ObjectErrorCode::ObjectChanged,
                "Object '" + m_name + "' changed during read: Last-Modified was " + FormatTime(*m_lastModified) + ", now " + FormatTime(lastModified));
        }

        if (m_size != size)
        {
            BOOST_LOG_SEV(*m_logger, warning) << "Object '" << m_name << "' changed size during read";
            throw ObjectError(ObjectErrorCode::ObjectChanged,
                "Object '" + m_name + "' changed during read: size was " + std::to_string(m_size) + ", now " + std::to_string(size));
        }
    }
}
