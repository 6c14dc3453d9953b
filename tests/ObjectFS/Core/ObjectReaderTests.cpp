// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ObjectFS/Core/ObjectReader.hpp"
#include "ObjectFS/Core/ObjectError.hpp"
#include "ObjectFS/Core/Mocks/InMemoryObjectClient.hpp"
#include "ObjectFS/Core/Mocks/MemoryBodyStream.hpp"
#include "ObjectFS/Core/Mocks/ObjectClientMock.hpp"
#include "ObjectFS/TestHelpers.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <string>
#include <vector>

using ObjectFS::Core::ByteRange;
using ObjectFS::Core::CancellationToken;
using ObjectFS::Core::FetchResponse;
using ObjectFS::Core::ObjectError;
using ObjectFS::Core::ObjectErrorCode;
using ObjectFS::Core::ObjectReader;
using ObjectFS::Core::SeekOrigin;
using ObjectFS::Core::Mocks::InMemoryObjectClient;
using ObjectFS::Core::Mocks::MemoryBodyStream;
using ObjectFS::Core::Mocks::ObjectClientMock;
using ::testing::_;
using ::testing::InSequence;
using ::testing::Throw;

using ObjectFS::Testing::CaptureErrorCode;
using ObjectFS::Testing::CreateLogger;
using ObjectFS::Testing::Logger;

static FetchResponse MakeResponse(std::string body,
    std::optional<std::string> contentRange,
    std::chrono::system_clock::time_point lastModified = InMemoryObjectClient::DefaultLastModified)
{
    FetchResponse response;
    response.contentLength = static_cast<int64_t>(body.size());
    response.contentRange = std::move(contentRange);
    response.lastModified = lastModified;
    response.body = std::make_unique<MemoryBodyStream>(std::move(body));
    return response;
}

static void ExpectRange(const std::optional<ByteRange>& actual, const int64_t offset, const int64_t endInclusive)
{
    ASSERT_TRUE(actual.has_value());
    EXPECT_EQ(offset, actual->offset);
    EXPECT_EQ(endInclusive, actual->endInclusive);
}

class ObjectReaderTests : public ::testing::Test
{
protected:
    static constexpr std::string_view HelloWorld = "hello, world";

    std::shared_ptr<InMemoryObjectClient> m_client;
    std::shared_ptr<Logger> m_logger;

    void SetUp() override
    {
        m_client = std::make_shared<InMemoryObjectClient>();
        m_logger = CreateLogger();
        m_client->Put("hello.txt", std::string(HelloWorld));
    }

    ObjectReader Open(const std::string& key, const int64_t chunkSize, CancellationToken cancellation = {})
    {
        return ObjectReader{ key, m_client, chunkSize, std::move(cancellation), m_logger };
    }

    static std::string ReadToEnd(ObjectReader& reader, const size_t bufferSize)
    {
        std::string result;
        std::vector<char> buffer(bufferSize);
        while (true)
        {
            const auto bytesRead = reader.Read(buffer);
            if (bytesRead == 0)
            {
                return result;
            }

            result.append(buffer.data(), static_cast<size_t>(bytesRead));
        }
    }

    static std::string MakePattern(const size_t size)
    {
        std::string data(size, '\0');
        for (size_t i = 0; i < size; ++i)
        {
            data[i] = static_cast<char>('a' + (i * 7) % 26);
        }

        return data;
    }
};

TEST_F(ObjectReaderTests, Constructor_FetchesFirstChunk)
{
    // Act
    auto reader = Open("hello.txt", 4);

    // Assert
    EXPECT_EQ(12, reader.GetSize());
    EXPECT_EQ(0, reader.GetOffset());
    EXPECT_EQ(4, reader.GetDownloadOffset());
    EXPECT_FALSE(reader.IsComplete());
    ASSERT_EQ(1u, m_client->GetFetchCount());
    ExpectRange(m_client->GetRequests()[0], 0, 3);
}

TEST_F(ObjectReaderTests, Constructor_ChunkSizeZero_DownloadsWholeObject)
{
    // Act
    auto reader = Open("hello.txt", 0);

    // Assert
    EXPECT_EQ(12, reader.GetSize());
    EXPECT_TRUE(reader.IsComplete());
    ASSERT_EQ(1u, m_client->GetFetchCount());
    EXPECT_FALSE(m_client->GetRequests()[0].has_value());
}

TEST_F(ObjectReaderTests, Constructor_ChunkLargerThanObject_CompletesOnFirstFetch)
{
    auto reader = Open("hello.txt", 4096);

    EXPECT_TRUE(reader.IsComplete());
    EXPECT_EQ(12, reader.GetDownloadOffset());
    EXPECT_EQ(std::string(HelloWorld), ReadToEnd(reader, 64));
    EXPECT_EQ(1u, m_client->GetFetchCount());
}

TEST_F(ObjectReaderTests, Constructor_InvalidArguments_Throw)
{
    EXPECT_EQ(ObjectErrorCode::InvalidArgument, CaptureErrorCode([&] { return ObjectReader{ "hello.txt", nullptr, 4, {}, m_logger }; }));
    EXPECT_EQ(ObjectErrorCode::InvalidArgument, CaptureErrorCode([&] { return Open("hello.txt", -1); }));
    EXPECT_EQ(0u, m_client->GetFetchCount());
}

TEST_F(ObjectReaderTests, Constructor_MissingObject_ThrowsNotFound)
{
    EXPECT_EQ(ObjectErrorCode::NotFound, CaptureErrorCode([&] { return Open("missing.txt", 4); }));
}

TEST_F(ObjectReaderTests, SequentialRead_ReturnsObject_ForEveryChunkAndBufferSize)
{
    // Arrange
    const auto data = MakePattern(1000);
    m_client->Put("pattern.bin", data);

    for (const int64_t chunkSize : { 0, 1, 7, 64, 999, 1000, 5000 })
    {
        for (const size_t bufferSize : { 1, 13, 256, 4096 })
        {
            auto reader = Open("pattern.bin", chunkSize);

            // Act
            const auto result = ReadToEnd(reader, bufferSize);

            // Assert
            EXPECT_EQ(data, result) << "chunk " << chunkSize << ", buffer " << bufferSize;
            EXPECT_TRUE(reader.IsComplete());
            EXPECT_EQ(1000, reader.GetOffset());
        }
    }
}

TEST_F(ObjectReaderTests, SequentialRead_FetchesOneChunkAtATime)
{
    // Arrange
    auto reader = Open("hello.txt", 5);

    // Act
    const auto result = ReadToEnd(reader, 5);

    // Assert
    EXPECT_EQ(std::string(HelloWorld), result);
    const auto& requests = m_client->GetRequests();
    ASSERT_EQ(3u, requests.size());
    ExpectRange(requests[0], 0, 4);
    ExpectRange(requests[1], 5, 9);
    ExpectRange(requests[2], 10, 11);
}

TEST_F(ObjectReaderTests, SeekThenRead_ReturnsBytesFromEveryOffset)
{
    // Arrange
    const std::string data = "0123456789abcdef";
    m_client->Put("hex.txt", data);

    for (int64_t offset = 0; offset <= static_cast<int64_t>(data.size()); ++offset)
    {
        auto reader = Open("hex.txt", 3);

        // Act
        EXPECT_EQ(offset, reader.Seek(offset, SeekOrigin::Start));
        const auto result = ReadToEnd(reader, 4);

        // Assert
        EXPECT_EQ(data.substr(static_cast<size_t>(offset)), result) << "offset " << offset;
    }
}

TEST_F(ObjectReaderTests, SeekForward_ThenRead_FetchesWholeRemainderOnce)
{
    // Arrange
    auto reader = Open("hello.txt", 2);

    // Act
    reader.Seek(6, SeekOrigin::Start);
    const auto result = ReadToEnd(reader, 3);

    // Assert
    EXPECT_EQ(" world", result);
    EXPECT_TRUE(reader.IsComplete());
    const auto& requests = m_client->GetRequests();
    ASSERT_EQ(2u, requests.size());
    ExpectRange(requests[1], 2, 11);
}

TEST_F(ObjectReaderTests, HelloWorld_ChunkSizeOne_SeekSeven_ReadsWorldWithoutRefetching)
{
    // Arrange
    auto reader = Open("hello.txt", 1);
    std::vector<char> buffer(5);

    // Act
    reader.Seek(7, SeekOrigin::Start);
    const auto bytesRead = reader.Read(buffer);
    const auto endOfStream = reader.Read(buffer);

    // Assert
    EXPECT_EQ(5, bytesRead);
    EXPECT_EQ("world", std::string(buffer.data(), buffer.size()));
    EXPECT_EQ(0, endOfStream);
    const auto& requests = m_client->GetRequests();
    ASSERT_EQ(2u, requests.size());
    ExpectRange(requests[0], 0, 0);
    ExpectRange(requests[1], 1, 11);
}

TEST_F(ObjectReaderTests, Seek_PastEnd_ReadsEndOfStream)
{
    // Arrange
    auto reader = Open("hello.txt", 4);
    std::vector<char> buffer(8);

    // Act
    const auto position = reader.Seek(100, SeekOrigin::Start);
    const auto bytesRead = reader.Read(buffer);

    // Assert
    EXPECT_EQ(100, position);
    EXPECT_EQ(0, bytesRead);
    EXPECT_EQ(1u, m_client->GetFetchCount());
}

TEST_F(ObjectReaderTests, Seek_Origins_ResolveAgainstOffsetAndSize)
{
    auto reader = Open("hello.txt", 4);

    EXPECT_EQ(5, reader.Seek(5, SeekOrigin::Start));
    EXPECT_EQ(7, reader.Seek(2, SeekOrigin::Current));
    EXPECT_EQ(4, reader.Seek(-3, SeekOrigin::Current));
    EXPECT_EQ(7, reader.Seek(-5, SeekOrigin::End));
    EXPECT_EQ(14, reader.Seek(2, SeekOrigin::End));
    EXPECT_EQ(1u, m_client->GetFetchCount());
}

TEST_F(ObjectReaderTests, Seek_Negative_ThrowsAndKeepsOffset)
{
    // Arrange
    auto reader = Open("hello.txt", 4);
    reader.Seek(3, SeekOrigin::Start);

    // Act & Assert
    EXPECT_EQ(ObjectErrorCode::InvalidArgument, CaptureErrorCode([&] { return reader.Seek(-4, SeekOrigin::Current); }));
    EXPECT_EQ(ObjectErrorCode::InvalidArgument, CaptureErrorCode([&] { return reader.Seek(-1, SeekOrigin::Start); }));
    EXPECT_EQ(ObjectErrorCode::InvalidArgument, CaptureErrorCode([&] { return reader.Seek(-13, SeekOrigin::End); }));
    EXPECT_EQ(3, reader.GetOffset());
}

TEST_F(ObjectReaderTests, Read_EmptyDestination_ReturnsZeroWithoutFetching)
{
    auto reader = Open("hello.txt", 1);

    EXPECT_EQ(0, reader.Read(std::span<char>()));
    EXPECT_EQ(1u, m_client->GetFetchCount());
}

TEST_F(ObjectReaderTests, ReRead_BufferedBytes_IssuesNoFetch)
{
    // Arrange
    auto reader = Open("hello.txt", 4);
    std::vector<char> buffer(4);
    ASSERT_EQ(4, reader.Read(buffer));

    // Act
    reader.Seek(0, SeekOrigin::Start);
    const auto bytesRead = reader.Read(buffer);

    // Assert
    EXPECT_EQ(4, bytesRead);
    EXPECT_EQ("hell", std::string(buffer.data(), buffer.size()));
    EXPECT_EQ(1u, m_client->GetFetchCount());
}

TEST_F(ObjectReaderTests, ReRead_CompleteObject_IssuesNoFetch)
{
    auto reader = Open("hello.txt", 0);
    EXPECT_EQ(std::string(HelloWorld), ReadToEnd(reader, 5));

    reader.Seek(0, SeekOrigin::Start);

    EXPECT_EQ(std::string(HelloWorld), ReadToEnd(reader, 3));
    EXPECT_EQ(1u, m_client->GetFetchCount());
}

TEST_F(ObjectReaderTests, ZeroLengthObject_FallsBackToWholeFetch)
{
    // Arrange
    m_client->Put("empty.txt", "");

    // Act
    auto reader = Open("empty.txt", 4);
    std::vector<char> buffer(4);

    // Assert
    EXPECT_EQ(0, reader.GetSize());
    EXPECT_TRUE(reader.IsComplete());
    EXPECT_EQ(0, reader.Read(buffer));
    const auto& requests = m_client->GetRequests();
    ASSERT_EQ(2u, requests.size());
    ExpectRange(requests[0], 0, 3);
    EXPECT_FALSE(requests[1].has_value());
    EXPECT_EQ(InMemoryObjectClient::DefaultLastModified, reader.Stat().GetLastModified());
}

TEST_F(ObjectReaderTests, ZeroLengthObject_ChunkSizeZero_FetchesOnce)
{
    m_client->Put("empty.txt", "");

    auto reader = Open("empty.txt", 0);

    EXPECT_EQ(0, reader.GetSize());
    EXPECT_EQ(1u, m_client->GetFetchCount());
}

TEST_F(ObjectReaderTests, ObjectChanged_LaterFetch_ThrowsAndKeepsState)
{
    // Arrange
    auto reader = Open("hello.txt", 4);
    std::vector<char> buffer(8);
    m_client->SetLastModified("hello.txt", InMemoryObjectClient::DefaultLastModified + std::chrono::seconds(1));

    // Act & Assert
    EXPECT_EQ(ObjectErrorCode::ObjectChanged, CaptureErrorCode([&] { return reader.Read(buffer); }));
    EXPECT_EQ(0, reader.GetOffset());
    EXPECT_EQ(4, reader.GetDownloadOffset());
    EXPECT_EQ(12, reader.Stat().GetSize());
    EXPECT_EQ(InMemoryObjectClient::DefaultLastModified, reader.Stat().GetLastModified());

    m_client->SetLastModified("hello.txt", InMemoryObjectClient::DefaultLastModified);
    EXPECT_EQ(8, reader.Read(buffer));
    EXPECT_EQ("hello, w", std::string(buffer.data(), buffer.size()));
}

TEST_F(ObjectReaderTests, ObjectChanged_SizeDiffers_Throws)
{
    // Arrange
    auto reader = Open("hello.txt", 4);
    m_client->Put("hello.txt", "hello, world!");
    std::vector<char> buffer(8);

    // Act & Assert
    EXPECT_EQ(ObjectErrorCode::ObjectChanged, CaptureErrorCode([&] { return reader.Read(buffer); }));
    EXPECT_EQ(12, reader.GetSize());
}

TEST_F(ObjectReaderTests, TransportFailure_KeepsStateAndAllowsRetry)
{
    // Arrange
    auto reader = Open("hello.txt", 4);
    std::vector<char> buffer(6);
    m_client->SetFailure(ObjectErrorCode::TransportFailure);

    // Act & Assert
    EXPECT_EQ(ObjectErrorCode::TransportFailure, CaptureErrorCode([&] { return reader.Read(buffer); }));
    EXPECT_EQ(0, reader.GetOffset());
    EXPECT_EQ(4, reader.GetDownloadOffset());

    m_client->SetFailure(std::nullopt);
    EXPECT_EQ(6, reader.Read(buffer));
    EXPECT_EQ("hello,", std::string(buffer.data(), buffer.size()));
}

TEST_F(ObjectReaderTests, TruncatedBody_ThrowsMalformedResponseAndKeepsState)
{
    // Arrange
    auto reader = Open("hello.txt", 4);
    std::vector<char> buffer(6);
    m_client->SetTruncateBodies(true);

    // Act & Assert
    EXPECT_EQ(ObjectErrorCode::MalformedResponse, CaptureErrorCode([&] { return reader.Read(buffer); }));
    EXPECT_EQ(4, reader.GetDownloadOffset());

    m_client->SetTruncateBodies(false);
    EXPECT_EQ(6, reader.Read(buffer));
}

TEST_F(ObjectReaderTests, BodyFailsHalfway_DiscardsPartialChunk)
{
    // Arrange
    auto reader = Open("hello.txt", 4);
    std::vector<char> buffer(8);
    m_client->SetBodyFailAfter(2);

    // Act & Assert
    EXPECT_EQ(ObjectErrorCode::TransportFailure, CaptureErrorCode([&] { return reader.Read(buffer); }));
    EXPECT_EQ(4, reader.GetDownloadOffset());

    m_client->SetBodyFailAfter(std::nullopt);
    EXPECT_EQ(std::string(HelloWorld), ReadToEnd(reader, 8));
}

TEST_F(ObjectReaderTests, Cancelled_BeforeFetch_ThrowsAndKeepsState)
{
    // Arrange
    std::stop_source source;
    auto reader = Open("hello.txt", 4, CancellationToken{ source.get_token() });
    std::vector<char> small(2);
    std::vector<char> large(8);
    source.request_stop();

    // Act & Assert
    EXPECT_EQ(2, reader.Read(small));
    EXPECT_EQ(ObjectErrorCode::Cancelled, CaptureErrorCode([&] { return reader.Read(large); }));
    EXPECT_EQ(2, reader.GetOffset());
    EXPECT_EQ(4, reader.GetDownloadOffset());
    EXPECT_EQ(1u, m_client->GetFetchCount());
}

TEST_F(ObjectReaderTests, Cancelled_ExpiredDeadline_FailsOpenWithoutFetching)
{
    const CancellationToken expired{ std::stop_token{}, std::chrono::system_clock::now() - std::chrono::seconds(1) };

    EXPECT_EQ(ObjectErrorCode::Cancelled, CaptureErrorCode([&] { return Open("hello.txt", 4, expired); }));
    EXPECT_EQ(0u, m_client->GetFetchCount());
}

TEST_F(ObjectReaderTests, SetCancellation_ReplacesExpiredToken)
{
    // Arrange
    std::stop_source source;
    auto reader = Open("hello.txt", 4, CancellationToken{ source.get_token() });
    std::vector<char> buffer(8);
    source.request_stop();

    // Act
    reader.SetCancellation({});
    const auto bytesRead = reader.Read(buffer);

    // Assert
    EXPECT_EQ(8, bytesRead);
    EXPECT_EQ("hello, w", std::string(buffer.data(), 8));
    EXPECT_EQ(2u, m_client->GetFetchCount());
}

TEST_F(ObjectReaderTests, ReadAll_FetchesWholeObjectOnce)
{
    // Act
    const auto data = ObjectReader::ReadAll("hello.txt", m_client, {}, m_logger);

    // Assert
    EXPECT_EQ(std::string(HelloWorld), std::string(data.begin(), data.end()));
    ASSERT_EQ(1u, m_client->GetFetchCount());
    EXPECT_FALSE(m_client->GetRequests()[0].has_value());
}

TEST_F(ObjectReaderTests, Stat_ReportsNameSizeAndModificationTime)
{
    auto reader = Open("hello.txt", 1);

    const auto attributes = reader.Stat();

    EXPECT_EQ("hello.txt", attributes.GetName());
    EXPECT_EQ(12, attributes.GetSize());
    EXPECT_EQ(InMemoryObjectClient::DefaultLastModified, attributes.GetLastModified());
}

class ObjectReaderMockTests : public ::testing::Test
{
protected:
    std::shared_ptr<ObjectClientMock> m_client;
    std::shared_ptr<Logger> m_logger;

    void SetUp() override
    {
        m_client = std::make_shared<ObjectClientMock>();
        m_logger = CreateLogger();
    }
};

TEST_F(ObjectReaderMockTests, RangeNotSatisfiable_AfterFirstFetch_Propagates)
{
    // Arrange
    {
        InSequence sequence;
        EXPECT_CALL(*m_client, Fetch("object", _, _))
            .WillOnce([](const std::string&, const std::optional<ByteRange>&, const CancellationToken&)
                {
                    return MakeResponse("abcd", "bytes 0-3/12");
                });
        EXPECT_CALL(*m_client, Fetch("object", _, _))
            .WillOnce(Throw(ObjectError(ObjectErrorCode::RangeNotSatisfiable, "Range not satisfiable")));
    }

    ObjectReader reader{ "object", m_client, 4, {}, m_logger };
    std::vector<char> buffer(8);

    // Act & Assert
    EXPECT_EQ(ObjectErrorCode::RangeNotSatisfiable, CaptureErrorCode([&] { return reader.Read(buffer); }));
    EXPECT_EQ(4, reader.GetDownloadOffset());
}

TEST_F(ObjectReaderMockTests, ContentRange_NotStartingAtDownloadOffset_ThrowsMalformedResponse)
{
    // Arrange
    EXPECT_CALL(*m_client, Fetch("object", _, _))
        .WillOnce([](const std::string&, const std::optional<ByteRange>&, const CancellationToken&)
            {
                return MakeResponse("abcd", "bytes 4-7/12");
            });

    // Act & Assert
    EXPECT_EQ(ObjectErrorCode::MalformedResponse, CaptureErrorCode([&] { return ObjectReader{ "object", m_client, 4, {}, m_logger }; }));
}

TEST_F(ObjectReaderMockTests, ContentRange_Missing_ThrowsMalformedResponse)
{
    // Arrange
    EXPECT_CALL(*m_client, Fetch("object", _, _))
        .WillOnce([](const std::string&, const std::optional<ByteRange>&, const CancellationToken&)
            {
                return MakeResponse("abcd", std::nullopt);
            });

    // Act & Assert
    EXPECT_EQ(ObjectErrorCode::MalformedResponse, CaptureErrorCode([&] { return ObjectReader{ "object", m_client, 4, {}, m_logger }; }));
}

TEST_F(ObjectReaderMockTests, Fetch_ReceivesReaderCancellationToken)
{
    // Arrange
    std::stop_source source;
    EXPECT_CALL(*m_client, Fetch("object", _, _))
        .WillOnce([&source](const std::string&, const std::optional<ByteRange>& range, const CancellationToken& cancellation)
            {
                EXPECT_FALSE(range.has_value());
                EXPECT_FALSE(cancellation.IsStopRequested());
                source.request_stop();
                EXPECT_TRUE(cancellation.IsStopRequested());
                return MakeResponse("abcd", std::nullopt);
            });

    // Act
    ObjectReader reader{ "object", m_client, 0, CancellationToken{ source.get_token() }, m_logger };

    // Assert
    EXPECT_EQ(4, reader.GetSize());
    EXPECT_TRUE(reader.IsComplete());
}
