#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "MockHttpClient.h"
#include "RangeReader.h"

namespace {

const char kUrl[] = "https://example.com/data.bin";

std::string ToString(const std::vector<uint8_t>& buf, size_t n)
{
    return std::string(buf.begin(), buf.begin() + n);
}

class RangeReaderTest : public testing::Test
{
protected:
    void Open(const std::string& content)
    {
        m_client = std::make_shared<CMockHttpClient>(content);
        m_reader.reset(new CRangeReader(kUrl));
        m_reader->SetHttpClient(m_client);
        m_reader->SetLogger(&m_logger);
    }

    std::shared_ptr<CMockHttpClient> m_client;
    std::unique_ptr<CRangeReader> m_reader;
    CRecordingLogger m_logger;
};

} // namespace

TEST(FormatRangeHeaderTest, InclusiveEnd)
{
    EXPECT_EQ("bytes=0-99", FormatRangeHeader(0, 100));
    EXPECT_EQ("bytes=30-329", FormatRangeHeader(30, 300));
    EXPECT_EQ("bytes=0-1048575", FormatRangeHeader(0, 1024 * 1024));
}

TEST(FormatRangeHeaderTest, ZeroLengthAsksForOneByte)
{
    EXPECT_EQ("bytes=5-5", FormatRangeHeader(5, 0));
}

TEST_F(RangeReaderTest, ReadAtSequenceUsesTwoFetches)
{
    Open("Mock HTTP response body");

    struct Case
    {
        int64_t offset;
        size_t size;
        size_t expect_len;
        RangeStatus expect_status;
    };
    const Case cases[] = {
        {0, 10, 10, RANGE_OK},
        {10, 1, 1, RANGE_OK},
        {30, 30, 0, RANGE_OK},
        {-1, 0, 0, RANGE_EOF},
    };

    for (const Case& c : cases)
    {
        std::vector<uint8_t> buf(c.size);
        size_t n = 99;
        RangeStatus status = m_reader->ReadAt(buf.data(), buf.size(), c.offset, n);
        EXPECT_EQ(c.expect_status, status) << "offset=" << c.offset << " size=" << c.size;
        EXPECT_EQ(c.expect_len, n) << "offset=" << c.offset << " size=" << c.size;
    }

    // one fetch fills the cache, one looks past the end for offset 30
    ASSERT_EQ(2u, m_client->RequestCount());
    EXPECT_EQ("bytes=0-1048575", *m_client->m_requests[0].FindHeader("Range"));
    EXPECT_EQ("bytes=30-1048605", *m_client->m_requests[1].FindHeader("Range"));
}

TEST_F(RangeReaderTest, ReadNothing)
{
    Open("");

    std::vector<uint8_t> buf(10);
    size_t n = 99;
    EXPECT_EQ(RANGE_OK, m_reader->Read(buf.data(), buf.size(), n));
    EXPECT_EQ(0u, n);
    EXPECT_EQ(0, m_reader->GetPosition());
}

TEST_F(RangeReaderTest, ReadOffEnd)
{
    Open("0123456789abcdefghij");

    std::vector<uint8_t> buf(10);
    size_t n = 0;
    ASSERT_EQ(RANGE_OK, m_reader->Read(buf.data(), buf.size(), n));
    EXPECT_EQ(10u, n);
    EXPECT_EQ("0123456789", ToString(buf, n));
    EXPECT_EQ(10, m_reader->GetPosition());

    ASSERT_EQ(RANGE_OK, m_reader->Read(buf.data(), buf.size(), n));
    EXPECT_EQ(10u, n);
    EXPECT_EQ("abcdefghij", ToString(buf, n));
    EXPECT_EQ(20, m_reader->GetPosition());

    ASSERT_EQ(RANGE_OK, m_reader->Read(buf.data(), buf.size(), n));
    EXPECT_EQ(0u, n);
    EXPECT_EQ(20, m_reader->GetPosition());

    // the second chunk came from the cache
    EXPECT_EQ(2u, m_client->RequestCount());
}

TEST_F(RangeReaderTest, InterleavedReadsShareOneFetch)
{
    Open("0123456789abcdefghij");

    std::vector<uint8_t> buf(10);
    size_t n = 0;
    ASSERT_EQ(RANGE_OK, m_reader->ReadAt(buf.data(), 10, 0, n));
    ASSERT_EQ(RANGE_OK, m_reader->ReadAt(buf.data(), 1, 10, n));
    EXPECT_EQ(1u, n);
    EXPECT_EQ('a', buf[0]);
    EXPECT_EQ(1u, m_client->RequestCount());
    EXPECT_TRUE(m_logger.Contains("cache hit"));
}

TEST_F(RangeReaderTest, CacheHitReturnsCachedBytes)
{
    std::string content;
    for (int i = 0; i < 200; i++)
        content.push_back((char)('A' + i % 26));
    Open(content);

    std::vector<uint8_t> buf(64);
    size_t n = 0;
    ASSERT_EQ(RANGE_OK, m_reader->ReadAt(buf.data(), 4, 0, n));

    const int64_t offsets[] = {1, 5, 77, 136};
    for (int64_t off : offsets)
    {
        ASSERT_EQ(RANGE_OK, m_reader->ReadAt(buf.data(), 64, off, n));
        EXPECT_EQ(64u, n);
        EXPECT_EQ(content.substr((size_t)off, 64), ToString(buf, n));
    }
    EXPECT_EQ(1u, m_client->RequestCount());
}

// A read that starts exactly at the cache start is fetched again even though
// the cache holds every byte of it.
TEST_F(RangeReaderTest, ReadAtCacheStartIsAMiss)
{
    Open("0123456789abcdefghij");

    std::vector<uint8_t> buf(10);
    size_t n = 0;
    ASSERT_EQ(RANGE_OK, m_reader->ReadAt(buf.data(), 10, 0, n));
    ASSERT_EQ(RANGE_OK, m_reader->ReadAt(buf.data(), 10, 0, n));
    EXPECT_EQ("0123456789", ToString(buf, n));

    ASSERT_EQ(2u, m_client->RequestCount());
    EXPECT_EQ("bytes=0-1048575", m_client->LastRange());
}

TEST_F(RangeReaderTest, OverrunningCacheReplacesIt)
{
    std::string content(64, 'x');
    for (size_t i = 0; i < content.size(); i++)
        content[i] = (char)('0' + i % 10);
    Open(content);
    m_reader->m_cfg_min_fetch_size = 16;

    std::vector<uint8_t> buf(16);
    size_t n = 0;
    ASSERT_EQ(RANGE_OK, m_reader->ReadAt(buf.data(), 4, 0, n));
    EXPECT_EQ("bytes=0-15", m_client->LastRange());
    EXPECT_EQ(0, m_reader->GetCacheStart());
    EXPECT_EQ(16u, m_reader->GetCacheLength());

    // starts inside the cached span, ends past it
    ASSERT_EQ(RANGE_OK, m_reader->ReadAt(buf.data(), 16, 8, n));
    EXPECT_EQ(16u, n);
    EXPECT_EQ(content.substr(8, 16), ToString(buf, n));
    EXPECT_EQ(2u, m_client->RequestCount());
    EXPECT_EQ("bytes=8-23", m_client->LastRange());
    EXPECT_EQ(8, m_reader->GetCacheStart());
    EXPECT_EQ(16u, m_reader->GetCacheLength());
}

TEST_F(RangeReaderTest, LargeReadFetchesWholeBuffer)
{
    Open(std::string(100, 'z'));
    m_reader->m_cfg_min_fetch_size = 16;

    std::vector<uint8_t> buf(40);
    size_t n = 0;
    ASSERT_EQ(RANGE_OK, m_reader->ReadAt(buf.data(), buf.size(), 0, n));
    EXPECT_EQ(40u, n);
    EXPECT_EQ("bytes=0-39", m_client->LastRange());
}

TEST_F(RangeReaderTest, NegativeOffsetIsEndOfData)
{
    Open("0123456789");

    std::vector<uint8_t> buf(4);
    size_t n = 99;
    EXPECT_EQ(RANGE_EOF, m_reader->ReadAt(buf.data(), buf.size(), -5, n));
    EXPECT_EQ(0u, n);
    EXPECT_EQ(0u, m_client->RequestCount());
}

TEST_F(RangeReaderTest, UnexpectedStatusIsEndOfData)
{
    Open("0123456789");
    m_client->m_status = 416;

    std::vector<uint8_t> buf(4);
    size_t n = 99;
    EXPECT_EQ(RANGE_EOF, m_reader->ReadAt(buf.data(), buf.size(), 0, n));
    EXPECT_EQ(0u, n);
    EXPECT_FALSE(m_reader->HasCache());

    // nothing was cached from the failed response
    m_client->m_status = 200;
    ASSERT_EQ(RANGE_OK, m_reader->ReadAt(buf.data(), buf.size(), 2, n));
    EXPECT_EQ("2345", ToString(buf, n));
    EXPECT_EQ(2u, m_client->RequestCount());
}

TEST_F(RangeReaderTest, PartialContentAccepted)
{
    Open("0123456789");
    m_client->m_status = 206;

    std::vector<uint8_t> buf(3);
    size_t n = 0;
    ASSERT_EQ(RANGE_OK, m_reader->ReadAt(buf.data(), buf.size(), 7, n));
    EXPECT_EQ("789", ToString(buf, n));
}

TEST_F(RangeReaderTest, TransportErrorPropagatesVerbatim)
{
    Open("0123456789");
    m_client->m_fail_with = "Could not resolve host: example.invalid";

    std::vector<uint8_t> buf(4);
    size_t n = 99;
    EXPECT_EQ(RANGE_ERR_TRANSPORT, m_reader->Read(buf.data(), buf.size(), n));
    EXPECT_EQ(0u, n);
    EXPECT_EQ("Could not resolve host: example.invalid", m_reader->GetLastError());
    EXPECT_EQ(0, m_reader->GetPosition());
    EXPECT_EQ(1u, m_client->RequestCount());
}

TEST_F(RangeReaderTest, ShortTransferWithFullBufferIsNotEndOfData)
{
    Open("0123456789abcdefghij");
    m_client->m_deliver_limit = 10;

    std::vector<uint8_t> buf(10);
    size_t n = 0;
    EXPECT_EQ(RANGE_OK, m_reader->ReadAt(buf.data(), buf.size(), 0, n));
    EXPECT_EQ(10u, n);
    EXPECT_EQ("0123456789", ToString(buf, n));
}

TEST_F(RangeReaderTest, ShortTransferWithMissingBytesIsEndOfData)
{
    Open("0123456789abcdefghij");
    m_client->m_deliver_limit = 5;

    std::vector<uint8_t> buf(10);
    size_t n = 0;
    EXPECT_EQ(RANGE_EOF, m_reader->Read(buf.data(), buf.size(), n));
    EXPECT_EQ(5u, n);
    EXPECT_EQ("01234", ToString(buf, n));
    EXPECT_EQ(0, m_reader->GetPosition());
}

TEST_F(RangeReaderTest, FailedReadLeavesCursor)
{
    Open("0123456789");

    int64_t pos = 0;
    ASSERT_EQ(RANGE_OK, m_reader->Seek(5, SEEK_SET, pos));
    m_client->m_status = 500;

    std::vector<uint8_t> buf(4);
    size_t n = 0;
    EXPECT_EQ(RANGE_EOF, m_reader->Read(buf.data(), buf.size(), n));
    EXPECT_EQ(5, m_reader->GetPosition());
}

TEST_F(RangeReaderTest, SeekModes)
{
    Open("0123456789");

    int64_t pos = -1;
    ASSERT_EQ(RANGE_OK, m_reader->Seek(7, SEEK_SET, pos));
    EXPECT_EQ(7, pos);
    ASSERT_EQ(RANGE_OK, m_reader->Seek(3, SEEK_CUR, pos));
    EXPECT_EQ(10, pos);
    ASSERT_EQ(RANGE_OK, m_reader->Seek(-4, SEEK_CUR, pos));
    EXPECT_EQ(6, pos);
    EXPECT_EQ(6, m_reader->GetPosition());

    // no bounds check at seek time
    ASSERT_EQ(RANGE_OK, m_reader->Seek(1000, SEEK_SET, pos));
    EXPECT_EQ(1000, pos);

    EXPECT_EQ(0u, m_client->RequestCount());
}

TEST_F(RangeReaderTest, SeekFromEndIsNotImplemented)
{
    Open("0123456789");

    int64_t pos = 0;
    ASSERT_EQ(RANGE_OK, m_reader->Seek(4, SEEK_SET, pos));

    const int64_t deltas[] = {0, -1, 5, -100};
    for (int64_t delta : deltas)
    {
        EXPECT_EQ(RANGE_ERR_NOT_IMPLEMENTED, m_reader->Seek(delta, SEEK_END, pos));
        EXPECT_EQ(4, m_reader->GetPosition());
    }
}

TEST_F(RangeReaderTest, SeekWithUnknownWhenceIsInvalid)
{
    Open("0123456789");

    int64_t pos = 0;
    EXPECT_EQ(RANGE_ERR_INVALID_ARGUMENT, m_reader->Seek(1, 42, pos));
    EXPECT_EQ(0, m_reader->GetPosition());
}

TEST_F(RangeReaderTest, SeekedReadUsesCursor)
{
    Open("0123456789abcdefghij");

    int64_t pos = 0;
    ASSERT_EQ(RANGE_OK, m_reader->Seek(12, SEEK_SET, pos));

    std::vector<uint8_t> buf(3);
    size_t n = 0;
    ASSERT_EQ(RANGE_OK, m_reader->Read(buf.data(), buf.size(), n));
    EXPECT_EQ("cde", ToString(buf, n));
    EXPECT_EQ(15, m_reader->GetPosition());
    EXPECT_EQ("bytes=12-1048587", m_client->LastRange());
}

TEST_F(RangeReaderTest, NegativeCursorReadsEndOfData)
{
    Open("0123456789");

    int64_t pos = 0;
    ASSERT_EQ(RANGE_OK, m_reader->Seek(-3, SEEK_CUR, pos));

    std::vector<uint8_t> buf(3);
    size_t n = 0;
    EXPECT_EQ(RANGE_EOF, m_reader->Read(buf.data(), buf.size(), n));
    EXPECT_EQ(-3, m_reader->GetPosition());
    EXPECT_EQ(0u, m_client->RequestCount());
}

TEST_F(RangeReaderTest, ReadNearInt64MaxWithCacheIsEndOfData)
{
    Open("0123456789abcdefghij");

    std::vector<uint8_t> buf(10);
    size_t n = 0;
    ASSERT_EQ(RANGE_OK, m_reader->ReadAt(buf.data(), buf.size(), 1, n));
    ASSERT_TRUE(m_reader->HasCache());

    n = 99;
    EXPECT_EQ(RANGE_EOF, m_reader->ReadAt(buf.data(), buf.size(), INT64_MAX - 3, n));
    EXPECT_EQ(0u, n);
    EXPECT_EQ(RANGE_EOF, m_reader->ReadAt(buf.data(), 0, INT64_MAX, n));
    EXPECT_EQ(1u, m_client->RequestCount());

    // the cache is untouched and still serves hits
    ASSERT_EQ(RANGE_OK, m_reader->ReadAt(buf.data(), 4, 2, n));
    EXPECT_EQ("2345", ToString(buf, n));
    EXPECT_EQ(1u, m_client->RequestCount());
}

TEST_F(RangeReaderTest, LastFetchableOffset)
{
    Open("0123456789");
    m_reader->m_cfg_min_fetch_size = 16;

    std::vector<uint8_t> buf(4);
    size_t n = 0;
    EXPECT_EQ(RANGE_OK, m_reader->ReadAt(buf.data(), buf.size(), INT64_MAX - 16, n));
    EXPECT_EQ(0u, n);
    EXPECT_EQ("bytes=" + std::to_string(INT64_MAX - 16) + "-" + std::to_string(INT64_MAX - 1), m_client->LastRange());

    EXPECT_EQ(RANGE_EOF, m_reader->ReadAt(buf.data(), buf.size(), INT64_MAX - 15, n));
    EXPECT_EQ(1u, m_client->RequestCount());
}

TEST_F(RangeReaderTest, SeekOverflowIsRejected)
{
    Open("0123456789");

    int64_t pos = 0;
    ASSERT_EQ(RANGE_OK, m_reader->Seek(INT64_MAX, SEEK_SET, pos));
    EXPECT_EQ(RANGE_ERR_INVALID_ARGUMENT, m_reader->Seek(1, SEEK_CUR, pos));
    EXPECT_EQ(INT64_MAX, m_reader->GetPosition());

    ASSERT_EQ(RANGE_OK, m_reader->Seek(-5, SEEK_SET, pos));
    EXPECT_EQ(RANGE_ERR_INVALID_ARGUMENT, m_reader->Seek(INT64_MIN, SEEK_CUR, pos));
    EXPECT_EQ(-5, m_reader->GetPosition());

    ASSERT_EQ(RANGE_OK, m_reader->Seek(INT64_MAX - 1, SEEK_SET, pos));
    ASSERT_EQ(RANGE_OK, m_reader->Seek(1, SEEK_CUR, pos));
    EXPECT_EQ(INT64_MAX, pos);

    std::vector<uint8_t> buf(8);
    size_t n = 0;
    EXPECT_EQ(RANGE_EOF, m_reader->Read(buf.data(), buf.size(), n));
    EXPECT_EQ(0u, m_client->RequestCount());
}

TEST_F(RangeReaderTest, SizeUsesHead)
{
    Open("0123456789abcdefghij");

    int64_t size = 0;
    ASSERT_EQ(RANGE_OK, m_reader->Size(size));
    EXPECT_EQ(20, size);

    ASSERT_EQ(1u, m_client->RequestCount());
    const CHttpRequest& request = m_client->m_requests[0];
    EXPECT_EQ("HEAD", request.method);
    EXPECT_EQ(kUrl, request.url);
    EXPECT_EQ(nullptr, request.FindHeader("Range"));
}

TEST_F(RangeReaderTest, SizeWithoutContentLengthFails)
{
    Open("0123456789");
    m_client->m_report_length = false;

    int64_t size = 123;
    EXPECT_EQ(RANGE_ERR_NO_CONTENT_LENGTH, m_reader->Size(size));
    EXPECT_EQ(123, size);
}

TEST_F(RangeReaderTest, SizeTransportError)
{
    Open("0123456789");
    m_client->m_fail_with = "Connection refused";

    int64_t size = 0;
    EXPECT_EQ(RANGE_ERR_TRANSPORT, m_reader->Size(size));
    EXPECT_EQ("Connection refused", m_reader->GetLastError());
}

TEST_F(RangeReaderTest, GetCarriesUrlAndMethod)
{
    Open("0123456789");

    std::vector<uint8_t> buf(2);
    size_t n = 0;
    ASSERT_EQ(RANGE_OK, m_reader->ReadAt(buf.data(), buf.size(), 0, n));

    const CHttpRequest& request = m_client->m_requests[0];
    EXPECT_EQ("GET", request.method);
    EXPECT_EQ(kUrl, request.url);
}

TEST(RangeReaderUrlTest, UnparsableUrlFails)
{
    std::shared_ptr<CMockHttpClient> client = std::make_shared<CMockHttpClient>("0123456789");
    CRangeReader reader("not a url");
    reader.SetHttpClient(client);

    std::vector<uint8_t> buf(4);
    size_t n = 0;
    EXPECT_EQ(RANGE_ERR_BAD_URL, reader.ReadAt(buf.data(), buf.size(), 0, n));

    int64_t size = 0;
    EXPECT_EQ(RANGE_ERR_BAD_URL, reader.Size(size));
    EXPECT_EQ(0u, client->RequestCount());
}

TEST(RangeReaderLoggerTest, LoggerDoesNotChangeBehaviour)
{
    const std::string content = "0123456789abcdefghij";
    std::shared_ptr<CMockHttpClient> quiet_client = std::make_shared<CMockHttpClient>(content);
    std::shared_ptr<CMockHttpClient> loud_client = std::make_shared<CMockHttpClient>(content);
    CRecordingLogger logger;

    CRangeReader quiet(kUrl);
    quiet.SetHttpClient(quiet_client);
    CRangeReader loud(kUrl);
    loud.SetHttpClient(loud_client);
    loud.SetLogger(&logger);

    const int64_t offsets[] = {0, 3, 0, 15, 25, -1};
    for (int64_t off : offsets)
    {
        std::vector<uint8_t> a(8);
        std::vector<uint8_t> b(8);
        size_t na = 0;
        size_t nb = 0;
        EXPECT_EQ(quiet.ReadAt(a.data(), a.size(), off, na), loud.ReadAt(b.data(), b.size(), off, nb));
        EXPECT_EQ(na, nb);
        EXPECT_EQ(ToString(a, na), ToString(b, nb));
    }
    EXPECT_EQ(quiet_client->RequestCount(), loud_client->RequestCount());

    EXPECT_TRUE(logger.Contains("[INFO] RangeVFS: Start HTTP GET with Range: bytes=0-1048575"));
    EXPECT_TRUE(logger.Contains("[INFO] RangeVFS: Response status: 200"));
    EXPECT_TRUE(logger.Contains("cache miss: cache empty"));
    EXPECT_TRUE(logger.Contains("cache hit"));
}

TEST(RangeStatusTest, EveryStatusHasAName)
{
    EXPECT_STREQ("ok", RangeStatusToString(RANGE_OK));
    EXPECT_STREQ("end of data", RangeStatusToString(RANGE_EOF));
    EXPECT_STREQ("not implemented", RangeStatusToString(RANGE_ERR_NOT_IMPLEMENTED));
    EXPECT_STREQ("unsupported archive type", RangeStatusToString(RANGE_ERR_UNSUPPORTED_FORMAT));
}

// Connection refused on the loopback interface, no outside network needed.
TEST(RangeReaderLoggerTest, LoggerSetAfterFirstUseReachesDefaultTransport)
{
    CRangeReader reader("http://127.0.0.1:1/data.bin");

    int64_t size = 0;
    ASSERT_EQ(RANGE_ERR_TRANSPORT, reader.Size(size));

    CRecordingLogger logger;
    reader.SetLogger(&logger);
    ASSERT_EQ(RANGE_ERR_TRANSPORT, reader.Size(size));
    EXPECT_TRUE(logger.Contains("RangeVFS: HEAD failed"));
}
