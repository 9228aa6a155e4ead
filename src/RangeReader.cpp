#include "RangeReader.h"

#include <algorithm>
#include <cstring>
#include <curl/curl.h>

#include "CurlHttpClient.h"

std::string FormatRangeHeader(int64_t from, int64_t length)
{
    // 调用方保证 from + length 不溢出
    int64_t to = (length == 0) ? from : from + (length - 1);
    return "bytes=" + std::to_string(from) + "-" + std::to_string(to);
}

CRangeReader::CRangeReader(const std::string& url)
    : m_file_url(url)
{
}

// 没有给传输层就用默认的 libcurl 实现
void CRangeReader::Init()
{
    if (!m_client)
    {
        m_default_client = std::make_shared<CCurlHttpClient>();
        m_default_client->SetLogger(m_logger);
        m_client = m_default_client;
    }
}

void CRangeReader::SetHttpClient(std::shared_ptr<IHttpClient> client)
{
    m_default_client.reset();
    m_client = std::move(client);
}

// 默认传输层是自己建的，日志要一起换
void CRangeReader::SetLogger(IRangeLogger* logger)
{
    m_logger = logger;
    if (m_default_client)
        m_default_client->SetLogger(logger);
}

RangeStatus CRangeReader::Fail(RangeStatus status, const std::string& detail)
{
    m_last_error = detail;
    return status;
}

RangeStatus CRangeReader::NewRequest(const char* method, CHttpRequest& request)
{
    if (!m_url_parsed)
    {
        CURLU* h = curl_url();
        if (!h)
            return Fail(RANGE_ERR_BAD_URL, "curl_url() failed");

        CURLUcode rc = curl_url_set(h, CURLUPART_URL, m_file_url.c_str(), 0);
        if (rc)
        {
            std::string detail = "parse \"" + m_file_url + "\": " + curl_url_strerror(rc);
            curl_url_cleanup(h);
            return Fail(RANGE_ERR_BAD_URL, detail);
        }

        char* full = NULL;
        rc = curl_url_get(h, CURLUPART_URL, &full, 0);
        if (rc || !full)
        {
            std::string detail = "parse \"" + m_file_url + "\": " + curl_url_strerror(rc);
            curl_url_cleanup(h);
            return Fail(RANGE_ERR_BAD_URL, detail);
        }
        m_request_url = full;
        curl_free(full);
        curl_url_cleanup(h);
        m_url_parsed = true;
    }

    request = CHttpRequest();
    request.method = method;
    request.url = m_request_url;
    return RANGE_OK;
}

// 只有 offset 严格大于缓存起点、且整个请求都落在缓存内才算命中。
// 从 m_cache_start 正好开始的读取永远走网络。
bool CRangeReader::IsCacheHit(int64_t offset, size_t size) const
{
    if (!m_has_cache || offset <= m_cache_start)
        return false;

    // offset + size 可能溢出，只比较差值
    if (size > m_cache.size())
        return false;
    return (uint64_t)(offset - m_cache_start) <= m_cache.size() - size;
}

RangeStatus CRangeReader::ReadAt(uint8_t* buffer, size_t size, int64_t offset, size_t& bytes_read)
{
    bytes_read = 0;
    RangeLog(m_logger, RANGE_LOG_DEBUG, "RangeVFS: ReadAt len %zu off %lld", size, (long long)offset);

    // 0 以下不存在任何有效的字节区间
    if (offset < 0)
        return Fail(RANGE_EOF, "negative offset " + std::to_string(offset));

    // 请求区间的末尾必须能用 int64_t 表示
    size_t wanted = std::max(size, m_cfg_min_fetch_size);
    if ((uint64_t)std::max<size_t>(wanted, 1) > (uint64_t)(INT64_MAX - offset))
        return Fail(RANGE_EOF, "offset " + std::to_string(offset) + " is past any representable range");

    int64_t offset_end = offset + (int64_t)size;
    int64_t cache_end = m_cache_start + (int64_t)m_cache.size();

    if (IsCacheHit(offset, size))
    {
        RangeLog(m_logger, RANGE_LOG_DEBUG, "RangeVFS: cache hit: range (%lld-%lld) is within cache (%lld-%lld)",
                 (long long)offset, (long long)offset_end, (long long)m_cache_start, (long long)cache_end);
        if (size > 0)
            memcpy(buffer, m_cache.data() + (offset - m_cache_start), size);
        bytes_read = size;
        return RANGE_OK;
    }

    if (m_has_cache)
    {
        RangeLog(m_logger, RANGE_LOG_DEBUG, "RangeVFS: cache miss: range (%lld-%lld) is NOT within cache (%lld-%lld)",
                 (long long)offset, (long long)offset_end, (long long)m_cache_start, (long long)cache_end);
    }
    else
    {
        RangeLog(m_logger, RANGE_LOG_DEBUG, "RangeVFS: cache miss: cache empty");
    }

    CHttpRequest request;
    RangeStatus status = NewRequest("GET", request);
    if (status != RANGE_OK)
        return status;

    std::string range = FormatRangeHeader(offset, (int64_t)wanted);
    request.AddHeader("Range", range);

    // 缓存整段作废，旧 vector 的容量留给这次响应
    CHttpResponse response;
    response.body.swap(m_cache);
    response.body.clear();
    m_has_cache = false;

    RangeLog(m_logger, RANGE_LOG_INFO, "RangeVFS: Start HTTP GET with Range: %s", range.c_str());

    Init();
    std::string error;
    if (!m_client->Do(request, response, error))
        return Fail(RANGE_ERR_TRANSPORT, error);

    RangeLog(m_logger, RANGE_LOG_INFO, "RangeVFS: Response status: %ld", response.status_code);

    if (response.status_code != 200 && response.status_code != 206)
        return Fail(RANGE_EOF, "HTTP status " + std::to_string(response.status_code));

    m_cache.swap(response.body);
    m_cache_start = offset;
    m_has_cache = true;
    RangeLog(m_logger, RANGE_LOG_DEBUG, "RangeVFS: loaded %zu bytes into cache", m_cache.size());

    size_t n = std::min(m_cache.size(), size);
    if (n > 0)
        memcpy(buffer, m_cache.data(), n);
    bytes_read = n;

    // 传输层说"到头了"：如果请求的字节都已经给全，这只是本次响应结束，不是资源结束
    if (response.truncated && n < size)
        return Fail(RANGE_EOF, "transfer ended after " + std::to_string(n) + " of " + std::to_string(size) + " bytes");

    return RANGE_OK;
}

RangeStatus CRangeReader::Read(uint8_t* buffer, size_t size, size_t& bytes_read)
{
    RangeLog(m_logger, RANGE_LOG_DEBUG, "RangeVFS: got read len %zu", size);

    RangeStatus status = ReadAt(buffer, size, m_logical_position, bytes_read);
    if (status == RANGE_OK)
        m_logical_position += (int64_t)bytes_read;

    return status;
}

RangeStatus CRangeReader::Seek(int64_t position, int whence, int64_t& new_position)
{
    RangeLog(m_logger, RANGE_LOG_DEBUG, "RangeVFS: got seek %lld %d", (long long)position, whence);

    // 只更新逻辑位置，不做越界检查，越界在下一次读取时才暴露
    switch (whence)
    {
        case SEEK_SET:
            m_logical_position = position;
            break;
        case SEEK_CUR:
            if ((position > 0 && m_logical_position > INT64_MAX - position) ||
                (position < 0 && m_logical_position < INT64_MIN - position))
                return Fail(RANGE_ERR_INVALID_ARGUMENT, "seek offset " + std::to_string(position) +
                                                            " overflows position " + std::to_string(m_logical_position));
            m_logical_position += position;
            break;
        case SEEK_END:
            return Fail(RANGE_ERR_NOT_IMPLEMENTED, "whence relative to end not implemented");
        default:
            return Fail(RANGE_ERR_INVALID_ARGUMENT, "invalid whence " + std::to_string(whence));
    }

    new_position = m_logical_position;
    return RANGE_OK;
}

RangeStatus CRangeReader::Size(int64_t& total_size)
{
    Init();

    CHttpRequest request;
    RangeStatus status = NewRequest("HEAD", request);
    if (status != RANGE_OK)
        return status;

    CHttpResponse response;
    std::string error;
    if (!m_client->Do(request, response, error))
        return Fail(RANGE_ERR_TRANSPORT, error);

    // 没有长度就报错，不返回 0
    if (response.content_length < 0)
        return Fail(RANGE_ERR_NO_CONTENT_LENGTH, "no content length for Size()");

    RangeLog(m_logger, RANGE_LOG_DEBUG, "RangeVFS: url: %s, size %lld", request.url.c_str(),
             (long long)response.content_length);

    total_size = response.content_length;
    return RANGE_OK;
}
