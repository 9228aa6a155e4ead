#include "CurlHttpClient.h"

#include <cctype>
#include <string>

// 去掉 header 行尾的 \r\n
static std::string TrimHeaderLine(const char* data, size_t size)
{
    std::string line(data, size);
    while (!line.empty() && isspace((unsigned char)line.back()))
        line.pop_back();
    return line;
}

// 调试回调：打印发送的请求头、收到的响应头以及连接复用信息
int CCurlHttpClient::DebugCallback(CURL* handle, curl_infotype type, char* data, size_t size, void* userptr)
{
    CCurlHttpClient* self = (CCurlHttpClient*)userptr;
    if (!self || !self->m_logger)
        return 0;

    if (type == CURLINFO_HEADER_OUT)
    {
        // 请求头是一整块，逐行输出
        std::string block(data, size);
        size_t start = 0;
        while (start < block.size())
        {
            size_t end = block.find('\n', start);
            if (end == std::string::npos)
                end = block.size();
            std::string line = TrimHeaderLine(block.data() + start, end - start);
            if (!line.empty())
                RangeLog(self->m_logger, RANGE_LOG_DEBUG, "RangeVFS: [Req Header] >> %s", line.c_str());
            start = end + 1;
        }
    }
    else if (type == CURLINFO_HEADER_IN)
    {
        std::string header = TrimHeaderLine(data, size);
        if (!header.empty())
            RangeLog(self->m_logger, RANGE_LOG_DEBUG, "RangeVFS: [Resp Header] << %s", header.c_str());
    }
    else if (type == CURLINFO_TEXT)
    {
        std::string text(data, size);
        if (text.find("Connected to") != std::string::npos ||
            text.find("Re-using existing connection") != std::string::npos)
        {
            text = TrimHeaderLine(text.data(), text.size());
            RangeLog(self->m_logger, RANGE_LOG_DEBUG, "RangeVFS: [Connection Info] %s", text.c_str());
        }
    }
    return 0;
}

size_t CCurlHttpClient::WriteCallback(void* contents, size_t size, size_t nmemb, void* userp)
{
    size_t realsize = size * nmemb;
    std::vector<uint8_t>* body = (std::vector<uint8_t>*)userp;
    const uint8_t* bytes = (const uint8_t*)contents;
    body->insert(body->end(), bytes, bytes + realsize);
    return realsize;
}

CCurlHttpClient::CCurlHttpClient()
{
    m_errbuf[0] = 0;
}

CCurlHttpClient::~CCurlHttpClient()
{
    if (m_curl)
    {
        curl_easy_cleanup(m_curl);
        m_curl = nullptr;
    }
}

void CCurlHttpClient::SetupBaseCurlOptions(CURL* curl, const CHttpRequest& request)
{
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);

    curl_easy_setopt(curl, CURLOPT_USERAGENT, m_user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "identity");
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, (long)CURL_HTTP_VERSION_1_1);

    if (m_logger)
    {
        curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
        curl_easy_setopt(curl, CURLOPT_DEBUGFUNCTION, CCurlHttpClient::DebugCallback);
        curl_easy_setopt(curl, CURLOPT_DEBUGDATA, this);
    }

    // URL & Auth
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    if (!m_username.empty())
    {
        curl_easy_setopt(curl, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(curl, CURLOPT_USERNAME, m_username.c_str());
        curl_easy_setopt(curl, CURLOPT_PASSWORD, m_password.c_str());
    }

    // SSL & Redirects
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, m_net_verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, m_net_verify_tls ? 2L : 0L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, m_net_max_redirects);

    // Network & Timeouts
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, m_net_connect_timeout_sec);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, m_net_read_timeout_sec);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, m_net_low_speed_time_sec);
}

bool CCurlHttpClient::Do(const CHttpRequest& request, CHttpResponse& response, std::string& error)
{
    if (!m_curl)
        m_curl = curl_easy_init();
    if (!m_curl)
    {
        error = "curl_easy_init failed";
        return false;
    }

    // 复用 handle：只清掉上一次的选项，连接缓存保留
    curl_easy_reset(m_curl);
    m_errbuf[0] = 0;
    curl_easy_setopt(m_curl, CURLOPT_ERRORBUFFER, m_errbuf);

    SetupBaseCurlOptions(m_curl, request);

    struct curl_slist* headers = NULL;
    for (const auto& header : request.headers)
    {
        std::string line = header.first + ": " + header.second;
        headers = curl_slist_append(headers, line.c_str());
    }
    if (headers)
        curl_easy_setopt(m_curl, CURLOPT_HTTPHEADER, headers);

    if (request.method == "HEAD")
        curl_easy_setopt(m_curl, CURLOPT_NOBODY, 1L);
    else if (request.method != "GET")
        curl_easy_setopt(m_curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());

    response.status_code = 0;
    response.content_length = -1;
    response.truncated = false;
    response.body.clear();

    curl_easy_setopt(m_curl, CURLOPT_WRITEFUNCTION, CCurlHttpClient::WriteCallback);
    curl_easy_setopt(m_curl, CURLOPT_WRITEDATA, &response.body);

    CURLcode res = curl_easy_perform(m_curl);

    // slist 已经不再需要，handle 上的指针下次 reset 前也不会再用
    curl_easy_setopt(m_curl, CURLOPT_HTTPHEADER, NULL);
    curl_slist_free_all(headers);

    // CURLE_PARTIAL_FILE: 响应体比 Content-Length 短，数据本身是有效的，
    // 交给上层按"数据结束"处理，不算传输失败
    if (res != CURLE_OK && res != CURLE_PARTIAL_FILE)
    {
        error = m_errbuf[0] ? std::string(m_errbuf) : std::string(curl_easy_strerror(res));
        RangeLog(m_logger, RANGE_LOG_DEBUG, "RangeVFS: %s failed. Code=%d, Detail: %s",
                 request.method.c_str(), (int)res, error.c_str());
        return false;
    }

    curl_easy_getinfo(m_curl, CURLINFO_RESPONSE_CODE, &response.status_code);

    curl_off_t cl = -1;
    if (curl_easy_getinfo(m_curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &cl) == CURLE_OK && cl >= 0)
        response.content_length = (int64_t)cl;

    response.truncated = (res == CURLE_PARTIAL_FILE);
    if (response.truncated)
    {
        RangeLog(m_logger, RANGE_LOG_DEBUG, "RangeVFS: Short body. Got %zu bytes, declared %lld",
                 response.body.size(), (long long)response.content_length);
    }
    return true;
}
