#pragma once

#include <string>
#include <curl/curl.h>

#include "HttpClient.h"
#include "RangeLogger.h"

#ifndef RANGE_VFS_VERSION
#define RANGE_VFS_VERSION "0.0.0"
#endif

// ---------------------------------------------------------------------------
// CCurlHttpClient: 默认传输层 (libcurl easy 接口)
// ---------------------------------------------------------------------------
// 整个生命周期复用同一个 easy handle，每次请求前 curl_easy_reset，
// 这样 libcurl 的连接缓存可以保持 TCP/TLS 连接不断开。
// 跳转、TLS、超时都在这里处理，上层只看到状态码和响应体。
class CCurlHttpClient : public IHttpClient
{
public:
    CCurlHttpClient();
    ~CCurlHttpClient() override;

    CCurlHttpClient(const CCurlHttpClient&) = delete;
    CCurlHttpClient& operator=(const CCurlHttpClient&) = delete;

    bool Do(const CHttpRequest& request, CHttpResponse& response, std::string& error) override;

    void SetLogger(IRangeLogger* logger) { m_logger = logger; }

    // -----------------------------------------------------------------------
    // 可配置参数区 (Configuration)
    // -----------------------------------------------------------------------
    std::string m_username;
    std::string m_password;
    std::string m_user_agent = "vfs.stream.range/" RANGE_VFS_VERSION;
    bool m_net_verify_tls = true;

    long m_net_connect_timeout_sec = 10;
    long m_net_read_timeout_sec = 0; // 0 = 不限制整个请求的时长
    long m_net_low_speed_time_sec = 15;
    long m_net_max_redirects = 5;

protected:
    void SetupBaseCurlOptions(CURL* curl, const CHttpRequest& request);

    static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static int DebugCallback(CURL* handle, curl_infotype type, char* data, size_t size, void* userptr);

private:
    CURL* m_curl = nullptr;
    IRangeLogger* m_logger = nullptr;
    char m_errbuf[CURL_ERROR_SIZE];
};
