#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// 传输层抽象：一次完整的 HTTP 交换 (请求 -> 状态码/长度/响应体)
// ---------------------------------------------------------------------------
struct CHttpRequest
{
    std::string method = "GET";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;

    void AddHeader(const std::string& name, const std::string& value)
    {
        headers.emplace_back(name, value);
    }

    // 头名大小写不敏感
    const std::string* FindHeader(const std::string& name) const
    {
        for (const auto& header : headers)
        {
            if (header.first.size() == name.size() &&
                std::equal(name.begin(), name.end(), header.first.begin(), [](char a, char b) {
                    return ::tolower((unsigned char)a) == ::tolower((unsigned char)b);
                }))
                return &header.second;
        }
        return nullptr;
    }
};

struct CHttpResponse
{
    long status_code = 0;
    int64_t content_length = -1; // -1: 服务器没有给出长度
    std::vector<uint8_t> body;

    // 响应体在服务器声明的长度之前就结束了 (连接提前关闭)
    bool truncated = false;
};

class IHttpClient
{
public:
    virtual ~IHttpClient() = default;

    // 发送请求并完整接收响应体，返回前响应体已经全部读完。
    // 只有传输层失败 (DNS/连接/TLS 等) 才返回 false，error 里是原始错误信息；
    // 任何 HTTP 状态码都算成功交换，由调用方判断。
    virtual bool Do(const CHttpRequest& request, CHttpResponse& response, std::string& error) = 0;
};
