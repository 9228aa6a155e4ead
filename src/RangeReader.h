#pragma once

#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include "HttpClient.h"
#include "RangeLogger.h"
#include "RangeStatus.h"

class CCurlHttpClient;

// 把 [from, from+length) 转成 Range 头的值 (闭区间)。length 为 0 时只请求 from 这一个字节。
std::string FormatRangeHeader(int64_t from, int64_t length);

// ---------------------------------------------------------------------------
// CRangeReader: 用 HTTP Range 请求把远程资源当成可随机访问的本地文件
// ---------------------------------------------------------------------------
// 单槽缓存：只保留最近一次 GET 拿到的一段数据。未命中时整段替换，不做合并/扩展，
// 这样网络请求次数完全由读取序列决定。
//
// 非线程安全：m_logical_position 和缓存都没有加锁，多个调用方要么自己串行化，
// 要么每人一个实例。所有调用都是同步阻塞的，超时由传输层负责。
class CRangeReader
{
public:
    explicit CRangeReader(const std::string& url);

    // 要在第一次读取之前设置。没有设置时首次使用会创建 CCurlHttpClient。
    void SetHttpClient(std::shared_ptr<IHttpClient> client);

    // 随时可以换，默认的 CCurlHttpClient 也会跟着换
    void SetLogger(IRangeLogger* logger);

    // 从 offset 开始读 size 字节，不移动逻辑位置
    RangeStatus ReadAt(uint8_t* buffer, size_t size, int64_t offset, size_t& bytes_read);

    // 从逻辑位置开始读，只有成功时才前进 bytes_read
    RangeStatus Read(uint8_t* buffer, size_t size, size_t& bytes_read);

    // whence: SEEK_SET / SEEK_CUR。SEEK_END 不支持，需要先 Size() 再算绝对位置。
    RangeStatus Seek(int64_t position, int whence, int64_t& new_position);

    // HEAD 请求拿 Content-Length
    RangeStatus Size(int64_t& total_size);

    int64_t GetPosition() const { return m_logical_position; }
    const std::string& GetUrl() const { return m_file_url; }
    const std::string& GetLastError() const { return m_last_error; }

    bool HasCache() const { return m_has_cache; }
    int64_t GetCacheStart() const { return m_cache_start; }
    size_t GetCacheLength() const { return m_cache.size(); }

    // -----------------------------------------------------------------------
    // 可配置参数区 (Configuration)
    // -----------------------------------------------------------------------
    // 每次 GET 最少拉取的字节数，小块随机读 (归档格式探测) 靠它摊薄往返开销
    size_t m_cfg_min_fetch_size = 1024 * 1024;

protected:
    void Init();
    RangeStatus NewRequest(const char* method, CHttpRequest& request);
    bool IsCacheHit(int64_t offset, size_t size) const;
    RangeStatus Fail(RangeStatus status, const std::string& detail);

private:
    std::string m_file_url;

    // 首次请求时由 libcurl URL API 解析
    bool m_url_parsed = false;
    std::string m_request_url;

    std::shared_ptr<IHttpClient> m_client;
    std::shared_ptr<CCurlHttpClient> m_default_client; // Init() 创建的默认传输层
    IRangeLogger* m_logger = nullptr;

    int64_t m_logical_position = 0;

    // 单槽缓存
    bool m_has_cache = false;
    int64_t m_cache_start = 0;
    std::vector<uint8_t> m_cache;

    std::string m_last_error;
};
