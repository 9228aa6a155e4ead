#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "RangeLogger.h"
#include "RangeReader.h"
#include "RangeStatus.h"

// ---------------------------------------------------------------------------
// CArchiveLister: 在 CRangeReader 上列出远程 tar / zip 的条目名
// ---------------------------------------------------------------------------
// tar 只走 Read/Seek (顺序读头，相对 Seek 跳过数据)，边发现边回调；
// zip 先 Size() 再用 ReadAt 读尾部目录，索引全部读完后才回调。
// 整个归档从不完整下载到本地。
class CArchiveLister
{
public:
    typedef std::function<void(const std::string& name)> EntryCallback;

    CArchiveLister(CRangeReader& reader, IRangeLogger* logger = nullptr);

    // 按 URL 后缀选择 tar 或 zip，其他后缀返回 RANGE_ERR_UNSUPPORTED_FORMAT
    RangeStatus List(const EntryCallback& on_entry);

    RangeStatus ListTar(const EntryCallback& on_entry);
    RangeStatus ListZip(const EntryCallback& on_entry);

    const std::string& GetLastError() const { return m_last_error; }

    // URL 路径最后一段的扩展名 (小写，不含点)，没有时返回空串
    static std::string GetFileExtensionFromUrl(const std::string& url);

protected:
    RangeStatus ReadFull(uint8_t* buffer, size_t size, size_t& got);
    RangeStatus ReadFullAt(uint8_t* buffer, size_t size, int64_t offset, size_t& got);
    RangeStatus SkipForward(int64_t length);

    RangeStatus Fail(RangeStatus status, const std::string& detail);
    RangeStatus FromReader(RangeStatus status);

private:
    CRangeReader& m_reader;
    IRangeLogger* m_logger = nullptr;
    std::string m_last_error;
};
