#include "ArchiveLister.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <vector>
#include <curl/curl.h>

// -----------------------------------------------------------------------------------------
// tar 格式常量 (ustar / GNU / PAX)
// -----------------------------------------------------------------------------------------
static const size_t TAR_BLOCK_SIZE = 512;
static const int64_t TAR_MAX_META_SIZE = 1024 * 1024; // 长文件名 / PAX 头的上限

static const size_t TAR_NAME_OFFSET = 0;
static const size_t TAR_NAME_LEN = 100;
static const size_t TAR_SIZE_OFFSET = 124;
static const size_t TAR_SIZE_LEN = 12;
static const size_t TAR_CHKSUM_OFFSET = 148;
static const size_t TAR_CHKSUM_LEN = 8;
static const size_t TAR_TYPEFLAG_OFFSET = 156;
static const size_t TAR_MAGIC_OFFSET = 257;
static const size_t TAR_PREFIX_OFFSET = 345;
static const size_t TAR_PREFIX_LEN = 155;

// -----------------------------------------------------------------------------------------
// zip 格式常量
// -----------------------------------------------------------------------------------------
static const uint32_t ZIP_EOCD_SIG = 0x06054b50;
static const uint32_t ZIP_EOCD64_LOCATOR_SIG = 0x07064b50;
static const uint32_t ZIP_EOCD64_SIG = 0x06064b50;
static const uint32_t ZIP_CENTRAL_SIG = 0x02014b50;

static const size_t ZIP_EOCD_LEN = 22;
static const size_t ZIP_EOCD64_LOCATOR_LEN = 20;
static const size_t ZIP_EOCD64_LEN = 56;
static const size_t ZIP_CENTRAL_LEN = 46;
static const size_t ZIP_MAX_COMMENT = 65535;
static const uint64_t ZIP_MAX_DIRECTORY_SIZE = 256 * 1024 * 1024; // 中央目录一次读进内存的上限

static uint16_t ReadLE16(const uint8_t* p)
{
    return (uint16_t)(p[0] | (p[1] << 8));
}

static uint32_t ReadLE32(const uint8_t* p)
{
    return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}

static uint64_t ReadLE64(const uint8_t* p)
{
    return (uint64_t)ReadLE32(p) | ((uint64_t)ReadLE32(p + 4) << 32);
}

static bool IsZeroBlock(const uint8_t* block)
{
    for (size_t i = 0; i < TAR_BLOCK_SIZE; i++)
    {
        if (block[i] != 0)
            return false;
    }
    return true;
}

// 取定长字段里 NUL 之前的部分
static std::string ExtractString(const uint8_t* field, size_t len)
{
    size_t n = 0;
    while (n < len && field[n] != 0)
        n++;
    return std::string((const char*)field, n);
}

// 数值字段：普通八进制，或 GNU 的 base-256 (首字节最高位为 1)
static bool ParseNumeric(const uint8_t* field, size_t len, int64_t& value)
{
    value = 0;
    if (len == 0)
        return true;

    if (field[0] & 0x80)
    {
        // 负数在这里没有意义
        if (field[0] & 0x40)
            return false;
        uint64_t result = field[0] & 0x3f;
        for (size_t i = 1; i < len; i++)
        {
            if (result > (UINT64_MAX >> 8))
                return false;
            result = (result << 8) | field[i];
        }
        if (result > (uint64_t)INT64_MAX)
            return false;
        value = (int64_t)result;
        return true;
    }

    size_t i = 0;
    while (i < len && (field[i] == ' ' || field[i] == 0))
        i++;

    uint64_t result = 0;
    for (; i < len; i++)
    {
        uint8_t c = field[i];
        if (c == ' ' || c == 0)
            break;
        if (c < '0' || c > '7')
            return false;
        if (result > ((uint64_t)INT64_MAX >> 3))
            return false;
        result = (result << 3) | (uint64_t)(c - '0');
    }
    value = (int64_t)result;
    return true;
}

// 校验和字段按 8 个空格计算；老的实现用有符号字节求和，两种都接受
static bool VerifyChecksum(const uint8_t* block)
{
    int64_t stored = 0;
    if (!ParseNumeric(block + TAR_CHKSUM_OFFSET, TAR_CHKSUM_LEN, stored))
        return false;

    int64_t unsigned_sum = 0;
    int64_t signed_sum = 0;
    for (size_t i = 0; i < TAR_BLOCK_SIZE; i++)
    {
        uint8_t c = block[i];
        if (i >= TAR_CHKSUM_OFFSET && i < TAR_CHKSUM_OFFSET + TAR_CHKSUM_LEN)
            c = ' ';
        unsigned_sum += c;
        signed_sum += (int8_t)c;
    }
    return stored == unsigned_sum || stored == signed_sum;
}

// PAX 扩展头: 每条记录 "<len> <key>=<value>\n"，len 包含整条记录
static bool ParsePaxPath(const std::string& data, std::string& path, bool& found)
{
    found = false;
    size_t pos = 0;
    while (pos < data.size())
    {
        size_t space = data.find(' ', pos);
        if (space == std::string::npos)
            return false;

        int64_t record_len = 0;
        for (size_t i = pos; i < space; i++)
        {
            if (!isdigit((unsigned char)data[i]))
                return false;
            record_len = record_len * 10 + (data[i] - '0');
            if (record_len > (int64_t)data.size())
                return false;
        }
        if (record_len <= 0 || pos + (size_t)record_len > data.size() || data[pos + record_len - 1] != '\n')
            return false;

        std::string record = data.substr(space + 1, pos + record_len - 1 - (space + 1));
        size_t eq = record.find('=');
        if (eq == std::string::npos)
            return false;
        if (record.compare(0, eq, "path") == 0 && eq == 4)
        {
            path = record.substr(eq + 1);
            found = true;
        }
        pos += (size_t)record_len;
    }
    return true;
}

// 只有头，没有数据区的类型 (硬链接/软链接/设备/目录/FIFO)
static bool IsHeaderOnlyType(uint8_t typeflag)
{
    return typeflag == '1' || typeflag == '2' || typeflag == '3' || typeflag == '4' ||
           typeflag == '5' || typeflag == '6';
}

// -----------------------------------------------------------------------------------------

CArchiveLister::CArchiveLister(CRangeReader& reader, IRangeLogger* logger)
    : m_reader(reader), m_logger(logger)
{
}

RangeStatus CArchiveLister::Fail(RangeStatus status, const std::string& detail)
{
    m_last_error = detail;
    return status;
}

// reader 的错误原样向上传
RangeStatus CArchiveLister::FromReader(RangeStatus status)
{
    m_last_error = m_reader.GetLastError();
    return status;
}

// 使用 libcurl URL API 取路径部分 (自动去掉 ?query 和 #fragment)
std::string CArchiveLister::GetFileExtensionFromUrl(const std::string& url)
{
    std::string extension;
    CURLU* h = curl_url();
    if (!h)
        return extension;

    if (!curl_url_set(h, CURLUPART_URL, url.c_str(), 0))
    {
        char* path = NULL;
        if (!curl_url_get(h, CURLUPART_PATH, &path, 0) && path)
        {
            std::string path_str(path);
            size_t last_slash = path_str.rfind('/');
            std::string filename = (last_slash == std::string::npos) ? path_str : path_str.substr(last_slash + 1);

            size_t dot_pos = filename.rfind('.');
            if (dot_pos != std::string::npos && dot_pos + 1 < filename.length())
            {
                extension = filename.substr(dot_pos + 1);
                std::transform(extension.begin(), extension.end(), extension.begin(), ::tolower);
            }
            curl_free(path);
        }
    }
    curl_url_cleanup(h);
    return extension;
}

RangeStatus CArchiveLister::List(const EntryCallback& on_entry)
{
    std::string ext = GetFileExtensionFromUrl(m_reader.GetUrl());
    RangeLog(m_logger, RANGE_LOG_DEBUG, "RangeVFS: archive type by extension: '%s'", ext.c_str());

    if (ext == "tar")
        return ListTar(on_entry);
    if (ext == "zip")
        return ListZip(on_entry);

    return Fail(RANGE_ERR_UNSUPPORTED_FORMAT, "Unknown file type. URL does not end in .tar or .zip");
}

// 顺序读满 size 字节；遇到数据结束就停下，got 为实际读到的字节数
RangeStatus CArchiveLister::ReadFull(uint8_t* buffer, size_t size, size_t& got)
{
    got = 0;
    while (got < size)
    {
        size_t n = 0;
        RangeStatus status = m_reader.Read(buffer + got, size - got, n);
        if (status == RANGE_EOF)
        {
            // 截断的传输也可能带回一部分数据
            got += n;
            return RANGE_EOF;
        }
        if (status != RANGE_OK)
            return FromReader(status);
        if (n == 0)
            break;
        got += n;
    }
    return RANGE_OK;
}

RangeStatus CArchiveLister::ReadFullAt(uint8_t* buffer, size_t size, int64_t offset, size_t& got)
{
    got = 0;
    while (got < size)
    {
        size_t n = 0;
        RangeStatus status = m_reader.ReadAt(buffer + got, size - got, offset + (int64_t)got, n);
        got += n;
        if (status == RANGE_EOF)
            return RANGE_EOF;
        if (status != RANGE_OK)
            return FromReader(status);
        if (n == 0)
            break;
    }
    return RANGE_OK;
}

RangeStatus CArchiveLister::SkipForward(int64_t length)
{
    if (length <= 0)
        return RANGE_OK;

    int64_t new_position = 0;
    RangeStatus status = m_reader.Seek(length, SEEK_CUR, new_position);
    if (status != RANGE_OK)
        return FromReader(status);
    return RANGE_OK;
}

// -----------------------------------------------------------------------------------------
// tar: 逐个读 512 字节头，数据区用相对 Seek 跳过
// -----------------------------------------------------------------------------------------
RangeStatus CArchiveLister::ListTar(const EntryCallback& on_entry)
{
    std::string long_name;
    std::string pax_path;
    bool has_long_name = false;
    bool has_pax_path = false;
    size_t entries = 0;

    for (;;)
    {
        int64_t header_pos = m_reader.GetPosition();
        uint8_t block[TAR_BLOCK_SIZE];
        size_t got = 0;
        RangeStatus status = ReadFull(block, TAR_BLOCK_SIZE, got);
        if (status != RANGE_OK && status != RANGE_EOF)
            return status;

        // 在头部边界上干净地结束 (没有结束块的 tar 也接受)
        if (got == 0)
            break;
        if (got < TAR_BLOCK_SIZE)
            return Fail(RANGE_ERR_FORMAT, "tar: unexpected end of archive in header at offset " + std::to_string(header_pos));

        if (IsZeroBlock(block))
            break;

        if (!VerifyChecksum(block))
            return Fail(RANGE_ERR_FORMAT, "tar: invalid header checksum at offset " + std::to_string(header_pos));

        int64_t size = 0;
        if (!ParseNumeric(block + TAR_SIZE_OFFSET, TAR_SIZE_LEN, size))
            return Fail(RANGE_ERR_FORMAT, "tar: invalid size field at offset " + std::to_string(header_pos));

        // 数据区结束位置 (按块对齐) 必须还能用 int64_t 表示
        int64_t data_pos = m_reader.GetPosition();
        if (size > INT64_MAX - (int64_t)TAR_BLOCK_SIZE - data_pos)
            return Fail(RANGE_ERR_FORMAT, "tar: entry size " + std::to_string(size) + " out of range at offset " +
                                              std::to_string(header_pos));

        uint8_t typeflag = block[TAR_TYPEFLAG_OFFSET];
        int64_t padded = (size + (int64_t)TAR_BLOCK_SIZE - 1) / (int64_t)TAR_BLOCK_SIZE * (int64_t)TAR_BLOCK_SIZE;

        // 元数据条目：GNU 长文件名 'L'，PAX 扩展头 'x'，PAX 全局头 'g'
        if (typeflag == 'L' || typeflag == 'x' || typeflag == 'g')
        {
            if (size > TAR_MAX_META_SIZE)
                return Fail(RANGE_ERR_FORMAT, "tar: metadata entry too large at offset " + std::to_string(header_pos));

            std::vector<uint8_t> data((size_t)size);
            status = ReadFull(data.data(), data.size(), got);
            if (status != RANGE_OK && status != RANGE_EOF)
                return status;
            if (got < data.size())
                return Fail(RANGE_ERR_FORMAT, "tar: unexpected end of archive in metadata entry");

            if (typeflag == 'L')
            {
                long_name = ExtractString(data.data(), data.size());
                has_long_name = true;
            }
            else if (typeflag == 'x')
            {
                bool found = false;
                std::string path;
                if (!ParsePaxPath(std::string(data.begin(), data.end()), path, found))
                    return Fail(RANGE_ERR_FORMAT, "tar: invalid PAX header at offset " + std::to_string(header_pos));
                if (found)
                {
                    pax_path = path;
                    has_pax_path = true;
                }
            }

            status = SkipForward(padded - size);
            if (status != RANGE_OK)
                return status;
            continue;
        }

        std::string name;
        if (has_pax_path)
            name = pax_path;
        else if (has_long_name)
            name = long_name;
        else
        {
            name = ExtractString(block + TAR_NAME_OFFSET, TAR_NAME_LEN);
            if (memcmp(block + TAR_MAGIC_OFFSET, "ustar", 5) == 0)
            {
                std::string prefix = ExtractString(block + TAR_PREFIX_OFFSET, TAR_PREFIX_LEN);
                if (!prefix.empty())
                    name = prefix + "/" + name;
            }
        }
        has_long_name = false;
        has_pax_path = false;

        RangeLog(m_logger, RANGE_LOG_DEBUG, "RangeVFS: tar entry '%s' type '%c' size %lld at %lld", name.c_str(),
                 typeflag ? (char)typeflag : '0', (long long)size, (long long)header_pos);
        on_entry(name);
        entries++;

        if (!IsHeaderOnlyType(typeflag))
        {
            status = SkipForward(padded);
            if (status != RANGE_OK)
                return status;
        }
    }

    RangeLog(m_logger, RANGE_LOG_DEBUG, "RangeVFS: tar listing done, %zu entries", entries);
    return RANGE_OK;
}

// -----------------------------------------------------------------------------------------
// zip: 先拿总大小，从尾部找 end of central directory，再一次性读中央目录
// -----------------------------------------------------------------------------------------
RangeStatus CArchiveLister::ListZip(const EntryCallback& on_entry)
{
    int64_t total_size = 0;
    RangeStatus status = m_reader.Size(total_size);
    if (status != RANGE_OK)
        return FromReader(status);

    if (total_size < (int64_t)ZIP_EOCD_LEN)
        return Fail(RANGE_ERR_FORMAT, "zip: not a valid zip file");

    size_t tail_len = (size_t)std::min<int64_t>(total_size, (int64_t)(ZIP_EOCD_LEN + ZIP_MAX_COMMENT));
    int64_t tail_start = total_size - (int64_t)tail_len;
    std::vector<uint8_t> tail(tail_len);

    size_t got = 0;
    status = ReadFullAt(tail.data(), tail_len, tail_start, got);
    if (status != RANGE_OK && status != RANGE_EOF)
        return status;
    if (got < tail_len)
        return Fail(RANGE_ERR_FORMAT, "zip: unexpected end of file while reading directory end");

    // 从后往前找签名，注释长度必须刚好落在文件内
    int64_t eocd_index = -1;
    for (int64_t i = (int64_t)(tail_len - ZIP_EOCD_LEN); i >= 0; i--)
    {
        const uint8_t* p = tail.data() + i;
        if (ReadLE32(p) == ZIP_EOCD_SIG && (size_t)i + ZIP_EOCD_LEN + ReadLE16(p + 20) <= tail_len)
        {
            eocd_index = i;
            break;
        }
    }
    if (eocd_index < 0)
        return Fail(RANGE_ERR_FORMAT, "zip: not a valid zip file");

    const uint8_t* eocd = tail.data() + eocd_index;
    int64_t eocd_pos = tail_start + eocd_index;
    uint64_t record_count = ReadLE16(eocd + 10);
    uint64_t directory_size = ReadLE32(eocd + 12);
    uint64_t directory_offset = ReadLE32(eocd + 16);

    // zip64: 任何一个字段饱和就去找 zip64 定位块
    if (record_count == 0xffff || directory_size == 0xffffffff || directory_offset == 0xffffffff)
    {
        int64_t locator_pos = eocd_pos - (int64_t)ZIP_EOCD64_LOCATOR_LEN;
        if (locator_pos >= 0)
        {
            uint8_t locator[ZIP_EOCD64_LOCATOR_LEN];
            status = ReadFullAt(locator, sizeof(locator), locator_pos, got);
            if (status != RANGE_OK && status != RANGE_EOF)
                return status;
            if (got == sizeof(locator) && ReadLE32(locator) == ZIP_EOCD64_LOCATOR_SIG)
            {
                uint64_t record_pos = ReadLE64(locator + 8);
                if (total_size < (int64_t)ZIP_EOCD64_LEN || record_pos > (uint64_t)(total_size - (int64_t)ZIP_EOCD64_LEN))
                    return Fail(RANGE_ERR_FORMAT, "zip: invalid zip64 end of central directory offset");

                uint8_t record[ZIP_EOCD64_LEN];
                status = ReadFullAt(record, sizeof(record), (int64_t)record_pos, got);
                if (status != RANGE_OK && status != RANGE_EOF)
                    return status;
                if (got < sizeof(record) || ReadLE32(record) != ZIP_EOCD64_SIG)
                    return Fail(RANGE_ERR_FORMAT, "zip: invalid zip64 end of central directory record");

                record_count = ReadLE64(record + 32);
                directory_size = ReadLE64(record + 40);
                directory_offset = ReadLE64(record + 48);
            }
        }
    }

    if (directory_offset > (uint64_t)total_size || directory_size > (uint64_t)total_size - directory_offset)
        return Fail(RANGE_ERR_FORMAT, "zip: central directory lies outside the file");
    if (directory_size > ZIP_MAX_DIRECTORY_SIZE)
        return Fail(RANGE_ERR_FORMAT, "zip: central directory too large (" + std::to_string(directory_size) + " bytes)");

    RangeLog(m_logger, RANGE_LOG_DEBUG, "RangeVFS: zip central directory: %llu entries at %llu (%llu bytes)",
             (unsigned long long)record_count, (unsigned long long)directory_offset,
             (unsigned long long)directory_size);

    std::vector<uint8_t> directory((size_t)directory_size);
    status = ReadFullAt(directory.data(), directory.size(), (int64_t)directory_offset, got);
    if (status != RANGE_OK && status != RANGE_EOF)
        return status;
    if (got < directory.size())
        return Fail(RANGE_ERR_FORMAT, "zip: unexpected end of file in central directory");

    std::vector<std::string> names;
    size_t pos = 0;
    while (pos + ZIP_CENTRAL_LEN <= directory.size())
    {
        const uint8_t* p = directory.data() + pos;
        if (ReadLE32(p) != ZIP_CENTRAL_SIG)
            break;

        size_t name_len = ReadLE16(p + 28);
        size_t extra_len = ReadLE16(p + 30);
        size_t comment_len = ReadLE16(p + 32);
        size_t entry_len = ZIP_CENTRAL_LEN + name_len + extra_len + comment_len;
        if (pos + entry_len > directory.size())
            return Fail(RANGE_ERR_FORMAT, "zip: truncated central directory entry");

        names.push_back(std::string((const char*)p + ZIP_CENTRAL_LEN, name_len));
        pos += entry_len;
    }

    // 16 位计数在条目超过 65535 时会回绕，只比较低 16 位
    if ((uint16_t)names.size() != (uint16_t)record_count)
        return Fail(RANGE_ERR_FORMAT, "zip: central directory entry count mismatch");

    for (const auto& name : names)
        on_entry(name);

    return RANGE_OK;
}
