#include "client.h"

#include <cstdio>
#include <string>

// 导出标准 C 接口
ADDONCREATOR(CMyAddon)

// ---------------------------------------------------------------------------
// 实现
// ---------------------------------------------------------------------------

CClientVFS::CClientVFS(const kodi::addon::IInstanceInfo &instance)
    : kodi::addon::CInstanceVFS(instance)
{
    kodi::Log(ADDON_LOG_INFO, "Range Stream VFS: Loaded");
}

ADDON_STATUS CMyAddon::CreateInstance(const kodi::addon::IInstanceInfo &instance,
                                      KODI_ADDON_INSTANCE_HDL &hdl)
{
    if (instance.IsType(ADDON_INSTANCE_VFS))
    {
        kodi::Log(ADDON_LOG_INFO, "Creating Range Stream VFS Instance");
        hdl = new CClientVFS(instance);
        return ADDON_STATUS_OK;
    }
    return ADDON_STATUS_UNKNOWN;
}

// 辅助函数：手动获取配置 (绕过头文件问题)
static int MyGetSettingInt(const std::string& settingName, int defaultValue)
{
    using namespace kodi::addon;
    int settingValue = defaultValue;
    if (CPrivateBase::m_interface &&
        CPrivateBase::m_interface->toKodi &&
        CPrivateBase::m_interface->toKodi->kodi_addon)
    {
        CPrivateBase::m_interface->toKodi->kodi_addon->get_setting_int(
          CPrivateBase::m_interface->toKodi->kodiBase, settingName.c_str(), &settingValue);
    }
    return settingValue;
}

static bool MyGetSettingBool(const std::string& settingName, bool defaultValue)
{
    using namespace kodi::addon;
    bool settingValue = defaultValue;
    if (CPrivateBase::m_interface &&
        CPrivateBase::m_interface->toKodi &&
        CPrivateBase::m_interface->toKodi->kodi_addon)
    {
        CPrivateBase::m_interface->toKodi->kodi_addon->get_setting_bool(
          CPrivateBase::m_interface->toKodi->kodiBase, settingName.c_str(), &settingValue);
    }
    return settingValue;
}

// Kodi 会在 URL 后面用 '|' 附加选项，libcurl 不认识
static std::string StripKodiOptions(const std::string& url)
{
    size_t pipe_pos = url.find('|');
    if (pipe_pos != std::string::npos)
        return url.substr(0, pipe_pos);
    return url;
}

CRangeFile* CClientVFS::CreateFile(const kodi::addon::VFSUrl &url)
{
    CRangeFile *file = new CRangeFile();

    file->client = std::make_shared<CCurlHttpClient>();
    file->client->SetLogger(&file->logger);
    file->client->m_username = url.GetUsername();
    file->client->m_password = url.GetPassword();

    // 读取设置
    int connect_timeout = MyGetSettingInt("connect_timeout", 10);
    if (connect_timeout > 0)
        file->client->m_net_connect_timeout_sec = connect_timeout;
    file->client->m_net_read_timeout_sec = MyGetSettingInt("read_timeout", 0);
    file->client->m_net_verify_tls = MyGetSettingBool("verify_tls", true);

    file->reader.reset(new CRangeReader(StripKodiOptions(url.GetURL())));
    file->reader->SetHttpClient(file->client);
    file->reader->SetLogger(&file->logger);

    int min_fetch_kb = MyGetSettingInt("min_fetch_size", 1024);
    if (min_fetch_kb > 0)
        file->reader->m_cfg_min_fetch_size = (size_t)min_fetch_kb * 1024;

    kodi::Log(ADDON_LOG_DEBUG, "RangeVFS: Config -> MinFetch = %zu KB, Connect = %ld s, Read = %ld s, VerifyTLS = %d",
        file->reader->m_cfg_min_fetch_size >> 10, file->client->m_net_connect_timeout_sec,
        file->client->m_net_read_timeout_sec, file->client->m_net_verify_tls);

    return file;
}

kodi::addon::VFSFileHandle CClientVFS::Open(const kodi::addon::VFSUrl &url)
{
    std::string safeUrl = url.GetRedacted();
    kodi::Log(ADDON_LOG_DEBUG, "RangeVFS: Open %s", safeUrl.c_str());

    CRangeFile *file = CreateFile(url);

    // 长度未知也允许打开，只是不能相对文件尾 Seek
    int64_t total = 0;
    RangeStatus status = file->reader->Size(total);
    if (status == RANGE_OK)
    {
        file->total_size = total;
    }
    else if (status == RANGE_ERR_NO_CONTENT_LENGTH)
    {
        kodi::Log(ADDON_LOG_WARNING, "RangeVFS: No Content-Length for %s", safeUrl.c_str());
    }
    else
    {
        kodi::Log(ADDON_LOG_ERROR, "RangeVFS: Open failed (%s): %s", RangeStatusToString(status),
            file->reader->GetLastError().c_str());
        delete file;
        return nullptr;
    }

    kodi::Log(ADDON_LOG_INFO, "RangeVFS: Open success, size: %lld. URL: %s", (long long)file->total_size, safeUrl.c_str());
    return (kodi::addon::VFSFileHandle)file;
}

ssize_t CClientVFS::Read(kodi::addon::VFSFileHandle context, uint8_t *buffer, size_t uiBufSize)
{
    CRangeFile *file = (CRangeFile *)context;
    if (!file)
        return -1;

    size_t n = 0;
    RangeStatus status = file->reader->Read(buffer, uiBufSize, n);
    if (status == RANGE_OK)
        return (ssize_t)n;

    if (status == RANGE_EOF)
    {
        // 传输提前结束时已经拷贝了 n 字节，但 reader 没有前进，这里补上
        if (n > 0)
        {
            int64_t pos = 0;
            if (file->reader->Seek((int64_t)n, SEEK_CUR, pos) != RANGE_OK)
                return -1;
        }
        return (ssize_t)n;
    }

    kodi::Log(ADDON_LOG_ERROR, "RangeVFS: Read failed (%s): %s", RangeStatusToString(status),
        file->reader->GetLastError().c_str());
    return -1;
}

int64_t CClientVFS::Seek(kodi::addon::VFSFileHandle context, int64_t position, int whence)
{
    CRangeFile *file = (CRangeFile *)context;
    if (!file)
        return -1;

    // reader 不做相对文件尾的 Seek，用 Open 时拿到的长度换算成绝对位置
    if (whence == SEEK_END)
    {
        if (file->total_size < 0)
            return -1;
        position = file->total_size + position;
        whence = SEEK_SET;
    }

    if (whence == SEEK_SET && position < 0)
        return -1;

    int64_t new_position = 0;
    RangeStatus status = file->reader->Seek(position, whence, new_position);
    if (status != RANGE_OK)
    {
        kodi::Log(ADDON_LOG_DEBUG, "RangeVFS: Seek rejected (%s): %s", RangeStatusToString(status),
            file->reader->GetLastError().c_str());
        return -1;
    }
    return new_position;
}

int64_t CClientVFS::GetPosition(kodi::addon::VFSFileHandle context)
{
    CRangeFile *file = (CRangeFile *)context;
    return file ? file->reader->GetPosition() : 0;
}

int64_t CClientVFS::GetLength(kodi::addon::VFSFileHandle context)
{
    CRangeFile *file = (CRangeFile *)context;
    return file ? file->total_size : 0;
}

int CClientVFS::GetChunkSize(kodi::addon::VFSFileHandle context)
{
    CRangeFile *file = (CRangeFile *)context;
    if (!file)
        return 0;
    return (int)file->reader->m_cfg_min_fetch_size;
}

bool CClientVFS::Close(kodi::addon::VFSFileHandle context)
{
    CRangeFile *file = (CRangeFile *)context;
    if (file)
    {
        kodi::Log(ADDON_LOG_DEBUG, "RangeVFS: Close, position=%lld", (long long)file->reader->GetPosition());
        delete file; // 必须在这里释放内存
        return true;
    }
    return false;
}

int CClientVFS::Stat(const kodi::addon::VFSUrl &url, kodi::vfs::FileStatus &buffer)
{
    std::unique_ptr<CRangeFile> file(CreateFile(url));

    int64_t total = 0;
    RangeStatus status = file->reader->Size(total);
    if (status != RANGE_OK)
    {
        kodi::Log(ADDON_LOG_DEBUG, "RangeVFS: Stat failed (%s): %s", RangeStatusToString(status),
            file->reader->GetLastError().c_str());
        return -1;
    }

    buffer.SetSize(total);
    buffer.SetIsDirectory(false);
    return 0;
}

bool CClientVFS::Exists(const kodi::addon::VFSUrl &url)
{
    kodi::vfs::FileStatus status;
    return Stat(url, status) == 0;
}
