#pragma once

#include <memory>
#include <kodi/addon-instance/VFS.h>

#include "CurlHttpClient.h"
#include "KodiRangeLogger.h"
#include "RangeReader.h"

// ---------------------------------------------------------------------------
// CRangeFile: 一个打开的文件 (VFSFileHandle 指向它)
// ---------------------------------------------------------------------------
struct CRangeFile
{
    CKodiRangeLogger logger;
    std::shared_ptr<CCurlHttpClient> client;
    std::unique_ptr<CRangeReader> reader;
    int64_t total_size = -1; // Open 时 HEAD 得到，-1 表示未知
};

// ---------------------------------------------------------------------------
// CClientVFS: 插件主入口
// ---------------------------------------------------------------------------
// 实现 Kodi 的 VFS 接口，把请求转发给 CRangeReader
// ---------------------------------------------------------------------------
class CClientVFS : public kodi::addon::CInstanceVFS
{
public:
    CClientVFS(const kodi::addon::IInstanceInfo& instance);
    ~CClientVFS() override = default;

    // --- 核心 IO 接口 ---
    kodi::addon::VFSFileHandle Open(const kodi::addon::VFSUrl& url) override;

    ssize_t Read(kodi::addon::VFSFileHandle context, uint8_t* buffer, size_t uiBufSize) override;

    int64_t Seek(kodi::addon::VFSFileHandle context, int64_t position, int whence) override;

    int64_t GetPosition(kodi::addon::VFSFileHandle context) override;

    int64_t GetLength(kodi::addon::VFSFileHandle context) override;

    bool Close(kodi::addon::VFSFileHandle context) override;

    // --- 属性接口 ---
    int Stat(const kodi::addon::VFSUrl& url, kodi::vfs::FileStatus& buffer) override;

    bool Exists(const kodi::addon::VFSUrl& url) override;

    bool IoControlGetSeekPossible(kodi::addon::VFSFileHandle context) override { return true; }

    // 和每次 GET 的最小拉取量对齐
    int GetChunkSize(kodi::addon::VFSFileHandle context) override;

private:
    CRangeFile* CreateFile(const kodi::addon::VFSUrl& url);
};

// ---------------------------------------------------------------------------
// 工厂类
// ---------------------------------------------------------------------------
class CMyAddon : public kodi::addon::CAddonBase
{
public:
    CMyAddon() = default;
    ADDON_STATUS CreateInstance(const kodi::addon::IInstanceInfo& instance,
                                KODI_ADDON_INSTANCE_HDL& hdl) override;
};
