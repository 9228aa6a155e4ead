#pragma once

#include <kodi/AddonBase.h>

#include "RangeLogger.h"

// 把 reader / 传输层的诊断转发到 Kodi 的日志
class CKodiRangeLogger : public IRangeLogger
{
public:
    void Log(RangeLogLevel level, const char* message) override
    {
        kodi::Log(level == RANGE_LOG_DEBUG ? ADDON_LOG_DEBUG : ADDON_LOG_INFO, "%s", message);
    }
};
