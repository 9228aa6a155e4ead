#pragma once

// ---------------------------------------------------------------------------
// IRangeLogger: 可选的诊断输出 (info / debug 两级)
// ---------------------------------------------------------------------------
// 日志纯粹是观察用的：有没有 logger 都不能改变读取行为。
// CLI 用 CStderrLogger，Kodi 插件用 CKodiRangeLogger (转发到 kodi::Log)。
enum RangeLogLevel
{
    RANGE_LOG_DEBUG = 0,
    RANGE_LOG_INFO
};

class IRangeLogger
{
public:
    virtual ~IRangeLogger() = default;

    virtual void Log(RangeLogLevel level, const char* message) = 0;
};

// printf 风格格式化后转发给 logger，logger 为空时直接返回 (不做格式化)
void RangeLog(IRangeLogger* logger, RangeLogLevel level, const char* format, ...);
