#pragma once

#include "RangeLogger.h"

// ---------------------------------------------------------------------------
// CStderrLogger: CLI 用的日志，带时间戳写到 stderr
// ---------------------------------------------------------------------------
// 级别低于 m_level 的消息直接丢弃 (默认只输出 info)。
class CStderrLogger : public IRangeLogger
{
public:
    explicit CStderrLogger(RangeLogLevel level = RANGE_LOG_INFO) : m_level(level) {}

    void Log(RangeLogLevel level, const char* message) override;

    // 致命错误，总是输出
    void Fatal(const char* message);

private:
    void Write(const char* tag, const char* message);

    RangeLogLevel m_level;
};
