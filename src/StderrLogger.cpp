#include "StderrLogger.h"

#include <cstdio>
#include <ctime>

void CStderrLogger::Write(const char* tag, const char* message)
{
    char stamp[32];
    time_t now = time(NULL);
    struct tm local_tm;
    localtime_r(&now, &local_tm);
    strftime(stamp, sizeof(stamp), "%Y/%m/%d %H:%M:%S", &local_tm);

    fprintf(stderr, "%s [%s] %s\n", stamp, tag, message);
}

void CStderrLogger::Log(RangeLogLevel level, const char* message)
{
    if (level < m_level)
        return;
    Write(level == RANGE_LOG_DEBUG ? "DEBUG" : "INFO", message);
}

void CStderrLogger::Fatal(const char* message)
{
    Write("FATAL", message);
}
