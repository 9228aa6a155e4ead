#include "RangeLogger.h"

#include <cstdarg>
#include <cstdio>
#include <vector>

void RangeLog(IRangeLogger* logger, RangeLogLevel level, const char* format, ...)
{
    if (!logger)
        return;

    char stack_buf[512];
    va_list args;
    va_start(args, format);
    int len = vsnprintf(stack_buf, sizeof(stack_buf), format, args);
    va_end(args);

    if (len < 0)
        return;

    if ((size_t)len < sizeof(stack_buf))
    {
        logger->Log(level, stack_buf);
        return;
    }

    // 长消息 (例如带完整 URL 的响应头)，第二遍按实际长度分配
    std::vector<char> heap_buf((size_t)len + 1);
    va_start(args, format);
    vsnprintf(heap_buf.data(), heap_buf.size(), format, args);
    va_end(args);
    logger->Log(level, heap_buf.data());
}
