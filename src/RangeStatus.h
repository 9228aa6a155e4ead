#pragma once

// ---------------------------------------------------------------------------
// RangeStatus: 所有读/定位/大小查询统一返回的状态码
// ---------------------------------------------------------------------------
// RANGE_EOF 是"这里没有更多数据"的信号，不是硬错误。
// 其余 RANGE_ERR_* 都是失败，具体原因通过 GetLastError() 获取。
enum RangeStatus
{
    RANGE_OK = 0,
    RANGE_EOF,
    RANGE_ERR_INVALID_ARGUMENT,
    RANGE_ERR_NOT_IMPLEMENTED,
    RANGE_ERR_TRANSPORT,
    RANGE_ERR_NO_CONTENT_LENGTH,
    RANGE_ERR_BAD_URL,
    RANGE_ERR_FORMAT,
    RANGE_ERR_UNSUPPORTED_FORMAT
};

const char* RangeStatusToString(RangeStatus status);
