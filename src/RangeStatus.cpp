#include "RangeStatus.h"

const char* RangeStatusToString(RangeStatus status)
{
    switch (status)
    {
        case RANGE_OK:
            return "ok";
        case RANGE_EOF:
            return "end of data";
        case RANGE_ERR_INVALID_ARGUMENT:
            return "invalid argument";
        case RANGE_ERR_NOT_IMPLEMENTED:
            return "not implemented";
        case RANGE_ERR_TRANSPORT:
            return "transport error";
        case RANGE_ERR_NO_CONTENT_LENGTH:
            return "no content length";
        case RANGE_ERR_BAD_URL:
            return "bad url";
        case RANGE_ERR_FORMAT:
            return "malformed archive";
        case RANGE_ERR_UNSUPPORTED_FORMAT:
            return "unsupported archive type";
    }
    return "unknown status";
}
