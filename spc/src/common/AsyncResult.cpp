#include "common/AsyncResult.h"

namespace SPC {

const char *errorKindToString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::SESSION_NOT_INITIALIZED:
        return "SESSION_NOT_INITIALIZED";
    case ErrorKind::SUBMISSION_REJECTED:
        return "SUBMISSION_REJECTED";
    case ErrorKind::PROCESSING_FAILED:
        return "PROCESSING_FAILED";
    case ErrorKind::NOT_IMPLEMENTED:
        return "NOT_IMPLEMENTED";
    case ErrorKind::UPSTREAM_FAILED:
        return "UPSTREAM_FAILED";
    }
    return "UNKNOWN";
}

}  // namespace SPC
