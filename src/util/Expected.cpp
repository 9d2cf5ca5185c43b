#include "util/Expected.hpp"

namespace gitlanes {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::InvalidArgs: return "invalid-args";
        case ErrorCode::IoError: return "io-error";
        case ErrorCode::MalformedRecord: return "malformed-record";
        case ErrorCode::InvalidCommit: return "invalid-commit";
        case ErrorCode::DuplicateCommit: return "duplicate-commit";
        case ErrorCode::OrderViolation: return "order-violation";
        case ErrorCode::InternalError: return "internal-error";
    }
    return "unknown";
}

}
