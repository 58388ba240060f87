#include "pageflow/errors.h"

namespace pageflow {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::NoExtractableContent: return "NoExtractableContent";
        case ErrorCode::InvalidDensity:       return "InvalidDensity";
        case ErrorCode::InvalidChunkSize:     return "InvalidChunkSize";
        case ErrorCode::MalformedMarkup:      return "MalformedMarkup";
    }
    return "Unknown";
}

} // namespace pageflow
