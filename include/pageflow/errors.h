#pragma once

#include <stdexcept>
#include <string>

namespace pageflow {

/// Error categories raised by the pageflow core
enum class ErrorCode {
    NoExtractableContent,   // Every chapter's normalized text was empty
    InvalidDensity,         // Unrecognized density key
    InvalidChunkSize,       // maxChunkSize <= 0
    MalformedMarkup,        // Markup tree could not be built or walked
};

/// Returns a stable name for an error code ("NoExtractableContent", ...)
const char* errorCodeName(ErrorCode code);

class PageflowError : public std::runtime_error {
public:
    PageflowError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace pageflow
