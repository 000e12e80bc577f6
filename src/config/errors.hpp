#pragma once
#include <string>

namespace asdf::config {

enum class ErrorKind {
    NONE,
    HOME_DIRECTORY_UNAVAILABLE,  // no $HOME and no passwd entry
    FILE_NOT_FOUND,              // rc file missing (or no path given)
    FILE_OPEN_ERROR              // rc file exists but could not be read
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:                       return "NONE";
        case ErrorKind::HOME_DIRECTORY_UNAVAILABLE: return "HOME_DIRECTORY_UNAVAILABLE";
        case ErrorKind::FILE_NOT_FOUND:             return "FILE_NOT_FOUND";
        case ErrorKind::FILE_OPEN_ERROR:            return "FILE_OPEN_ERROR";
        default: return "UNKNOWN";
    }
}

// Outcome of a Config accessor: the value is always usable, defaulted on failure.
template <typename T>
struct ValueResult {
    bool success = false;
    T value{};
    ErrorKind kind = ErrorKind::NONE;
    std::string error;
};

} // namespace asdf::config
