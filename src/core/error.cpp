#include "arbor/error.h"

#include <cerrno>
#include <format>
#include <utility>

namespace arbor {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::NotFound:
            return "NotFound";
        case ErrorKind::AccessDenied:
            return "AccessDenied";
        case ErrorKind::IOError:
            return "IOError";
        case ErrorKind::InvalidPath:
            return "InvalidPath";
        case ErrorKind::PartialFailure:
            return "PartialFailure";
    }
    return "IOError";
}

ErrorKind classify(std::error_code code) noexcept {
    if (code.category() != std::generic_category() && code.category() != std::system_category()) {
        return ErrorKind::IOError;
    }
    switch (code.value()) {
        case ENOENT:
        case ENOTDIR:
            return ErrorKind::NotFound;
        case EACCES:
        case EPERM:
            return ErrorKind::AccessDenied;
        default:
            return ErrorKind::IOError;
    }
}

Error::Error(ErrorKind kind, std::filesystem::path path, const std::string& message, std::error_code code)
    : std::runtime_error{message},
      kind_{kind},
      cause_{kind},
      path_{std::move(path)},
      code_{code} {}

Error Error::from_errno(int error_number, std::string_view operation, const std::filesystem::path& path) {
    std::error_code code{error_number, std::generic_category()};
    return Error{classify(code), path, std::format("{} {}: {}", operation, path.string(), code.message()), code};
}

Error Error::partial(const Error& cause, std::size_t completed) {
    Error result{ErrorKind::PartialFailure, cause.path(),
                 std::format("aborted after {} completed nodes: {}", completed, cause.what()),
                 cause.code()};
    result.cause_ = cause.kind();
    result.completed_ = completed;
    return result;
}

} // namespace arbor
