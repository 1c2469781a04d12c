#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace arbor {

enum class ErrorKind {
    NotFound,
    AccessDenied,
    IOError,
    InvalidPath,
    PartialFailure
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

// Maps an OS error to the kind reported to callers.
[[nodiscard]] ErrorKind classify(std::error_code code) noexcept;

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, std::filesystem::path path, const std::string& message,
          std::error_code code = {});

    // Failure of a single-node primitive, built from errno.
    static Error from_errno(int error_number, std::string_view operation, const std::filesystem::path& path);

    // A bulk operation aborted after `completed` nodes were already processed.
    static Error partial(const Error& cause, std::size_t completed);

    ErrorKind kind() const noexcept { return kind_; }
    const std::filesystem::path& path() const noexcept { return path_; }
    std::error_code code() const noexcept { return code_; }

    // For PartialFailure: the kind of the failure that stopped the operation.
    ErrorKind cause() const noexcept { return cause_; }
    std::size_t completed() const noexcept { return completed_; }

private:
    ErrorKind kind_;
    ErrorKind cause_;
    std::filesystem::path path_;
    std::error_code code_;
    std::size_t completed_ = 0;
};

} // namespace arbor
