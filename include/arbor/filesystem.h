#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "arbor/node.h"

namespace arbor {

// Readable byte stream over one open file. Failures throw arbor::Error.
class ReadStream {
public:
    virtual ~ReadStream() = default;

    // Fills at most buffer.size() bytes; returns 0 once the end is reached.
    virtual std::size_t read(std::span<char> buffer) = 0;

    // Releases the handle without reporting errors.
    virtual void cancel() noexcept = 0;
};

// Writable byte stream over one open file. Failures throw arbor::Error.
class WriteStream {
public:
    virtual ~WriteStream() = default;

    virtual void write(std::span<const char> data) = 0;

    // Flushes and closes; the write is complete only once this returns.
    virtual void finish() = 0;

    // Releases the handle without finalizing the file.
    virtual void cancel() noexcept = 0;
};

// The single-node primitives the traversal engine is built on. Every call is
// one filesystem operation and reports failure by throwing arbor::Error.
class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual NodeRecord stat(const std::filesystem::path& path, LinkMode links) = 0;

    // Entry names of a directory in the order the OS returns them, without
    // "." and "..".
    virtual std::vector<std::string> read_directory(const std::filesystem::path& path) = 0;

    // Creates one level; fails when the parent is missing or the node exists.
    virtual void make_directory(const std::filesystem::path& path, std::uint32_t mode) = 0;

    // Removes an empty directory.
    virtual void remove_directory(const std::filesystem::path& path) = 0;

    virtual void remove_file(const std::filesystem::path& path) = 0;

    virtual std::unique_ptr<ReadStream> open_read(const std::filesystem::path& path) = 0;
    virtual std::unique_ptr<WriteStream> open_write(const std::filesystem::path& path, std::uint32_t mode) = 0;
};

class PosixFileSystem final : public FileSystem {
public:
    NodeRecord stat(const std::filesystem::path& path, LinkMode links) override;
    std::vector<std::string> read_directory(const std::filesystem::path& path) override;
    void make_directory(const std::filesystem::path& path, std::uint32_t mode) override;
    void remove_directory(const std::filesystem::path& path) override;
    void remove_file(const std::filesystem::path& path) override;
    std::unique_ptr<ReadStream> open_read(const std::filesystem::path& path) override;
    std::unique_ptr<WriteStream> open_write(const std::filesystem::path& path, std::uint32_t mode) override;
};

// Process-wide POSIX implementation.
FileSystem& default_filesystem();

} // namespace arbor
