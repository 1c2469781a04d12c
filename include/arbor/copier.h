#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

#include "arbor/creator.h"
#include "arbor/filesystem.h"
#include "arbor/walker.h"

namespace arbor {

// Moves bytes between two open streams in fixed-size chunks.
class StreamPump {
public:
    using DataCallback = std::function<void(std::size_t)>;

    // Zero picks the configured copy chunk size.
    explicit StreamPump(std::size_t chunk_size = 0);

    // Copies source to target until the source is exhausted, then finishes the
    // target. The first failure on either side cancels the other stream and
    // is rethrown. `on_data` sees the size of every chunk written.
    std::uintmax_t pump(ReadStream& source, WriteStream& target, const DataCallback& on_data = {}) const;

    std::string read_all(ReadStream& source) const;
    void write_all(std::string_view data, WriteStream& target) const;

    std::size_t chunk_size() const noexcept { return chunk_size_; }

private:
    std::size_t chunk_size_;
};

class TreeCopier {
public:
    TreeCopier(FileSystem& filesystem, const StreamPump& pump, const TreeWalker& walker,
               const RecursiveCreator& creator);

    // Streams one file to destination, creating or truncating it. Returns
    // the number of bytes copied. On failure a partially written destination
    // may remain.
    std::uintmax_t copy_file(const std::filesystem::path& source, const std::filesystem::path& destination) const;

    // Recreates the source tree beneath destination: directories through the
    // creator with the source permission bits, regular files through
    // copy_file, other nodes skipped. Missing parents of destination get the
    // configured directory mode. Symbolic links below the root are skipped,
    // not followed. A file source is a plain copy_file.
    // Returns the number of files copied.
    std::size_t copy_tree(const std::filesystem::path& source, const std::filesystem::path& destination) const;

private:
    // Throws InvalidPath when `to` already names the node behind `from`.
    void reject_same_node(const std::filesystem::path& from, const std::filesystem::path& to) const;

    FileSystem& filesystem_;
    const StreamPump& pump_;
    const TreeWalker& walker_;
    const RecursiveCreator& creator_;
};

} // namespace arbor
