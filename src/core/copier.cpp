#include "arbor/copier.h"

#include <format>
#include <optional>
#include <vector>

#include "arbor/config.h"
#include "arbor/error.h"
#include "arbor/logger.h"
#include "arbor/path.h"

namespace arbor {

namespace {
// Directories are recreated owner-writable so their contents can be copied in.
constexpr std::uint32_t kPermissionBits = 07777;
constexpr std::uint32_t kOwnerAll = 0700;
} // namespace

StreamPump::StreamPump(std::size_t chunk_size)
    : chunk_size_{chunk_size != 0 ? chunk_size : Config::instance().options().copy_chunk_size} {
    if (chunk_size_ == 0) {
        chunk_size_ = 32768;
    }
}

std::uintmax_t StreamPump::pump(ReadStream& source, WriteStream& target, const DataCallback& on_data) const {
    std::vector<char> buffer(chunk_size_);
    std::uintmax_t total = 0;
    for (;;) {
        std::size_t count = 0;
        try {
            count = source.read(buffer);
        } catch (const Error&) {
            target.cancel();
            throw;
        }
        if (count == 0) {
            break;
        }

        try {
            target.write(std::span<const char>{buffer.data(), count});
        } catch (const Error&) {
            source.cancel();
            throw;
        }
        total += count;
        if (on_data) {
            on_data(count);
        }
    }

    try {
        target.finish();
    } catch (const Error&) {
        source.cancel();
        throw;
    }
    return total;
}

std::string StreamPump::read_all(ReadStream& source) const {
    std::string data;
    std::vector<char> buffer(chunk_size_);
    for (;;) {
        const auto count = source.read(buffer);
        if (count == 0) {
            break;
        }
        data.append(buffer.data(), count);
    }
    return data;
}

void StreamPump::write_all(std::string_view data, WriteStream& target) const {
    for (std::size_t offset = 0; offset < data.size(); offset += chunk_size_) {
        const auto chunk = data.substr(offset, chunk_size_);
        target.write(std::span<const char>{chunk.data(), chunk.size()});
    }
    target.finish();
}

TreeCopier::TreeCopier(FileSystem& filesystem, const StreamPump& pump, const TreeWalker& walker,
                       const RecursiveCreator& creator)
    : filesystem_{filesystem}, pump_{pump}, walker_{walker}, creator_{creator} {}

std::uintmax_t TreeCopier::copy_file(const std::filesystem::path& source,
                                     const std::filesystem::path& destination) const {
    const auto from = paths::absolute(source);
    const auto to = paths::absolute(destination);
    if (from == to) {
        throw Error{ErrorKind::InvalidPath, to, std::format("cannot copy {} onto itself", from.string())};
    }

    // The source is opened first so a missing source never truncates the destination.
    auto reader = filesystem_.open_read(from);
    reject_same_node(from, to);
    auto writer = filesystem_.open_write(to, Config::instance().options().file_mode);
    const auto bytes = pump_.pump(*reader, *writer);
    Logger::instance().debug("copied {} bytes from {} to {}", bytes, from.string(), to.string());
    return bytes;
}

void TreeCopier::reject_same_node(const std::filesystem::path& from, const std::filesystem::path& to) const {
    const auto source = filesystem_.stat(from, LinkMode::Follow);
    std::optional<NodeRecord> target;
    try {
        target = filesystem_.stat(to, LinkMode::Follow);
    } catch (const Error& error) {
        if (error.kind() != ErrorKind::NotFound) {
            throw;
        }
    }
    // A link to the source would be truncated by open_write before a byte is read.
    if (target && target->same_node(source)) {
        throw Error{ErrorKind::InvalidPath, to,
                    std::format("cannot copy {} onto itself through {}", from.string(), to.string())};
    }
}

std::size_t TreeCopier::copy_tree(const std::filesystem::path& source,
                                  const std::filesystem::path& destination) const {
    const auto from = paths::absolute(source);
    const auto to = paths::absolute(destination);
    if (paths::is_within(to, from)) {
        throw Error{ErrorKind::InvalidPath, to,
                    std::format("cannot copy {} into itself at {}", from.string(), to.string())};
    }

    const auto root = filesystem_.stat(from, LinkMode::Follow);
    if (root.is_file()) {
        copy_file(from, to);
        return 1;
    }
    if (!root.is_directory()) {
        Logger::instance().warn("skipping {}: not a regular file or directory", from.string());
        return 0;
    }
    if (to.has_parent_path() && to.parent_path() != to) {
        creator_.make_tree_path(to.parent_path());
    }

    // Links below the root are not followed, so a link back into the tree
    // cannot make the copy recurse.
    WalkOptions options;
    options.links = LinkMode::NoFollow;
    options.follow_root = true;

    std::size_t files = 0;
    walker_.walk(from, [&](const std::filesystem::path& path, const std::optional<NodeRecord>& record) {
        const auto target = path == from ? to : to / path.lexically_relative(from);
        switch (record->kind) {
            case NodeKind::Directory:
                creator_.make_tree_path(target, (record->mode & kPermissionBits) | kOwnerAll);
                break;
            case NodeKind::File:
                copy_file(path, target);
                ++files;
                break;
            case NodeKind::Missing:
            case NodeKind::Other:
                Logger::instance().warn("skipping {}: not a regular file or directory", path.string());
                break;
        }
    }, options);
    return files;
}

} // namespace arbor
