#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string_view>

namespace arbor {

enum class NodeKind {
    File,
    Directory,
    Missing,
    Other
};

[[nodiscard]] std::string_view to_string(NodeKind kind) noexcept;

// Whether a metadata query reports on a symbolic link itself or on its target.
enum class LinkMode {
    Follow,
    NoFollow
};

// Metadata of one visited node. Built once by a probe and never modified.
struct NodeRecord {
    using Clock = std::chrono::system_clock;

    std::filesystem::path path;
    NodeKind kind = NodeKind::Missing;
    std::uint32_t mode = 0;
    std::uint32_t owner_id = 0;
    std::uint32_t group_id = 0;
    std::uintmax_t size_bytes = 0;
    // Identity of the underlying inode; two paths name the same node when both match.
    std::uint64_t device_id = 0;
    std::uint64_t inode = 0;
    Clock::time_point access_time{};
    Clock::time_point modify_time{};
    Clock::time_point change_time{};
    Clock::time_point birth_time{};

    bool is_file() const noexcept { return kind == NodeKind::File; }
    bool is_directory() const noexcept { return kind == NodeKind::Directory; }
    bool same_node(const NodeRecord& other) const noexcept {
        return device_id == other.device_id && inode == other.inode;
    }
};

} // namespace arbor
