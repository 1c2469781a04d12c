#pragma once

#include <filesystem>
#include <functional>
#include <optional>

#include "arbor/error.h"
#include "arbor/filesystem.h"
#include "arbor/node.h"
#include "arbor/probe.h"

namespace arbor {

// Called once per node. The record is empty when an error handler recovered
// from a failure without substituting one. Throwing aborts the walk.
using Visitor = std::function<void(const std::filesystem::path&, const std::optional<NodeRecord>&)>;

// Receives a per-node failure. Returning (a record or std::nullopt) continues
// the walk; throwing, including `throw;`, terminates it with that exception.
using ErrorHandler = std::function<std::optional<NodeRecord>(const Error&)>;

struct WalkOptions {
    // When false only the immediate children of a directory root are visited.
    bool recursive = true;
    LinkMode links = LinkMode::Follow;
    // Probe the root through a symbolic link even when `links` is NoFollow.
    bool follow_root = false;
    // Empty: every failure terminates the walk.
    ErrorHandler on_error;
};

// Breadth-first traversal over an explicit FIFO of directories. The root is
// visited first, then all direct entries of a directory before any of their
// own children; siblings keep the directory listing order.
class TreeWalker {
public:
    TreeWalker(FileSystem& filesystem, const NodeProbe& probe);

    void walk(const std::filesystem::path& root, const Visitor& visitor, const WalkOptions& options = {}) const;

private:
    std::optional<NodeRecord> probe_node(const std::filesystem::path& path, LinkMode links,
                                         const WalkOptions& options) const;

    FileSystem& filesystem_;
    const NodeProbe& probe_;
};

} // namespace arbor
