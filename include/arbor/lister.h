#pragma once

#include <filesystem>
#include <variant>
#include <vector>

#include "arbor/node.h"
#include "arbor/walker.h"

namespace arbor {

// A bare path when details are off, the full record otherwise.
using ListEntry = std::variant<std::filesystem::path, NodeRecord>;

struct ListOptions {
    bool recursive = true;
    bool details = true;
    LinkMode links = LinkMode::Follow;
    ErrorHandler on_error;
};

// Collects a walk into an ordered sequence. A directory root's own entry is
// left out; a file root lists just itself. Nodes an error handler recovered
// without a record are omitted.
class Lister {
public:
    explicit Lister(const TreeWalker& walker);

    std::vector<ListEntry> list(const std::filesystem::path& root, const ListOptions& options = {}) const;

    std::vector<std::filesystem::path> list_paths(const std::filesystem::path& root, bool recursive = true) const;
    std::vector<NodeRecord> list_records(const std::filesystem::path& root, const ListOptions& options = {}) const;

private:
    const TreeWalker& walker_;
};

// Path of either alternative.
const std::filesystem::path& entry_path(const ListEntry& entry) noexcept;

} // namespace arbor
