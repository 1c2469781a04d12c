#include "arbor/lister.h"

#include <utility>

#include "arbor/path.h"

namespace arbor {

Lister::Lister(const TreeWalker& walker)
    : walker_{walker} {}

std::vector<NodeRecord> Lister::list_records(const std::filesystem::path& root, const ListOptions& options) const {
    const auto resolved_root = paths::absolute(root);
    std::vector<NodeRecord> records;

    WalkOptions walk_options;
    walk_options.recursive = options.recursive;
    walk_options.links = options.links;
    walk_options.on_error = options.on_error;

    walker_.walk(resolved_root, [&](const std::filesystem::path& path, const std::optional<NodeRecord>& record) {
        if (!record) {
            return;
        }
        if (path == resolved_root && record->is_directory()) {
            return;
        }
        records.push_back(*record);
    }, walk_options);

    return records;
}

std::vector<ListEntry> Lister::list(const std::filesystem::path& root, const ListOptions& options) const {
    auto records = list_records(root, options);
    std::vector<ListEntry> entries;
    entries.reserve(records.size());
    for (auto& record : records) {
        if (options.details) {
            entries.emplace_back(std::move(record));
        } else {
            entries.emplace_back(std::move(record.path));
        }
    }
    return entries;
}

std::vector<std::filesystem::path> Lister::list_paths(const std::filesystem::path& root, bool recursive) const {
    ListOptions options;
    options.recursive = recursive;
    options.details = false;

    std::vector<std::filesystem::path> result;
    for (auto& entry : list(root, options)) {
        result.push_back(std::get<std::filesystem::path>(std::move(entry)));
    }
    return result;
}

const std::filesystem::path& entry_path(const ListEntry& entry) noexcept {
    if (const auto* record = std::get_if<NodeRecord>(&entry)) {
        return record->path;
    }
    return std::get<std::filesystem::path>(entry);
}

} // namespace arbor
