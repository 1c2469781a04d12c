#include "arbor/walker.h"

#include <deque>
#include <string>
#include <vector>

#include "arbor/logger.h"
#include "arbor/path.h"

namespace arbor {

namespace {
std::optional<NodeRecord> recover(const Error& error, const WalkOptions& options) {
    if (!options.on_error) {
        throw error;
    }
    auto substitute = options.on_error(error);
    Logger::instance().warn("continuing past {}: {}", error.path().string(), error.what());
    return substitute;
}
} // namespace

TreeWalker::TreeWalker(FileSystem& filesystem, const NodeProbe& probe)
    : filesystem_{filesystem}, probe_{probe} {}

std::optional<NodeRecord> TreeWalker::probe_node(const std::filesystem::path& path, LinkMode links,
                                                 const WalkOptions& options) const {
    try {
        return probe_.probe(path, links);
    } catch (const Error& error) {
        return recover(error, options);
    }
}

void TreeWalker::walk(const std::filesystem::path& root, const Visitor& visitor, const WalkOptions& options) const {
    const auto resolved_root = paths::absolute(root);

    auto root_record =
        probe_node(resolved_root, options.follow_root ? LinkMode::Follow : options.links, options);
    visitor(resolved_root, root_record);
    if (!root_record || !root_record->is_directory()) {
        return;
    }

    std::deque<std::filesystem::path> queue;
    queue.push_back(resolved_root);

    auto& logger = Logger::instance();
    while (!queue.empty()) {
        const auto directory = std::move(queue.front());
        queue.pop_front();
        logger.trace("expanding {} ({} queued)", directory.string(), queue.size());

        std::vector<std::string> names;
        try {
            names = filesystem_.read_directory(directory);
        } catch (const Error& error) {
            // A directory that vanished or became unreadable is skipped like
            // a node whose probe failed.
            recover(error, options);
            continue;
        }

        for (const auto& name : names) {
            auto entry = paths::resolve(directory, name);
            auto record = probe_node(entry, options.links, options);
            visitor(entry, record);
            if (options.recursive && record && record->is_directory()) {
                queue.push_back(std::move(entry));
            }
        }
    }
}

} // namespace arbor
