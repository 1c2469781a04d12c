#include "arbor/remover.h"

#include <algorithm>
#include <vector>

#include "arbor/error.h"
#include "arbor/logger.h"
#include "arbor/path.h"

namespace arbor {

RecursiveRemover::RecursiveRemover(FileSystem& filesystem, const Lister& lister)
    : filesystem_{filesystem}, lister_{lister} {}

void RecursiveRemover::remove_node(const NodeRecord& record) const {
    if (record.is_directory()) {
        filesystem_.remove_directory(record.path);
    } else {
        filesystem_.remove_file(record.path);
    }
    Logger::instance().debug("removed {} {}", to_string(record.kind), record.path.string());
}

std::size_t RecursiveRemover::remove_tree(const std::filesystem::path& root, bool recursive) const {
    const auto resolved_root = paths::absolute(root);

    // Symbolic links are removed, never descended into.
    ListOptions options;
    options.recursive = recursive;
    options.details = true;
    options.links = LinkMode::NoFollow;

    auto records = lister_.list_records(resolved_root, options);

    // A directory root is not part of its own listing; it goes last.
    if (records.empty() || records.front().path != resolved_root) {
        records.insert(records.begin(), filesystem_.stat(resolved_root, LinkMode::NoFollow));
    }
    std::reverse(records.begin(), records.end());

    std::size_t removed = 0;
    for (const auto& record : records) {
        try {
            remove_node(record);
        } catch (const Error& error) {
            if (removed == 0) {
                throw;
            }
            throw Error::partial(error, removed);
        }
        ++removed;
    }
    return removed;
}

} // namespace arbor
