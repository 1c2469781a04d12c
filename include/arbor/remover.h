#pragma once

#include <cstddef>
#include <filesystem>

#include "arbor/filesystem.h"
#include "arbor/lister.h"

namespace arbor {

// Deletes a subtree bottom-up: the detailed listing is processed in reverse
// breadth-first order, so every child goes before its parent directory, and
// the root itself is removed last. Deletions run one at a time and stop at the
// first failure. Nothing is rolled back: a PartialFailure means some of the
// tree is already gone.
class RecursiveRemover {
public:
    RecursiveRemover(FileSystem& filesystem, const Lister& lister);

    // Returns the number of nodes removed.
    std::size_t remove_tree(const std::filesystem::path& root, bool recursive = true) const;

private:
    void remove_node(const NodeRecord& record) const;

    FileSystem& filesystem_;
    const Lister& lister_;
};

} // namespace arbor
