#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>

#include "arbor/filesystem.h"
#include "arbor/probe.h"

namespace arbor {

// Creates every missing directory on the way to a path, shallowest first, so
// each single-level create finds its parent in place. An existing ancestor
// that is not a directory stops the operation with InvalidPath before any
// deeper level is touched.
class RecursiveCreator {
public:
    RecursiveCreator(FileSystem& filesystem, const NodeProbe& probe);

    // Returns how many directories were created; zero when everything existed.
    // Without an explicit mode the configured directory mode is used.
    std::size_t make_tree_path(const std::filesystem::path& path,
                               std::optional<std::uint32_t> mode = std::nullopt) const;

private:
    bool create_level(const std::filesystem::path& directory, std::uint32_t mode) const;

    FileSystem& filesystem_;
    const NodeProbe& probe_;
};

} // namespace arbor
