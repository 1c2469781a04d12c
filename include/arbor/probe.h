#pragma once

#include <filesystem>

#include "arbor/filesystem.h"
#include "arbor/node.h"

namespace arbor {

// Metadata for one node through exactly one filesystem query.
class NodeProbe {
public:
    explicit NodeProbe(FileSystem& filesystem);

    // Throws arbor::Error (NotFound, AccessDenied or IOError).
    NodeRecord probe(const std::filesystem::path& path, LinkMode links = LinkMode::Follow) const;

    // Like probe(), but reports a missing node as NodeKind::Missing instead of throwing.
    NodeKind classify(const std::filesystem::path& path, LinkMode links = LinkMode::Follow) const;

    // False only when the query fails with NotFound; any other failure means
    // something is there that could not be inspected.
    bool exists(const std::filesystem::path& path) const;

private:
    FileSystem& filesystem_;
};

} // namespace arbor
