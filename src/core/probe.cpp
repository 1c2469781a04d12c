#include "arbor/probe.h"

#include "arbor/error.h"
#include "arbor/logger.h"
#include "arbor/path.h"

namespace arbor {

NodeProbe::NodeProbe(FileSystem& filesystem)
    : filesystem_{filesystem} {}

NodeRecord NodeProbe::probe(const std::filesystem::path& path, LinkMode links) const {
    return filesystem_.stat(paths::absolute(path), links);
}

NodeKind NodeProbe::classify(const std::filesystem::path& path, LinkMode links) const {
    try {
        return probe(path, links).kind;
    } catch (const Error& error) {
        if (error.kind() == ErrorKind::NotFound) {
            return NodeKind::Missing;
        }
        throw;
    }
}

bool NodeProbe::exists(const std::filesystem::path& path) const {
    try {
        probe(path);
        return true;
    } catch (const Error& error) {
        if (error.kind() == ErrorKind::NotFound) {
            return false;
        }
        Logger::instance().debug("{} exists but cannot be inspected: {}", path.string(), error.what());
        return true;
    }
}

} // namespace arbor
