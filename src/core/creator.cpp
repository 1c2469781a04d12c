#include "arbor/creator.h"

#include <format>
#include <string_view>
#include <system_error>

#include <sys/stat.h>

#include "arbor/config.h"
#include "arbor/error.h"
#include "arbor/logger.h"
#include "arbor/path.h"

namespace arbor {

namespace {
Error invalid_path(const std::filesystem::path& path, std::string_view what) {
    return Error{ErrorKind::InvalidPath, path,
                 std::format("Invalid path: {} exists as a {}, not a directory", path.string(), what)};
}

Error invalid_path(const std::filesystem::path& path, NodeKind kind) {
    return invalid_path(path, to_string(kind));
}
} // namespace

RecursiveCreator::RecursiveCreator(FileSystem& filesystem, const NodeProbe& probe)
    : filesystem_{filesystem}, probe_{probe} {}

bool RecursiveCreator::create_level(const std::filesystem::path& directory, std::uint32_t mode) const {
    try {
        filesystem_.make_directory(directory, mode);
    } catch (const Error& error) {
        // Someone else created it between our probe and the mkdir.
        if (error.code() != std::errc::file_exists) {
            throw;
        }
        if (probe_.classify(directory) == NodeKind::Directory) {
            return false;
        }
        // A dangling link reads as missing through the link but still occupies the name.
        const auto node = probe_.probe(directory, LinkMode::NoFollow);
        if (S_ISLNK(static_cast<mode_t>(node.mode))) {
            throw invalid_path(directory, "symbolic link");
        }
        throw invalid_path(directory, node.kind);
    }
    Logger::instance().debug("created directory {}", directory.string());
    return true;
}

std::size_t RecursiveCreator::make_tree_path(const std::filesystem::path& path,
                                             std::optional<std::uint32_t> mode) const {
    const auto target = paths::absolute(path);
    const auto directory_mode = mode.value_or(Config::instance().options().directory_mode);

    std::size_t created = 0;
    for (const auto& directory : paths::ancestors(target)) {
        const auto kind = probe_.classify(directory);
        switch (kind) {
            case NodeKind::Directory:
                break;
            case NodeKind::Missing:
                if (create_level(directory, directory_mode)) {
                    ++created;
                }
                break;
            case NodeKind::File:
            case NodeKind::Other:
                throw invalid_path(directory, kind);
        }
    }
    return created;
}

} // namespace arbor
