#include "arbor/path.h"

#include <algorithm>

#include "arbor/config.h"

namespace arbor::paths {

namespace {
std::filesystem::path strip_trailing_separator(std::filesystem::path path) {
    while (!path.has_filename() && path.has_relative_path()) {
        path = path.parent_path();
    }
    return path;
}
} // namespace

std::filesystem::path resolve(const std::filesystem::path& base, const std::filesystem::path& candidate) {
    std::filesystem::path anchored = base.is_absolute() ? base : std::filesystem::path{"/"} / base;
    std::filesystem::path combined = candidate.is_absolute() ? candidate : anchored / candidate;
    return strip_trailing_separator(combined.lexically_normal());
}

std::filesystem::path absolute(const std::filesystem::path& candidate) {
    return resolve(Config::instance().working_directory(), candidate);
}

std::vector<std::filesystem::path> ancestors(const std::filesystem::path& path) {
    std::vector<std::filesystem::path> chain;
    const auto root = path.root_path();
    auto current = path;
    while (!current.empty() && current != root) {
        chain.push_back(current);
        auto parent = current.parent_path();
        if (parent == current) {
            break;
        }
        current = std::move(parent);
    }
    std::reverse(chain.begin(), chain.end());
    return chain;
}

bool is_within(const std::filesystem::path& path, const std::filesystem::path& base) {
    auto base_it = base.begin();
    auto path_it = path.begin();
    for (; base_it != base.end(); ++base_it, ++path_it) {
        if (path_it == path.end() || *path_it != *base_it) {
            return false;
        }
    }
    return true;
}

} // namespace arbor::paths
