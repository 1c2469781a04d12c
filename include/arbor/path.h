#pragma once

#include <filesystem>
#include <vector>

namespace arbor::paths {

// Purely lexical resolution of `candidate` against `base`, as a shell would do
// it: absolute candidates win, "." and ".." are folded, trailing separators
// dropped. Never touches the filesystem. A relative base is anchored at "/".
[[nodiscard]] std::filesystem::path resolve(const std::filesystem::path& base,
                                            const std::filesystem::path& candidate);

// resolve() against the process-wide working directory from Config.
[[nodiscard]] std::filesystem::path absolute(const std::filesystem::path& candidate);

// Every ancestor of an absolute path, shallowest first, ending with the path
// itself. The filesystem root is not part of the chain.
[[nodiscard]] std::vector<std::filesystem::path> ancestors(const std::filesystem::path& path);

// True when `path` equals `base` or lies beneath it. Both must be resolved.
[[nodiscard]] bool is_within(const std::filesystem::path& path, const std::filesystem::path& base);

} // namespace arbor::paths
