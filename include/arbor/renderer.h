#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <vector>

#include "arbor/config.h"
#include "arbor/lister.h"
#include "arbor/node.h"

namespace arbor {

class Renderer {
public:
    Renderer(const Config::Options& options, std::ostream& output);

    void render(const std::vector<ListEntry>& entries);
    void render_record(const NodeRecord& record);
    void render_visit(const std::filesystem::path& path, const std::optional<NodeRecord>& record);

private:
    void render_long(const std::vector<const NodeRecord*>& records);

    const Config::Options& options_;
    std::ostream& out_;
};

} // namespace arbor
