#include "arbor/renderer.h"

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

#include "arbor/formatter.h"

namespace arbor {

Renderer::Renderer(const Config::Options& options, std::ostream& output)
    : options_{options}, out_{output} {}

void Renderer::render(const std::vector<ListEntry>& entries) {
    std::vector<const NodeRecord*> records;
    for (const auto& entry : entries) {
        if (const auto* record = std::get_if<NodeRecord>(&entry)) {
            records.push_back(record);
        } else {
            out_ << std::get<std::filesystem::path>(entry).string() << '\n';
        }
    }
    if (!records.empty()) {
        render_long(records);
    }
}

void Renderer::render_record(const NodeRecord& record) {
    render_long({&record});
}

void Renderer::render_visit(const std::filesystem::path& path, const std::optional<NodeRecord>& record) {
    if (!record) {
        out_ << "?          " << path.string() << '\n';
        return;
    }
    if (options_.details) {
        render_long({&*record});
        return;
    }
    out_ << formatter::permissions(*record) << ' ' << path.string() << '\n';
}

void Renderer::render_long(const std::vector<const NodeRecord*>& records) {
    struct Row {
        std::string perms;
        std::string owner;
        std::string group;
        std::string size;
        std::string time;
        std::string name;
    };

    std::vector<Row> rows;
    rows.reserve(records.size());

    std::size_t owner_w = 0;
    std::size_t group_w = 0;
    std::size_t size_w = 0;

    for (const auto* record : records) {
        Row row;
        row.perms = formatter::permissions(*record);
        row.owner = formatter::owner(*record);
        owner_w = std::max(owner_w, row.owner.size());
        row.group = formatter::group(*record);
        group_w = std::max(group_w, row.group.size());
        row.size = formatter::size(*record);
        size_w = std::max(size_w, row.size.size());
        row.time = formatter::modified_time(*record);
        row.name = record->path.string();
        rows.push_back(std::move(row));
    }

    for (const auto& row : rows) {
        out_ << row.perms << ' ';
        out_ << std::setw(static_cast<int>(owner_w)) << row.owner << ' ';
        out_ << std::setw(static_cast<int>(group_w)) << row.group << ' ';
        out_ << std::setw(static_cast<int>(size_w)) << row.size << ' ';
        out_ << row.time << ' ';
        out_ << row.name << '\n';
    }
}

} // namespace arbor
