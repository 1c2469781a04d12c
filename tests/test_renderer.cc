#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <sys/stat.h>

#include "arbor/config.h"
#include "arbor/formatter.h"
#include "arbor/lister.h"
#include "arbor/node.h"
#include "arbor/renderer.h"

using namespace arbor;

namespace {
NodeRecord make_record(const std::string& path, NodeKind kind, std::uint32_t mode, std::uint64_t size) {
    NodeRecord record;
    record.path = path;
    record.kind = kind;
    record.mode = mode;
    record.owner_id = 1000;
    record.group_id = 100;
    record.size_bytes = size;
    return record;
}
} // namespace

TEST(FormatterTest, PermissionString) {
    EXPECT_EQ(formatter::permissions(make_record("/d", NodeKind::Directory, S_IFDIR | 0755, 0)), "drwxr-xr-x");
    EXPECT_EQ(formatter::permissions(make_record("/f", NodeKind::File, S_IFREG | 0640, 0)), "-rw-r-----");
    EXPECT_EQ(formatter::permissions(make_record("/p", NodeKind::Other, S_IFIFO | 0600, 0)), "prw-------");
    EXPECT_EQ(formatter::permissions(make_record("/m", NodeKind::Missing, 0, 0)), "?---------");
}

TEST(FormatterTest, SpecialBits) {
    EXPECT_EQ(formatter::permissions(make_record("/t", NodeKind::Directory, S_IFDIR | 01777, 0)), "drwxrwxrwt");
    EXPECT_EQ(formatter::permissions(make_record("/s", NodeKind::File, S_IFREG | 04644, 0)), "-rwSr--r--");
    EXPECT_EQ(formatter::permissions(make_record("/g", NodeKind::File, S_IFREG | 02755, 0)), "-rwxr-sr-x");
}

TEST(FormatterTest, NumericColumns) {
    auto record = make_record("/f", NodeKind::File, S_IFREG | 0644, 12345);
    EXPECT_EQ(formatter::owner(record), "1000");
    EXPECT_EQ(formatter::group(record), "100");
    EXPECT_EQ(formatter::size(record), "12345");
    EXPECT_EQ(formatter::modified_time(record).size(), std::string{"YYYY-MM-DD HH:MM"}.size());
}

TEST(RendererTest, BarePathsOnePerLine) {
    Config::Options options;
    std::ostringstream out;
    Renderer renderer{options, out};
    renderer.render({std::filesystem::path{"/r/a"}, std::filesystem::path{"/r/b"}});
    EXPECT_EQ(out.str(), "/r/a\n/r/b\n");
}

TEST(RendererTest, LongFormatAlignsColumns) {
    Config::Options options;
    std::ostringstream out;
    Renderer renderer{options, out};
    std::vector<ListEntry> entries{make_record("/r/small", NodeKind::File, S_IFREG | 0644, 7),
                                   make_record("/r/large", NodeKind::File, S_IFREG | 0644, 123456)};
    renderer.render(entries);

    std::istringstream lines{out.str()};
    std::string first;
    std::string second;
    std::getline(lines, first);
    std::getline(lines, second);
    EXPECT_EQ(first.size() - std::string{"/r/small"}.size(), second.size() - std::string{"/r/large"}.size());
    EXPECT_NE(first.find("      7 "), std::string::npos);
    EXPECT_NE(second.find("123456 "), std::string::npos);
}

TEST(RendererTest, VisitWithoutRecordIsMarked) {
    Config::Options options;
    std::ostringstream out;
    Renderer renderer{options, out};
    renderer.render_visit("/r/gone", std::nullopt);
    renderer.render_visit("/r/dir", make_record("/r/dir", NodeKind::Directory, S_IFDIR | 0700, 0));
    EXPECT_EQ(out.str(), "?          /r/gone\ndrwx------ /r/dir\n");
}
