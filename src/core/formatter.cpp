#include "arbor/formatter.h"

#include <ctime>
#include <format>

#include <sys/stat.h>

namespace arbor::formatter {
namespace {

char file_type_char(const NodeRecord& record) {
    switch (record.kind) {
        case NodeKind::Directory:
            return 'd';
        case NodeKind::File:
            return '-';
        case NodeKind::Missing:
            return '?';
        case NodeKind::Other:
            break;
    }
    const auto mode = static_cast<mode_t>(record.mode);
    if (S_ISLNK(mode)) {
        return 'l';
    }
    if (S_ISBLK(mode)) {
        return 'b';
    }
    if (S_ISCHR(mode)) {
        return 'c';
    }
    if (S_ISFIFO(mode)) {
        return 'p';
    }
    if (S_ISSOCK(mode)) {
        return 's';
    }
    return '?';
}

char permission_char(std::uint32_t mode, std::uint32_t mask, char letter) {
    return (mode & mask) != 0 ? letter : '-';
}

} // namespace

std::string permissions(const NodeRecord& record) {
    std::string result;
    result.reserve(10);
    result.push_back(file_type_char(record));
    result.push_back(permission_char(record.mode, S_IRUSR, 'r'));
    result.push_back(permission_char(record.mode, S_IWUSR, 'w'));
    result.push_back(permission_char(record.mode, S_IXUSR, 'x'));
    result.push_back(permission_char(record.mode, S_IRGRP, 'r'));
    result.push_back(permission_char(record.mode, S_IWGRP, 'w'));
    result.push_back(permission_char(record.mode, S_IXGRP, 'x'));
    result.push_back(permission_char(record.mode, S_IROTH, 'r'));
    result.push_back(permission_char(record.mode, S_IWOTH, 'w'));
    result.push_back(permission_char(record.mode, S_IXOTH, 'x'));
    if ((record.mode & S_ISUID) != 0) {
        result[3] = (record.mode & S_IXUSR) != 0 ? 's' : 'S';
    }
    if ((record.mode & S_ISGID) != 0) {
        result[6] = (record.mode & S_IXGRP) != 0 ? 's' : 'S';
    }
    if ((record.mode & S_ISVTX) != 0) {
        result[9] = (record.mode & S_IXOTH) != 0 ? 't' : 'T';
    }
    return result;
}

std::string owner(const NodeRecord& record) {
    return std::to_string(record.owner_id);
}

std::string group(const NodeRecord& record) {
    return std::to_string(record.group_id);
}

std::string size(const NodeRecord& record) {
    return std::to_string(record.size_bytes);
}

std::string modified_time(const NodeRecord& record) {
    std::time_t time = NodeRecord::Clock::to_time_t(record.modify_time);
    std::tm tm{};
    localtime_r(&time, &tm);
    return std::format("{:04}-{:02}-{:02} {:02}:{:02}", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                       tm.tm_min);
}

} // namespace arbor::formatter
