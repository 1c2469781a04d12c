#pragma once

#include <string>

#include "arbor/node.h"

namespace arbor::formatter {

std::string permissions(const NodeRecord& record);
std::string owner(const NodeRecord& record);
std::string group(const NodeRecord& record);
std::string size(const NodeRecord& record);
std::string modified_time(const NodeRecord& record);

} // namespace arbor::formatter
