#include "arbor/node.h"

namespace arbor {

std::string_view to_string(NodeKind kind) noexcept {
    switch (kind) {
        case NodeKind::File:
            return "file";
        case NodeKind::Directory:
            return "directory";
        case NodeKind::Missing:
            return "missing";
        case NodeKind::Other:
            return "other";
    }
    return "other";
}

} // namespace arbor
