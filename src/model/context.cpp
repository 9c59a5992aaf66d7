#include "expanse/model/context.h"
#include <sstream>
#include <tuple>

namespace expanse {
namespace model {

const char* visibilityToString(VisibilityLevel level) {
    switch (level) {
        case VisibilityLevel::Private: return "private";
        case VisibilityLevel::FilePrivate: return "fileprivate";
        case VisibilityLevel::Internal: return "internal";
        case VisibilityLevel::Public: return "public";
    }
    return "internal";
}

std::string SiteContext::toString() const {
    std::ostringstream oss;
    oss << module << ":" << file;
    if (!scope.empty()) {
        oss << ":" << scope;
    }
    oss << "#" << ordinal;
    return oss.str();
}

bool SiteContext::operator<(const SiteContext& other) const {
    return std::tie(module, file, scope, ordinal) <
           std::tie(other.module, other.file, other.scope, other.ordinal);
}

} // namespace model
} // namespace expanse
