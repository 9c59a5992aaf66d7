#pragma once

#include <cstddef>
#include <string>

namespace expanse {
namespace model {

using ModuleId = std::string;

// Access level of a declaration, most restrictive first
enum class VisibilityLevel {
    Private,      // same enclosing scope (and file, module)
    FilePrivate,  // same file (and module)
    Internal,     // same module
    Public        // everywhere
};

const char* visibilityToString(VisibilityLevel level);

// Where a declaration or a call site lives. The ordinal is the position in
// source order; it is what "declared before" means for the declaration-site
// lock.
struct SiteContext {
    ModuleId module;
    std::string file;
    std::string scope;  // enclosing type name, empty at top level
    size_t ordinal = 0;

    SiteContext() {}
    SiteContext(const ModuleId& m, const std::string& f, const std::string& s, size_t ord)
        : module(m), file(f), scope(s), ordinal(ord) {}

    std::string toString() const;

    bool operator==(const SiteContext& other) const {
        return module == other.module && file == other.file &&
               scope == other.scope && ordinal == other.ordinal;
    }
    bool operator<(const SiteContext& other) const;
};

} // namespace model
} // namespace expanse
