#pragma once

#include "expanse/model/context.h"
#include "expanse/model/types.h"
#include "expanse/source_location.h"
#include <string>
#include <vector>

namespace expanse {
namespace model {

// One constructor as the catalog sees it: its argument shape, not its body.
// An empty label means the parameter is unlabeled.
struct ConstructorCandidate {
    TypeRef owningType;
    std::vector<std::string> parameterLabels;
    std::vector<TypeRef> parameterTypes;
    VisibilityLevel visibility = VisibilityLevel::Internal;
    ModuleId declaringModule;

    // Where it was declared (file/scope for access control, ordinal for the
    // declaration-site lock)
    SiteContext declaredAt;
    SourceLocation location;

    size_t getArity() const { return parameterLabels.size(); }

    // e.g. "Point.init(x:y:)"
    std::string getDisplayName() const;
    // e.g. "init(x: Int, y: Int)"
    std::string getSignatureString() const;

    bool operator==(const ConstructorCandidate& other) const;
    bool operator!=(const ConstructorCandidate& other) const { return !(*this == other); }
};

} // namespace model
} // namespace expanse
