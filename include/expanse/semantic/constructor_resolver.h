#pragma once

#include "expanse/model/call.h"
#include "expanse/model/constructor.h"
#include "expanse/model/context.h"
#include "expanse/semantic/catalog_builder.h"
#include "expanse/semantic/resolution_result.h"
#include <vector>

namespace expanse {
namespace semantic {

class TypeCheckOracle;
class VisibilityOracle;

struct ConstructorMatch {
    bool ok = false;
    model::ConstructorCandidate candidate;
    ResolutionError error = ResolutionError(ResolutionErrorKind::NoMatchingInitializer);
};

// Picks the one constructor of a catalog that an expansion span calls
class ConstructorResolver {
public:
    ConstructorResolver(const TypeCheckOracle& typeCheck, const VisibilityOracle& visibility)
        : typeCheck_(typeCheck), visibility_(visibility) {}

    ConstructorMatch resolve(const model::ArgumentList& expansionSpan,
                             const ConstructorCatalog& catalog,
                             const model::SiteContext& callSite) const;

    // Same arity and the same label at every position
    static bool labelsMatch(const model::ArgumentList& span, const model::ConstructorCandidate& candidate);

    // Index of the first argument that does not type-check, or span.size()
    size_t firstMismatch(const model::ArgumentList& span, const model::ConstructorCandidate& candidate) const;

private:
    const TypeCheckOracle& typeCheck_;
    const VisibilityOracle& visibility_;
};

} // namespace semantic
} // namespace expanse
