#include "expanse/semantic/constructor_resolver.h"
#include "expanse/semantic/oracles.h"

namespace expanse {
namespace semantic {

bool ConstructorResolver::labelsMatch(const model::ArgumentList& span, const model::ConstructorCandidate& candidate) {
    if (span.size() != candidate.parameterLabels.size()) {
        return false;
    }
    for (size_t i = 0; i < span.size(); ++i) {
        if (span[i].label != candidate.parameterLabels[i]) {
            return false;
        }
    }
    return true;
}

size_t ConstructorResolver::firstMismatch(const model::ArgumentList& span, const model::ConstructorCandidate& candidate) const {
    for (size_t i = 0; i < span.size(); ++i) {
        if (i >= candidate.parameterTypes.size() || !span[i].value ||
            !typeCheck_.typeChecks(*span[i].value, candidate.parameterTypes[i])) {
            return i;
        }
    }
    return span.size();
}

ConstructorMatch ConstructorResolver::resolve(const model::ArgumentList& expansionSpan,
                                              const ConstructorCatalog& catalog,
                                              const model::SiteContext& callSite) const {
    ConstructorMatch match;
    match.error.ownerType = catalog.ownerType;

    // Labels are known before any type inference, so they filter first
    std::vector<const model::ConstructorCandidate*> shaped;
    for (const auto& candidate : catalog.candidates) {
        if (labelsMatch(expansionSpan, candidate)) {
            shaped.push_back(&candidate);
        }
    }

    if (shaped.empty()) {
        match.error = ResolutionError(ResolutionErrorKind::NoMatchingInitializer);
        match.error.ownerType = catalog.ownerType;
        match.error.candidates = catalog.candidates;
        for (size_t i = 0; i < expansionSpan.size(); ++i) {
            match.error.argumentIndices.push_back(i);
        }
        return match;
    }

    const model::ConstructorCandidate* selected = nullptr;
    if (shaped.size() == 1) {
        size_t bad = firstMismatch(expansionSpan, *shaped.front());
        if (bad < expansionSpan.size()) {
            match.error = ResolutionError(ResolutionErrorKind::ArgumentTypeMismatch);
            match.error.ownerType = catalog.ownerType;
            match.error.argumentIndices.push_back(bad);
            match.error.expectedType = shaped.front()->parameterTypes.size() > bad
                ? shaped.front()->parameterTypes[bad]
                : model::TypeRef::error();
            match.error.candidates.push_back(*shaped.front());
            return match;
        }
        selected = shaped.front();
    } else {
        std::vector<const model::ConstructorCandidate*> viable;
        for (const auto* candidate : shaped) {
            if (firstMismatch(expansionSpan, *candidate) == expansionSpan.size()) {
                viable.push_back(candidate);
            }
        }

        if (viable.size() != 1) {
            // No tie-breaking by arity or anything else: several viable
            // candidates are reported as ambiguous.
            match.error = ResolutionError(viable.empty()
                ? ResolutionErrorKind::NoMatchingInitializer
                : ResolutionErrorKind::AmbiguousInitializer);
            match.error.ownerType = catalog.ownerType;
            const auto& reported = viable.empty() ? shaped : viable;
            for (const auto* candidate : reported) {
                match.error.candidates.push_back(*candidate);
            }
            for (size_t i = 0; i < expansionSpan.size(); ++i) {
                match.error.argumentIndices.push_back(i);
            }
            return match;
        }
        selected = viable.front();
    }

    // The catalog already checked the declaration site; access scopes can
    // differ at the call site.
    if (!visibility_.isVisible(*selected, callSite)) {
        match.error = ResolutionError(ResolutionErrorKind::InaccessibleInitializer);
        match.error.ownerType = catalog.ownerType;
        match.error.candidates.push_back(*selected);
        for (size_t i = 0; i < expansionSpan.size(); ++i) {
            match.error.argumentIndices.push_back(i);
        }
        return match;
    }

    match.ok = true;
    match.candidate = *selected;
    return match;
}

} // namespace semantic
} // namespace expanse
