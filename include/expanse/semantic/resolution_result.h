#pragma once

#include "expanse/model/call.h"
#include "expanse/model/constructor.h"
#include "expanse/model/types.h"
#include <string>
#include <vector>

namespace expanse {
namespace semantic {

enum class ResolutionErrorKind {
    // Signature legality (declaration time)
    InvalidExpandedPlacement,
    MultipleExpandedParameters,
    OverloadConflictWithExpanded,
    NonNominalExpandedType,
    AbstractTypeNotExpandable,
    ByReferenceExpandedConflict,
    DefaultArgumentAdjacencyViolation,
    // Call resolution (per call site)
    NoMatchingInitializer,
    AmbiguousInitializer,
    InaccessibleInitializer,
    TrailingClosureNotAllowed,
    // Ordinary type-check failure of an argument against the selected
    // constructor; routed to the host's usual type-error channel
    ArgumentTypeMismatch
};

const char* errorKindToString(ResolutionErrorKind kind);

// Static error plus the positions a host needs to point at. Indices are
// positional indices into the signature (parameters) or into the full call
// argument list (arguments).
struct ResolutionError {
    ResolutionErrorKind kind;
    std::vector<size_t> parameterIndices;
    std::vector<size_t> argumentIndices;
    std::vector<model::ConstructorCandidate> candidates;  // competing/considered
    model::TypeRef ownerType;     // type whose catalog was searched
    model::TypeRef expectedType;  // ArgumentTypeMismatch only

    explicit ResolutionError(ResolutionErrorKind k) : kind(k) {}

    std::string toString() const;
};

// Outcome of resolving one call against a signature
class ResolutionResult {
public:
    enum class Kind {
        NotApplicable,  // signature has no expanded parameter
        Direct,         // first argument supplies the value unexpanded
        Defaulted,      // nothing to expand; the parameter's default is used
        Constructed,    // implicit constructor call synthesized from the span
        Error
    };

    static ResolutionResult notApplicable(model::ArgumentList arguments);
    static ResolutionResult direct(const model::CallArgument& argument, model::ArgumentList remainder);
    static ResolutionResult defaulted(model::ArgumentList remainder);
    static ResolutionResult constructed(const model::ConstructorCandidate& candidate,
                                        model::ArgumentList expansionSpan,
                                        model::ArgumentList remainder);
    static ResolutionResult failure(const ResolutionError& error);

    Kind getKind() const { return kind_; }
    bool isError() const { return kind_ == Kind::Error; }
    bool isDirect() const { return kind_ == Kind::Direct; }
    bool isConstructed() const { return kind_ == Kind::Constructed; }
    bool isDefaulted() const { return kind_ == Kind::Defaulted; }

    // Direct: the value argument
    const model::CallArgument& getDirectArgument() const { return directArgument_; }
    // Constructed: the selected constructor and its argument list
    const model::ConstructorCandidate& getConstructor() const { return constructor_; }
    const model::ArgumentList& getExpansionSpan() const { return expansionSpan_; }
    // Arguments left for ordinary matching against the rest of the signature
    // (all arguments when NotApplicable)
    const model::ArgumentList& getRemainder() const { return remainder_; }
    // Error only
    const ResolutionError& getError() const { return error_; }

    std::string toString() const;

    bool operator==(const ResolutionResult& other) const;
    bool operator!=(const ResolutionResult& other) const { return !(*this == other); }

private:
    ResolutionResult(Kind kind)
        : kind_(kind), error_(ResolutionErrorKind::NoMatchingInitializer) {}

    Kind kind_;
    model::CallArgument directArgument_;
    model::ConstructorCandidate constructor_;
    model::ArgumentList expansionSpan_;
    model::ArgumentList remainder_;
    ResolutionError error_;
};

} // namespace semantic
} // namespace expanse
