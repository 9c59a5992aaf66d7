#include "expanse/semantic/resolution_result.h"
#include <sstream>

namespace expanse {
namespace semantic {

const char* errorKindToString(ResolutionErrorKind kind) {
    switch (kind) {
        case ResolutionErrorKind::InvalidExpandedPlacement: return "InvalidExpandedPlacement";
        case ResolutionErrorKind::MultipleExpandedParameters: return "MultipleExpandedParameters";
        case ResolutionErrorKind::OverloadConflictWithExpanded: return "OverloadConflictWithExpanded";
        case ResolutionErrorKind::NonNominalExpandedType: return "NonNominalExpandedType";
        case ResolutionErrorKind::AbstractTypeNotExpandable: return "AbstractTypeNotExpandable";
        case ResolutionErrorKind::ByReferenceExpandedConflict: return "ByReferenceExpandedConflict";
        case ResolutionErrorKind::DefaultArgumentAdjacencyViolation: return "DefaultArgumentAdjacencyViolation";
        case ResolutionErrorKind::NoMatchingInitializer: return "NoMatchingInitializer";
        case ResolutionErrorKind::AmbiguousInitializer: return "AmbiguousInitializer";
        case ResolutionErrorKind::InaccessibleInitializer: return "InaccessibleInitializer";
        case ResolutionErrorKind::TrailingClosureNotAllowed: return "TrailingClosureNotAllowed";
        case ResolutionErrorKind::ArgumentTypeMismatch: return "ArgumentTypeMismatch";
    }
    return "Unknown";
}

static void joinIndices(std::ostringstream& oss, const char* what, const std::vector<size_t>& indices) {
    if (indices.empty()) return;
    oss << " " << what << "=[";
    for (size_t i = 0; i < indices.size(); ++i) {
        if (i > 0) oss << ",";
        oss << indices[i];
    }
    oss << "]";
}

std::string ResolutionError::toString() const {
    std::ostringstream oss;
    oss << errorKindToString(kind);
    joinIndices(oss, "params", parameterIndices);
    joinIndices(oss, "args", argumentIndices);
    if (!ownerType.isError()) {
        oss << " owner=" << ownerType.toString();
    }
    if (!expectedType.isError()) {
        oss << " expected=" << expectedType.toString();
    }
    for (const auto& candidate : candidates) {
        oss << " candidate=" << candidate.getDisplayName();
    }
    return oss.str();
}

ResolutionResult ResolutionResult::notApplicable(model::ArgumentList arguments) {
    ResolutionResult result(Kind::NotApplicable);
    result.remainder_ = std::move(arguments);
    return result;
}

ResolutionResult ResolutionResult::direct(const model::CallArgument& argument, model::ArgumentList remainder) {
    ResolutionResult result(Kind::Direct);
    result.directArgument_ = argument;
    result.remainder_ = std::move(remainder);
    return result;
}

ResolutionResult ResolutionResult::defaulted(model::ArgumentList remainder) {
    ResolutionResult result(Kind::Defaulted);
    result.remainder_ = std::move(remainder);
    return result;
}

ResolutionResult ResolutionResult::constructed(const model::ConstructorCandidate& candidate,
                                               model::ArgumentList expansionSpan,
                                               model::ArgumentList remainder) {
    ResolutionResult result(Kind::Constructed);
    result.constructor_ = candidate;
    result.expansionSpan_ = std::move(expansionSpan);
    result.remainder_ = std::move(remainder);
    return result;
}

ResolutionResult ResolutionResult::failure(const ResolutionError& error) {
    ResolutionResult result(Kind::Error);
    result.error_ = error;
    return result;
}

std::string ResolutionResult::toString() const {
    std::ostringstream oss;
    switch (kind_) {
        case Kind::NotApplicable:
            oss << "NotApplicable";
            break;
        case Kind::Direct:
            oss << "Direct(" << (directArgument_.value ? directArgument_.value->toString() : "") << ")";
            break;
        case Kind::Defaulted:
            oss << "Defaulted";
            break;
        case Kind::Constructed:
            oss << "Constructed(" << constructor_.getDisplayName() << ", "
                << model::labelShape(expansionSpan_) << ")";
            break;
        case Kind::Error:
            oss << "Error(" << error_.toString() << ")";
            break;
    }
    if (kind_ != Kind::Error && !remainder_.empty()) {
        oss << " remainder=" << model::labelShape(remainder_);
    }
    return oss.str();
}

bool ResolutionResult::operator==(const ResolutionResult& other) const {
    if (kind_ != other.kind_) {
        return false;
    }
    switch (kind_) {
        case Kind::Direct:
            return directArgument_ == other.directArgument_ && remainder_ == other.remainder_;
        case Kind::Constructed:
            return constructor_ == other.constructor_ &&
                   expansionSpan_ == other.expansionSpan_ &&
                   remainder_ == other.remainder_;
        case Kind::Error:
            return error_.kind == other.error_.kind &&
                   error_.parameterIndices == other.error_.parameterIndices &&
                   error_.argumentIndices == other.error_.argumentIndices &&
                   error_.candidates == other.error_.candidates;
        default:
            return remainder_ == other.remainder_;
    }
}

} // namespace semantic
} // namespace expanse
