#include "expanse/semantic/diagnostics.h"
#include <sstream>

namespace expanse {
namespace semantic {

ErrorCode errorCodeFor(ResolutionErrorKind kind) {
    switch (kind) {
        case ResolutionErrorKind::InvalidExpandedPlacement:
            return ErrorCode(ErrorCodes::INVALID_EXPANDED_PLACEMENT, "expansion");
        case ResolutionErrorKind::MultipleExpandedParameters:
            return ErrorCode(ErrorCodes::MULTIPLE_EXPANDED_PARAMETERS, "expansion");
        case ResolutionErrorKind::OverloadConflictWithExpanded:
            return ErrorCode(ErrorCodes::OVERLOAD_CONFLICT_WITH_EXPANDED, "expansion");
        case ResolutionErrorKind::NonNominalExpandedType:
            return ErrorCode(ErrorCodes::NON_NOMINAL_EXPANDED_TYPE, "expansion");
        case ResolutionErrorKind::AbstractTypeNotExpandable:
            return ErrorCode(ErrorCodes::ABSTRACT_TYPE_NOT_EXPANDABLE, "expansion");
        case ResolutionErrorKind::ByReferenceExpandedConflict:
            return ErrorCode(ErrorCodes::BY_REFERENCE_EXPANDED_CONFLICT, "expansion");
        case ResolutionErrorKind::DefaultArgumentAdjacencyViolation:
            return ErrorCode(ErrorCodes::DEFAULT_ARGUMENT_ADJACENCY, "expansion");
        case ResolutionErrorKind::NoMatchingInitializer:
            return ErrorCode(ErrorCodes::NO_MATCHING_INITIALIZER, "resolution");
        case ResolutionErrorKind::AmbiguousInitializer:
            return ErrorCode(ErrorCodes::AMBIGUOUS_INITIALIZER, "resolution");
        case ResolutionErrorKind::InaccessibleInitializer:
            return ErrorCode(ErrorCodes::INACCESSIBLE_INITIALIZER, "resolution");
        case ResolutionErrorKind::TrailingClosureNotAllowed:
            return ErrorCode(ErrorCodes::TRAILING_CLOSURE_NOT_ALLOWED, "resolution");
        case ResolutionErrorKind::ArgumentTypeMismatch:
            return ErrorCode(ErrorCodes::ARGUMENT_TYPE_MISMATCH, "type");
    }
    return ErrorCode(ErrorCodes::NO_MATCHING_INITIALIZER, "resolution");
}

namespace {

std::string paramName(const model::ParameterDeclaration& param) {
    return param.label.empty() ? std::string("_") : param.label;
}

const model::ParameterDeclaration* firstParam(const model::Signature& signature, const ResolutionError& error) {
    if (error.parameterIndices.empty()) {
        return nullptr;
    }
    return signature.getParameterAt(error.parameterIndices.front());
}

SourceLocation argEnd(const model::CallArgument& arg) {
    SourceLocation end = arg.value ? arg.value->getLocation() : arg.location;
    size_t width = arg.value ? arg.value->toString().size() : 1;
    end.setColumn(end.getColumn() + width);
    return end;
}

ArgumentMark markFor(const model::CallArgument& arg) {
    SourceLocation end = argEnd(arg);
    if (end.getLine() == arg.location.getLine() && end.getColumn() > arg.location.getColumn()) {
        return ArgumentMark(arg.location, end.getColumn() - arg.location.getColumn());
    }
    // Label and value on different lines: underline the value
    if (arg.value) {
        return ArgumentMark(arg.value->getLocation(), arg.value->toString().size());
    }
    return ArgumentMark(arg.location, 1);
}

// Underline the offending arguments, or the callee when none is involved
void reportAt(ErrorReporter& reporter, const std::vector<ArgumentMark>& marks,
              const SourceLocation& callLocation, const std::string& message, const ErrorCode& code) {
    if (marks.empty()) {
        reporter.error(callLocation, message, code);
    } else {
        reporter.errorAtArguments(marks, message, code);
    }
}

void noteCandidates(ErrorReporter& reporter, const std::vector<model::ConstructorCandidate>& candidates,
                    const char* prefix) {
    for (const auto& candidate : candidates) {
        reporter.addNote(std::string(prefix) + candidate.getSignatureString() +
                         " (" + model::visibilityToString(candidate.visibility) +
                         ", declared at " + candidate.location.toString() + ")");
    }
}

} // namespace

void reportSignatureErrors(ErrorReporter& reporter,
                           const model::Signature& signature,
                           const std::vector<ResolutionError>& errors) {
    for (const auto& error : errors) {
        const model::ParameterDeclaration* param = firstParam(signature, error);
        SourceLocation loc = param ? param->location : signature.getLocation();
        const std::string name = param ? paramName(*param) : std::string("?");
        ErrorCode code = errorCodeFor(error.kind);

        switch (error.kind) {
            case ResolutionErrorKind::InvalidExpandedPlacement:
                reporter.error(loc, "expanded parameter '" + name + "' of '" + signature.getName() +
                               "' must be the first parameter", code);
                reporter.addHelp("move the '@expanded' parameter to the front of the parameter list");
                break;
            case ResolutionErrorKind::MultipleExpandedParameters: {
                std::ostringstream msg;
                msg << "'" << signature.getName() << "' declares " << error.parameterIndices.size()
                    << " expanded parameters; at most one is allowed";
                reporter.error(loc, msg.str(), code);
                for (size_t i = 1; i < error.parameterIndices.size(); ++i) {
                    const model::ParameterDeclaration* other = signature.getParameterAt(error.parameterIndices[i]);
                    if (other) {
                        reporter.addNote("also marked '@expanded': '" + paramName(*other) +
                                         "' at " + other->location.toString());
                    }
                }
                break;
            }
            case ResolutionErrorKind::OverloadConflictWithExpanded:
                reporter.error(signature.getLocation(), "'" + signature.getName() +
                               "' has an expanded parameter and cannot be overloaded", code);
                reporter.addNote("a function with an '@expanded' parameter must be the only function with its name");
                break;
            case ResolutionErrorKind::NonNominalExpandedType:
                reporter.error(loc, "type '" + error.ownerType.toString() +
                               "' of expanded parameter '" + name + "' is not a nominal type", code);
                reporter.addNote("function and tuple types have no initializers to expand into");
                break;
            case ResolutionErrorKind::AbstractTypeNotExpandable:
                reporter.error(loc, "expanded parameter '" + name + "' has interface type '" +
                               error.ownerType.toString() + "'", code);
                reporter.addNote("the concrete type to initialize is not known statically");
                break;
            case ResolutionErrorKind::ByReferenceExpandedConflict:
                reporter.error(loc, "expanded parameter '" + name + "' cannot be 'inout'", code);
                reporter.addNote("an expanded argument is a newly constructed value and cannot alias an existing one");
                break;
            case ResolutionErrorKind::DefaultArgumentAdjacencyViolation:
                reporter.error(loc, "defaulted parameter '" + name +
                               "' directly follows an expanded parameter", code);
                reporter.addHelp("move the defaulted parameter to the end of the parameter list");
                break;
            default:
                reporter.error(loc, std::string("invalid signature: ") + errorKindToString(error.kind), code);
                break;
        }
    }
}

void reportCallError(ErrorReporter& reporter,
                     const ResolutionError& error,
                     const model::Signature& signature,
                     const model::ArgumentList& arguments,
                     const SourceLocation& callLocation) {
    ErrorCode code = errorCodeFor(error.kind);
    const std::string owner = error.ownerType.toString();

    model::ArgumentList involved;
    std::vector<ArgumentMark> marks;
    for (size_t index : error.argumentIndices) {
        if (index < arguments.size()) {
            involved.push_back(arguments[index]);
            marks.push_back(markFor(arguments[index]));
        }
    }

    switch (error.kind) {
        case ResolutionErrorKind::NoMatchingInitializer:
            reportAt(reporter, marks, callLocation,
                     "no initializer of '" + owner + "' matches the arguments " +
                     model::labelShape(involved) + " passed to '" + signature.getName() + "'", code);
            if (error.candidates.empty()) {
                reporter.addNote("'" + owner + "' has no initializers visible where '" +
                                 signature.getName() + "' is declared");
            }
            noteCandidates(reporter, error.candidates, "candidate: ");
            if (error.ownerType.isOptional()) {
                reporter.addNote("initializers are looked up on '" + std::string(model::kOptionalDeclName) +
                                 "', not on '" + error.ownerType.getWrapped().toString() + "'");
            }
            break;
        case ResolutionErrorKind::AmbiguousInitializer:
            reportAt(reporter, marks, callLocation, "ambiguous use of initializer of '" + owner + "'", code);
            noteCandidates(reporter, error.candidates, "found this candidate: ");
            break;
        case ResolutionErrorKind::InaccessibleInitializer: {
            std::string what = error.candidates.empty()
                ? std::string("initializer")
                : "'" + error.candidates.front().getDisplayName() + "'";
            std::string level = error.candidates.empty()
                ? std::string("its")
                : "'" + std::string(model::visibilityToString(error.candidates.front().visibility)) + "'";
            reportAt(reporter, marks, callLocation, what + " is inaccessible due to " + level + " protection level", code);
            noteCandidates(reporter, error.candidates, "declared here: ");
            break;
        }
        case ResolutionErrorKind::TrailingClosureNotAllowed:
            reportAt(reporter, marks, callLocation,
                     "trailing closure cannot be part of the arguments expanded into '" + owner + "'", code);
            reporter.addHelp("pass the closure as a labeled argument inside the parentheses");
            break;
        case ResolutionErrorKind::ArgumentTypeMismatch: {
            std::string value = involved.empty() || !involved.front().value
                ? std::string("argument")
                : "'" + involved.front().value->toString() + "'";
            reportAt(reporter, marks, callLocation, "cannot convert " + value + " to expected argument type '" +
                     error.expectedType.toString() + "'", code);
            noteCandidates(reporter, error.candidates, "in call to ");
            break;
        }
        default:
            reporter.error(callLocation, std::string("cannot resolve call to '") + signature.getName() +
                           "': " + errorKindToString(error.kind), code);
            break;
    }
}

} // namespace semantic
} // namespace expanse
