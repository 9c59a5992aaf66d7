#include "expanse/semantic/signature_validator.h"

namespace expanse {
namespace semantic {

namespace {

ResolutionError makeError(ResolutionErrorKind kind, size_t paramIndex) {
    ResolutionError error(kind);
    error.parameterIndices.push_back(paramIndex);
    return error;
}

} // namespace

std::vector<ResolutionError> SignatureValidator::validate(const model::Signature& signature) const {
    std::vector<ResolutionError> errors;
    if (!signature.hasExpandedParameter()) {
        return errors;
    }

    typedef void (SignatureValidator::*Rule)(const model::Signature&, std::vector<ResolutionError>&) const;
    static const Rule rules[] = {
        &SignatureValidator::checkPlacement,
        &SignatureValidator::checkUniqueness,
        &SignatureValidator::checkNoOverloads,
        &SignatureValidator::checkNominalType,
        &SignatureValidator::checkNotAbstract,
        &SignatureValidator::checkNotByReference,
        &SignatureValidator::checkDefaultAdjacency,
    };

    for (Rule rule : rules) {
        (this->*rule)(signature, errors);
        if (options_.stopAtFirstViolation && !errors.empty()) {
            break;
        }
    }
    return errors;
}

void SignatureValidator::checkPlacement(const model::Signature& signature, std::vector<ResolutionError>& out) const {
    for (const auto& param : signature.getParameters()) {
        if (param.isExpanded && param.positionalIndex != 0) {
            out.push_back(makeError(ResolutionErrorKind::InvalidExpandedPlacement, param.positionalIndex));
        }
    }
}

void SignatureValidator::checkUniqueness(const model::Signature& signature, std::vector<ResolutionError>& out) const {
    if (signature.countExpandedParameters() <= 1) {
        return;
    }
    ResolutionError error(ResolutionErrorKind::MultipleExpandedParameters);
    for (const auto& param : signature.getParameters()) {
        if (param.isExpanded) {
            error.parameterIndices.push_back(param.positionalIndex);
        }
    }
    out.push_back(error);
}

void SignatureValidator::checkNoOverloads(const model::Signature& signature, std::vector<ResolutionError>& out) const {
    const model::ParameterDeclaration* expanded = signature.getExpandedParameter();
    if (expanded && signature.hasSiblingOverloads()) {
        out.push_back(makeError(ResolutionErrorKind::OverloadConflictWithExpanded, expanded->positionalIndex));
    }
}

void SignatureValidator::checkNominalType(const model::Signature& signature, std::vector<ResolutionError>& out) const {
    for (const auto& param : signature.getParameters()) {
        if (!param.isExpanded) {
            continue;
        }
        // Optional<T> is itself a nominal wrapper; unresolved or erroneous
        // types were already diagnosed by name lookup.
        if (param.declaredType.isStructural()) {
            ResolutionError error = makeError(ResolutionErrorKind::NonNominalExpandedType, param.positionalIndex);
            error.ownerType = param.declaredType;
            out.push_back(error);
        }
    }
}

void SignatureValidator::checkNotAbstract(const model::Signature& signature, std::vector<ResolutionError>& out) const {
    for (const auto& param : signature.getParameters()) {
        if (param.isExpanded && param.declaredType.isInterface()) {
            ResolutionError error = makeError(ResolutionErrorKind::AbstractTypeNotExpandable, param.positionalIndex);
            error.ownerType = param.declaredType;
            out.push_back(error);
        }
    }
}

void SignatureValidator::checkNotByReference(const model::Signature& signature, std::vector<ResolutionError>& out) const {
    for (const auto& param : signature.getParameters()) {
        if (param.isExpanded && param.isByReference) {
            out.push_back(makeError(ResolutionErrorKind::ByReferenceExpandedConflict, param.positionalIndex));
        }
    }
}

void SignatureValidator::checkDefaultAdjacency(const model::Signature& signature, std::vector<ResolutionError>& out) const {
    if (!signature.hasExpandedParameter()) {
        return;
    }
    // Checked at index 1 even when the expanded parameter is misplaced, so
    // both violations are reported together.
    const model::ParameterDeclaration* next = signature.getParameterAt(1);
    if (!next || next->isExpanded || !next->hasDefaultValue) {
        return;
    }
    size_t lastIndex = 0;
    for (const auto& param : signature.getParameters()) {
        if (param.positionalIndex > lastIndex) {
            lastIndex = param.positionalIndex;
        }
    }
    if (next->positionalIndex != lastIndex) {
        out.push_back(makeError(ResolutionErrorKind::DefaultArgumentAdjacencyViolation, next->positionalIndex));
    }
}

} // namespace semantic
} // namespace expanse
