#pragma once

#include "expanse/model/signature.h"
#include "expanse/semantic/resolution_result.h"
#include <vector>

namespace expanse {
namespace semantic {

struct ValidatorOptions {
    // Stop at the first violated rule instead of collecting all of them
    bool stopAtFirstViolation = false;
};

// Call-site independent legality rules for signatures with an expanded
// parameter. Runs once per declared callable.
class SignatureValidator {
public:
    SignatureValidator(ValidatorOptions options = ValidatorOptions())
        : options_(options) {}

    // Empty result means the signature is legal
    std::vector<ResolutionError> validate(const model::Signature& signature) const;

    // Individual rules (public for testing). Each appends its violations.
    void checkPlacement(const model::Signature& signature, std::vector<ResolutionError>& out) const;
    void checkUniqueness(const model::Signature& signature, std::vector<ResolutionError>& out) const;
    void checkNoOverloads(const model::Signature& signature, std::vector<ResolutionError>& out) const;
    void checkNominalType(const model::Signature& signature, std::vector<ResolutionError>& out) const;
    void checkNotAbstract(const model::Signature& signature, std::vector<ResolutionError>& out) const;
    void checkNotByReference(const model::Signature& signature, std::vector<ResolutionError>& out) const;
    void checkDefaultAdjacency(const model::Signature& signature, std::vector<ResolutionError>& out) const;

private:
    ValidatorOptions options_;
};

} // namespace semantic
} // namespace expanse
