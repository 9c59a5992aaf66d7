#pragma once

#include "expanse/model/call.h"
#include "expanse/model/signature.h"
#include "expanse/semantic/resolution_result.h"
#include <vector>

namespace expanse {
namespace semantic {

class TypeCheckOracle;

// A problem found by ordinary argument-to-parameter matching
struct ArgumentIssue {
    enum class Kind {
        TypeMismatch,
        LabelMismatch,
        MissingArgument,
        ExtraArgument
    };

    Kind kind;
    model::CallArgument argument;          // unset for MissingArgument
    model::ParameterDeclaration parameter; // unset for ExtraArgument

    explicit ArgumentIssue(Kind k) : kind(k) {}
};

// Matches arguments positionally against a signature's parameters by label,
// skipping defaulted parameters the arguments do not name. This is the
// host's ordinary call checking that runs on whatever the expansion engine
// leaves over.
class ArgumentMatcher {
public:
    ArgumentMatcher(const TypeCheckOracle& typeCheck) : typeCheck_(typeCheck) {}

    // Every parameter except `skipped` takes part
    std::vector<ArgumentIssue> match(const model::Signature& signature,
                                     const model::ArgumentList& arguments,
                                     const model::ParameterDeclaration* skipped = nullptr) const;

    // Checks a successful resolution: the remainder against the parameters
    // other than the expanded one, and a Direct argument against the
    // expanded parameter's type.
    std::vector<ArgumentIssue> matchResult(const model::Signature& signature,
                                           const ResolutionResult& result) const;

private:
    const TypeCheckOracle& typeCheck_;

    bool accepts(const model::CallArgument& argument, const model::ParameterDeclaration& parameter) const;
};

const char* issueKindToString(ArgumentIssue::Kind kind);

} // namespace semantic
} // namespace expanse
