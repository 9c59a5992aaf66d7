#include "expanse/semantic/argument_matcher.h"
#include "expanse/semantic/oracles.h"

namespace expanse {
namespace semantic {

const char* issueKindToString(ArgumentIssue::Kind kind) {
    switch (kind) {
        case ArgumentIssue::Kind::TypeMismatch: return "TypeMismatch";
        case ArgumentIssue::Kind::LabelMismatch: return "LabelMismatch";
        case ArgumentIssue::Kind::MissingArgument: return "MissingArgument";
        case ArgumentIssue::Kind::ExtraArgument: return "ExtraArgument";
    }
    return "Unknown";
}

bool ArgumentMatcher::accepts(const model::CallArgument& argument,
                              const model::ParameterDeclaration& parameter) const {
    return argument.value && typeCheck_.typeChecks(*argument.value, parameter.declaredType);
}

std::vector<ArgumentIssue> ArgumentMatcher::match(const model::Signature& signature,
                                                  const model::ArgumentList& arguments,
                                                  const model::ParameterDeclaration* skipped) const {
    std::vector<const model::ParameterDeclaration*> params;
    for (const auto& param : signature.getParameters()) {
        if (skipped && param.positionalIndex == skipped->positionalIndex) {
            continue;
        }
        params.push_back(&param);
    }

    std::vector<ArgumentIssue> issues;
    size_t next = 0;

    for (size_t p = 0; p < params.size(); ++p) {
        const model::ParameterDeclaration& param = *params[p];

        if (next < arguments.size() &&
            (arguments[next].label == param.label || arguments[next].isTrailingClosureForm)) {
            if (!accepts(arguments[next], param)) {
                ArgumentIssue issue(ArgumentIssue::Kind::TypeMismatch);
                issue.argument = arguments[next];
                issue.parameter = param;
                issues.push_back(issue);
            }
            ++next;
            continue;
        }

        if (param.hasDefaultValue) {
            continue;
        }

        // An argument naming a later parameter means this one was left out
        bool namesLaterParameter = false;
        if (next < arguments.size()) {
            for (size_t q = p + 1; q < params.size(); ++q) {
                if (params[q]->label == arguments[next].label) {
                    namesLaterParameter = true;
                    break;
                }
            }
        }

        if (next < arguments.size() && !namesLaterParameter) {
            ArgumentIssue issue(ArgumentIssue::Kind::LabelMismatch);
            issue.argument = arguments[next];
            issue.parameter = param;
            issues.push_back(issue);
            ++next;
            continue;
        }

        ArgumentIssue issue(ArgumentIssue::Kind::MissingArgument);
        issue.parameter = param;
        issues.push_back(issue);
    }

    for (; next < arguments.size(); ++next) {
        ArgumentIssue issue(ArgumentIssue::Kind::ExtraArgument);
        issue.argument = arguments[next];
        issues.push_back(issue);
    }
    return issues;
}

std::vector<ArgumentIssue> ArgumentMatcher::matchResult(const model::Signature& signature,
                                                        const ResolutionResult& result) const {
    if (result.isError()) {
        return std::vector<ArgumentIssue>();
    }

    const model::ParameterDeclaration* expanded = signature.getExpandedParameter();
    std::vector<ArgumentIssue> issues = match(signature, result.getRemainder(), expanded);

    if (result.isDirect() && expanded && !accepts(result.getDirectArgument(), *expanded)) {
        ArgumentIssue issue(ArgumentIssue::Kind::TypeMismatch);
        issue.argument = result.getDirectArgument();
        issue.parameter = *expanded;
        issues.insert(issues.begin(), issue);
    }
    return issues;
}

} // namespace semantic
} // namespace expanse
