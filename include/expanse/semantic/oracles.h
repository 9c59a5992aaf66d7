#pragma once

#include "expanse/model/constructor.h"
#include "expanse/model/context.h"
#include "expanse/model/expressions.h"
#include "expanse/model/types.h"

namespace expanse {
namespace semantic {

class TypeEnvironment;

// Answers "is this declaration visible from that site?"
class VisibilityOracle {
public:
    virtual ~VisibilityOracle() = default;
    virtual bool isVisible(const model::ConstructorCandidate& declaration,
                           const model::SiteContext& from) const = 0;
};

// Answers "does this expression type-check against that type?"
class TypeCheckOracle {
public:
    virtual ~TypeCheckOracle() = default;
    virtual bool typeChecks(const model::Expression& expression,
                            const model::TypeRef& expectedType) const = 0;
};

// public: everywhere; internal: same module; fileprivate: same module and
// file; private: same module, file and enclosing scope.
class AccessControlOracle : public VisibilityOracle {
public:
    bool isVisible(const model::ConstructorCandidate& declaration,
                   const model::SiteContext& from) const override;
};

// Literal and reference typing over a TypeEnvironment
class LiteralTypeOracle : public TypeCheckOracle {
public:
    LiteralTypeOracle(const TypeEnvironment& environment)
        : environment_(environment) {}

    bool typeChecks(const model::Expression& expression,
                    const model::TypeRef& expectedType) const override;

    // Can a value of type `from` be passed where `to` is expected?
    bool isAssignable(const model::TypeRef& from, const model::TypeRef& to) const;

private:
    const TypeEnvironment& environment_;

    bool literalFits(const model::Expression& expression, const model::TypeRef& expectedType) const;
};

} // namespace semantic
} // namespace expanse
