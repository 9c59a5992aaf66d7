#include "expanse/semantic/oracles.h"
#include "expanse/semantic/type_environment.h"

namespace expanse {
namespace semantic {

bool AccessControlOracle::isVisible(const model::ConstructorCandidate& declaration,
                                    const model::SiteContext& from) const {
    const model::SiteContext& at = declaration.declaredAt;
    switch (declaration.visibility) {
        case model::VisibilityLevel::Public:
            return true;
        case model::VisibilityLevel::Internal:
            return declaration.declaringModule == from.module;
        case model::VisibilityLevel::FilePrivate:
            return declaration.declaringModule == from.module && at.file == from.file;
        case model::VisibilityLevel::Private:
            return declaration.declaringModule == from.module &&
                   at.file == from.file &&
                   at.scope == from.scope;
    }
    return false;
}

namespace {

bool isNamed(const model::TypeRef& type, const char* name) {
    return type.isNominal() && type.getName() == name;
}

} // namespace

bool LiteralTypeOracle::literalFits(const model::Expression& expression,
                                    const model::TypeRef& expectedType) const {
    switch (expression.getKind()) {
        case model::Expression::Kind::IntLiteral:
            return isNamed(expectedType, "Int") || isNamed(expectedType, "Float");
        case model::Expression::Kind::FloatLiteral:
            return isNamed(expectedType, "Float");
        case model::Expression::Kind::BoolLiteral:
            return isNamed(expectedType, "Bool");
        case model::Expression::Kind::StringLiteral:
            return isNamed(expectedType, "String");
        case model::Expression::Kind::NilLiteral:
            return expectedType.isOptional();
        case model::Expression::Kind::Closure:
            return expectedType.isFunction();
        case model::Expression::Kind::Reference:
            return isAssignable(expression.getBoundType(), expectedType);
    }
    return false;
}

bool LiteralTypeOracle::typeChecks(const model::Expression& expression,
                                   const model::TypeRef& expectedType) const {
    if (expectedType.containsError()) {
        return false;
    }
    if (literalFits(expression, expectedType)) {
        return true;
    }
    // Implicit promotion into an optional
    if (expectedType.isOptional()) {
        return typeChecks(expression, expectedType.getWrapped());
    }
    return false;
}

bool LiteralTypeOracle::isAssignable(const model::TypeRef& from, const model::TypeRef& to) const {
    if (from.containsError() || to.containsError()) {
        return false;
    }
    if (from == to) {
        return true;
    }
    // Superclass chain; an interface named as supertype counts as conformance
    if (from.isNominal() && (to.isNominal() || to.isInterface())) {
        return environment_.isSubclass(from.getName(), to.getName());
    }
    if (to.isOptional()) {
        if (from.isOptional()) {
            return isAssignable(from.getWrapped(), to.getWrapped());
        }
        return isAssignable(from, to.getWrapped());
    }
    return false;
}

} // namespace semantic
} // namespace expanse
