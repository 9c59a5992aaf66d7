#pragma once

#include "expanse/model/call.h"
#include "expanse/model/constructor.h"
#include "expanse/model/context.h"
#include "expanse/model/expressions.h"
#include "expanse/model/signature.h"
#include "expanse/model/types.h"
#include <string>
#include <vector>

// Small builders shared by the engine tests
namespace testutil {

using namespace expanse;

inline model::SiteContext site(size_t ordinal,
                               const std::string& module = "main",
                               const std::string& file = "main.xp",
                               const std::string& scope = "") {
    return model::SiteContext(module, file, scope, ordinal);
}

inline model::ExprPtr intLit(const std::string& text = "1") {
    return model::makeLiteral(SourceLocation(1, 1), model::Expression::Kind::IntLiteral, text);
}

inline model::ExprPtr floatLit(const std::string& text = "1.5") {
    return model::makeLiteral(SourceLocation(1, 1), model::Expression::Kind::FloatLiteral, text);
}

inline model::ExprPtr boolLit(const std::string& text = "true") {
    return model::makeLiteral(SourceLocation(1, 1), model::Expression::Kind::BoolLiteral, text);
}

inline model::ExprPtr stringLit(const std::string& text = "s") {
    return model::makeLiteral(SourceLocation(1, 1), model::Expression::Kind::StringLiteral, text);
}

inline model::ExprPtr nilLit() {
    return model::makeLiteral(SourceLocation(1, 1), model::Expression::Kind::NilLiteral, "nil");
}

inline model::ExprPtr closure(const std::string& body = "") {
    return model::makeClosure(SourceLocation(1, 1), body);
}

inline model::ExprPtr ref(const std::string& name, const model::TypeRef& type) {
    return model::makeReference(SourceLocation(1, 1), name, type);
}

inline model::CallArgument arg(const std::string& label, model::ExprPtr value) {
    return model::CallArgument(label, value);
}

inline model::CallArgument trailing(model::ExprPtr value) {
    return model::CallArgument("", value, true);
}

inline model::TypeRef named(const std::string& name) {
    return model::TypeRef::nominal(name);
}

inline model::ParameterDeclaration param(const std::string& label,
                                         size_t index,
                                         const model::TypeRef& type,
                                         bool expanded = false,
                                         bool hasDefault = false,
                                         bool byReference = false) {
    model::ParameterDeclaration p;
    p.label = label;
    p.positionalIndex = index;
    p.declaredType = type;
    p.isExpanded = expanded;
    p.hasDefaultValue = hasDefault;
    p.isByReference = byReference;
    if (hasDefault) {
        p.defaultValue = intLit("0");
    }
    return p;
}

inline model::Signature signature(const std::string& name,
                                  std::vector<model::ParameterDeclaration> params,
                                  bool hasSiblings = false,
                                  size_t ordinal = 100) {
    return model::Signature(name, std::move(params), hasSiblings, site(ordinal));
}

inline model::ConstructorCandidate ctor(const std::string& typeName,
                                        const std::vector<std::string>& labels,
                                        const std::vector<model::TypeRef>& types,
                                        size_t ordinal,
                                        model::VisibilityLevel visibility = model::VisibilityLevel::Internal,
                                        const std::string& module = "main") {
    model::ConstructorCandidate c;
    c.owningType = model::TypeRef::nominal(typeName);
    c.parameterLabels = labels;
    c.parameterTypes = types;
    c.visibility = visibility;
    c.declaringModule = module;
    c.declaredAt = site(ordinal, module, "main.xp", typeName);
    c.location = SourceLocation(ordinal, 1, "main.xp");
    return c;
}

} // namespace testutil
