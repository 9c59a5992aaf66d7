#pragma once

#include "expanse/model/types.h"
#include "expanse/source_location.h"
#include <memory>
#include <string>

namespace expanse {
namespace model {

// Argument expression as written at a call site. The engine never evaluates
// expressions; it only asks the type-check oracle whether one fits a type.
class Expression {
public:
    enum class Kind {
        IntLiteral,
        FloatLiteral,
        BoolLiteral,
        StringLiteral,
        NilLiteral,
        Reference,  // named value; bound type filled in by elaboration
        Closure
    };

    Expression(const SourceLocation& location, Kind kind, const std::string& text)
        : location_(location), kind_(kind), text_(text), boundType_(TypeRef::error()) {}

    Expression(const SourceLocation& location, const std::string& name, const TypeRef& boundType)
        : location_(location), kind_(Kind::Reference), text_(name), boundType_(boundType) {}

    const SourceLocation& getLocation() const { return location_; }
    Kind getKind() const { return kind_; }
    const std::string& getText() const { return text_; }

    // Declared type of a Reference after elaboration (error type otherwise)
    const TypeRef& getBoundType() const { return boundType_; }

    bool isLiteral() const { return kind_ != Kind::Reference && kind_ != Kind::Closure; }

    std::string toString() const;

    bool operator==(const Expression& other) const {
        return kind_ == other.kind_ && text_ == other.text_ && boundType_ == other.boundType_;
    }

private:
    SourceLocation location_;
    Kind kind_;
    std::string text_;
    TypeRef boundType_;
};

using ExprPtr = std::shared_ptr<const Expression>;

ExprPtr makeLiteral(const SourceLocation& location, Expression::Kind kind, const std::string& text);
ExprPtr makeReference(const SourceLocation& location, const std::string& name, const TypeRef& boundType);
ExprPtr makeClosure(const SourceLocation& location, const std::string& body);

} // namespace model
} // namespace expanse
