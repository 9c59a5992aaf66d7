#include "expanse/model/expressions.h"

namespace expanse {
namespace model {

std::string Expression::toString() const {
    switch (kind_) {
        case Kind::StringLiteral:
            return "\"" + text_ + "\"";
        case Kind::NilLiteral:
            return "nil";
        case Kind::Closure:
            return "{ " + text_ + " }";
        default:
            return text_;
    }
}

ExprPtr makeLiteral(const SourceLocation& location, Expression::Kind kind, const std::string& text) {
    return std::make_shared<const Expression>(location, kind, text);
}

ExprPtr makeReference(const SourceLocation& location, const std::string& name, const TypeRef& boundType) {
    return std::make_shared<const Expression>(location, name, boundType);
}

ExprPtr makeClosure(const SourceLocation& location, const std::string& body) {
    return std::make_shared<const Expression>(location, Expression::Kind::Closure, body);
}

} // namespace model
} // namespace expanse
