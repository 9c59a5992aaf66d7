#include "expanse/model/types.h"
#include <sstream>
#include <utility>

namespace expanse {
namespace model {

const char* const kOptionalDeclName = "Optional";

TypeRef TypeRef::unresolved(const std::string& name) {
    return TypeRef(Kind::Unresolved, name, {});
}

TypeRef TypeRef::nominal(const std::string& name) {
    return TypeRef(Kind::Nominal, name, {});
}

TypeRef TypeRef::interfaceType(const std::string& name) {
    return TypeRef(Kind::Interface, name, {});
}

TypeRef TypeRef::optional(const TypeRef& wrapped) {
    std::vector<TypeRef> args;
    args.push_back(wrapped);
    return TypeRef(Kind::Optional, "", std::move(args));
}

TypeRef TypeRef::function(std::vector<TypeRef> params, const TypeRef& result) {
    params.push_back(result);
    return TypeRef(Kind::Function, "", std::move(params));
}

TypeRef TypeRef::tuple(std::vector<TypeRef> elements) {
    return TypeRef(Kind::Tuple, "", std::move(elements));
}

TypeRef TypeRef::getWrapped() const {
    if (kind_ != Kind::Optional || args_.empty()) {
        return TypeRef::error();
    }
    return args_[0];
}

std::string TypeRef::getDeclName() const {
    switch (kind_) {
        case Kind::Nominal:
        case Kind::Interface:
        case Kind::Unresolved:
            return name_;
        case Kind::Optional:
            return kOptionalDeclName;
        default:
            return "";
    }
}

bool TypeRef::containsUnresolved() const {
    if (kind_ == Kind::Unresolved) {
        return true;
    }
    for (const auto& arg : args_) {
        if (arg.containsUnresolved()) {
            return true;
        }
    }
    return false;
}

bool TypeRef::containsError() const {
    if (kind_ == Kind::Error) {
        return true;
    }
    for (const auto& arg : args_) {
        if (arg.containsError()) {
            return true;
        }
    }
    return false;
}

std::string TypeRef::toString() const {
    std::ostringstream oss;
    switch (kind_) {
        case Kind::Unresolved:
        case Kind::Nominal:
        case Kind::Interface:
            oss << name_;
            break;
        case Kind::Optional: {
            const TypeRef wrapped = getWrapped();
            if (wrapped.isFunction()) {
                oss << "(" << wrapped.toString() << ")?";
            } else {
                oss << wrapped.toString() << "?";
            }
            break;
        }
        case Kind::Function: {
            oss << "(";
            for (size_t i = 0; i + 1 < args_.size(); ++i) {
                if (i > 0) oss << ", ";
                oss << args_[i].toString();
            }
            oss << ") -> ";
            oss << (args_.empty() ? std::string("<error>") : args_.back().toString());
            break;
        }
        case Kind::Tuple: {
            oss << "(";
            for (size_t i = 0; i < args_.size(); ++i) {
                if (i > 0) oss << ", ";
                oss << args_[i].toString();
            }
            oss << ")";
            break;
        }
        case Kind::Error:
            oss << "<error>";
            break;
    }
    return oss.str();
}

bool TypeRef::operator==(const TypeRef& other) const {
    return kind_ == other.kind_ && name_ == other.name_ && args_ == other.args_;
}

bool TypeRef::operator<(const TypeRef& other) const {
    if (kind_ != other.kind_) {
        return kind_ < other.kind_;
    }
    if (name_ != other.name_) {
        return name_ < other.name_;
    }
    return args_ < other.args_;
}

} // namespace model
} // namespace expanse
