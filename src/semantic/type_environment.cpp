#include "expanse/semantic/type_environment.h"
#include <set>

namespace expanse {
namespace semantic {

namespace {
const char* const kBuiltinTypes[] = {"Int", "Float", "Bool", "String"};
}

TypeEnvironment::TypeEnvironment() = default;

void TypeEnvironment::declareBuiltins() {
    for (const char* name : kBuiltinTypes) {
        TypeDecl decl;
        decl.name = name;
        decl.kind = TypeDeclKind::Builtin;
        decl.declaredAt = model::SiteContext("builtin", "<builtin>", "", 0);
        decl.location = SourceLocation(0, 0, "<builtin>");
        declareType(decl);
    }
}

bool TypeEnvironment::declareType(const TypeDecl& decl) {
    if (types_.count(decl.name) > 0) {
        return false;
    }
    types_[decl.name] = decl;
    constructors_[decl.name] = std::vector<model::ConstructorCandidate>();
    generations_[decl.name] = 0;
    return true;
}

const TypeDecl* TypeEnvironment::lookupType(const std::string& name) const {
    auto it = types_.find(name);
    if (it != types_.end()) {
        return &it->second;
    }
    return nullptr;
}

bool TypeEnvironment::addConstructor(const std::string& typeName, const model::ConstructorCandidate& candidate) {
    auto it = constructors_.find(typeName);
    if (it == constructors_.end()) {
        return false;
    }
    it->second.push_back(candidate);
    generations_[typeName]++;
    return true;
}

std::vector<model::ConstructorCandidate> TypeEnvironment::getDeclaredConstructors(const std::string& typeName) const {
    auto it = constructors_.find(typeName);
    if (it == constructors_.end()) {
        return std::vector<model::ConstructorCandidate>();
    }
    return it->second;
}

size_t TypeEnvironment::getGeneration(const std::string& typeName) const {
    auto it = generations_.find(typeName);
    if (it != generations_.end()) {
        return it->second;
    }
    return 0;
}

bool TypeEnvironment::isSubclass(const std::string& derived, const std::string& base) const {
    std::set<std::string> visited;
    std::string current = derived;
    while (!current.empty() && visited.insert(current).second) {
        if (current == base) {
            return true;
        }
        const TypeDecl* decl = lookupType(current);
        if (!decl) {
            return false;
        }
        current = decl->supertype;
    }
    return false;
}

model::TypeRef TypeEnvironment::typeFor(const std::string& name) const {
    const TypeDecl* decl = lookupType(name);
    if (!decl) {
        return model::TypeRef::error();
    }
    if (decl->isAbstract()) {
        return model::TypeRef::interfaceType(name);
    }
    return model::TypeRef::nominal(name);
}

model::TypeRef TypeEnvironment::resolve(const model::TypeRef& type, std::vector<std::string>& unknownNames) const {
    switch (type.getKind()) {
        case model::TypeRef::Kind::Unresolved: {
            model::TypeRef resolved = typeFor(type.getName());
            if (resolved.isError()) {
                unknownNames.push_back(type.getName());
            }
            return resolved;
        }
        case model::TypeRef::Kind::Optional:
            return model::TypeRef::optional(resolve(type.getWrapped(), unknownNames));
        case model::TypeRef::Kind::Function: {
            const auto& args = type.getArgs();
            std::vector<model::TypeRef> params;
            for (size_t i = 0; i + 1 < args.size(); ++i) {
                params.push_back(resolve(args[i], unknownNames));
            }
            model::TypeRef result = args.empty() ? model::TypeRef::error() : resolve(args.back(), unknownNames);
            return model::TypeRef::function(std::move(params), result);
        }
        case model::TypeRef::Kind::Tuple: {
            std::vector<model::TypeRef> elements;
            for (const auto& element : type.getArgs()) {
                elements.push_back(resolve(element, unknownNames));
            }
            return model::TypeRef::tuple(std::move(elements));
        }
        default:
            return type;
    }
}

} // namespace semantic
} // namespace expanse
