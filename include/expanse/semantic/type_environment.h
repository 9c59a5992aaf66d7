#pragma once

#include "expanse/model/constructor.h"
#include "expanse/model/context.h"
#include "expanse/model/types.h"
#include "expanse/source_location.h"
#include <map>
#include <string>
#include <vector>

namespace expanse {
namespace semantic {

// Kinds of nominal declarations
enum class TypeDeclKind {
    Builtin,
    Struct,
    Class,
    Interface
};

struct TypeDecl {
    std::string name;
    TypeDeclKind kind = TypeDeclKind::Struct;
    std::string supertype;  // classes only; empty if none
    model::SiteContext declaredAt;
    SourceLocation location;

    bool isAbstract() const { return kind == TypeDeclKind::Interface; }
};

// Registry of nominal types and the constructors declared on them (in the
// type body or in extensions). Written while declarations are collected,
// read-only afterwards, so concurrent readers need no locking.
class TypeEnvironment {
public:
    TypeEnvironment();

    // Int, Float, Bool and String with no constructors
    void declareBuiltins();

    // Returns false if a type with this name already exists
    bool declareType(const TypeDecl& decl);

    const TypeDecl* lookupType(const std::string& name) const;
    bool hasType(const std::string& name) const { return lookupType(name) != nullptr; }

    // Adds a constructor declared directly on `typeName`; bumps the type's
    // generation. Returns false if the type is unknown.
    bool addConstructor(const std::string& typeName, const model::ConstructorCandidate& candidate);

    // Constructors declared directly on the type, in declaration order
    std::vector<model::ConstructorCandidate> getDeclaredConstructors(const std::string& typeName) const;

    // Changes whenever the type's constructor set changes
    size_t getGeneration(const std::string& typeName) const;

    // Reflexive, follows the superclass chain
    bool isSubclass(const std::string& derived, const std::string& base) const;

    // Binds Unresolved names to Nominal/Interface types. Unknown names become
    // error types and are appended to `unknownNames`.
    model::TypeRef resolve(const model::TypeRef& type, std::vector<std::string>& unknownNames) const;

    // The TypeRef naming a declared type
    model::TypeRef typeFor(const std::string& name) const;

private:
    std::map<std::string, TypeDecl> types_;
    std::map<std::string, std::vector<model::ConstructorCandidate>> constructors_;
    std::map<std::string, size_t> generations_;
};

} // namespace semantic
} // namespace expanse
