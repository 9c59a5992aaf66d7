#pragma once

#include <string>
#include <vector>

namespace expanse {
namespace model {

// Value-semantics reference to a type. Two TypeRefs compare equal when they
// describe the same type, so they can key caches directly.
class TypeRef {
public:
    enum class Kind {
        Unresolved,  // name written in source, not yet looked up
        Nominal,     // named, constructor-bearing type (struct, class, builtin)
        Interface,   // abstract type whose constructors are requirements
        Optional,    // T?  (one argument: the wrapped type)
        Function,    // (A, B) -> R  (arguments: params..., result last)
        Tuple,       // (A, B)
        Error        // failed resolution; suppresses follow-up diagnostics
    };

    TypeRef() : kind_(Kind::Error) {}

    static TypeRef unresolved(const std::string& name);
    static TypeRef nominal(const std::string& name);
    static TypeRef interfaceType(const std::string& name);
    static TypeRef optional(const TypeRef& wrapped);
    static TypeRef function(std::vector<TypeRef> params, const TypeRef& result);
    static TypeRef tuple(std::vector<TypeRef> elements);
    static TypeRef error() { return TypeRef(); }

    Kind getKind() const { return kind_; }
    const std::string& getName() const { return name_; }
    const std::vector<TypeRef>& getArgs() const { return args_; }

    bool isNominal() const { return kind_ == Kind::Nominal; }
    bool isInterface() const { return kind_ == Kind::Interface; }
    bool isOptional() const { return kind_ == Kind::Optional; }
    bool isFunction() const { return kind_ == Kind::Function; }
    bool isTuple() const { return kind_ == Kind::Tuple; }
    bool isError() const { return kind_ == Kind::Error; }
    bool isUnresolved() const { return kind_ == Kind::Unresolved; }

    // Structural types have no declaration and no constructors of their own
    bool isStructural() const { return kind_ == Kind::Function || kind_ == Kind::Tuple; }

    // Optional: the wrapped type; otherwise an error type
    TypeRef getWrapped() const;

    // Name of the declaration whose constructors describe this type.
    // Optional types answer with the wrapper's name ("Optional").
    std::string getDeclName() const;

    // True if this type or any component still needs name lookup
    bool containsUnresolved() const;
    bool containsError() const;

    std::string toString() const;

    bool operator==(const TypeRef& other) const;
    bool operator!=(const TypeRef& other) const { return !(*this == other); }
    bool operator<(const TypeRef& other) const;

private:
    TypeRef(Kind kind, const std::string& name, std::vector<TypeRef> args)
        : kind_(kind), name_(name), args_(std::move(args)) {}

    Kind kind_;
    std::string name_;
    std::vector<TypeRef> args_;
};

// Name of the nominal declaration that backs optional types
extern const char* const kOptionalDeclName;

} // namespace model
} // namespace expanse
