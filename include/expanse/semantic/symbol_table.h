#pragma once

#include "expanse/model/program.h"
#include "expanse/model/types.h"
#include "expanse/source_location.h"
#include <string>
#include <unordered_map>
#include <vector>
#include <memory>

namespace expanse {
namespace semantic {

// Symbol kinds
enum class SymbolKind {
    Variable,
    Function
};

// Symbol entry in the symbol table
class Symbol {
public:
    Symbol(SymbolKind kind, const std::string& name, const SourceLocation& location)
        : kind_(kind), name_(name), location_(location) {}

    virtual ~Symbol() = default;

    SymbolKind getKind() const { return kind_; }
    const std::string& getName() const { return name_; }
    const SourceLocation& getLocation() const { return location_; }

    // Kind-specific accessors (return nullptr if not applicable)
    virtual const model::TypeRef* getType() const { return nullptr; }
    virtual const model::FunctionDeclaration* getFunction() const { return nullptr; }

private:
    SymbolKind kind_;
    std::string name_;
    SourceLocation location_;
};

// Variable symbol with its resolved type
class VariableSymbol : public Symbol {
public:
    VariableSymbol(const std::string& name,
                   const SourceLocation& location,
                   const model::TypeRef& type)
        : Symbol(SymbolKind::Variable, name, location), type_(type) {}

    const model::TypeRef* getType() const override { return &type_; }

private:
    model::TypeRef type_;
};

// Function symbol (supports overloading)
class FunctionSymbol : public Symbol {
public:
    FunctionSymbol(const model::FunctionDeclaration* function, size_t signatureIndex)
        : Symbol(SymbolKind::Function, function->name, function->location),
          function_(function), signatureIndex_(signatureIndex) {}

    const model::FunctionDeclaration* getFunction() const override { return function_; }
    const model::ModuleId& getModule() const { return function_->declaredAt.module; }

    // Index of the checked Signature built for this declaration
    size_t getSignatureIndex() const { return signatureIndex_; }

private:
    const model::FunctionDeclaration* function_; // Non-owning pointer
    size_t signatureIndex_;
};

// Top-level symbols of a checked program
class SymbolTable {
public:
    SymbolTable() {}

    // Insert a symbol (returns false if already exists and not overloadable)
    bool insert(std::unique_ptr<Symbol> symbol);

    // Look up the first symbol with the given name
    Symbol* lookup(const std::string& name) const;

    // Look up all symbols with the given name (for function overloading)
    std::vector<Symbol*> lookupAll(const std::string& name) const;

    // Functions named `name` declared in `module`
    std::vector<FunctionSymbol*> lookupOverloadSet(const std::string& name,
                                                   const model::ModuleId& module) const;

    bool contains(const std::string& name) const;

private:
    std::unordered_map<std::string, std::vector<std::unique_ptr<Symbol>>> symbols_;

    // Check if symbol kind supports overloading
    static bool supportsOverloading(SymbolKind kind);
};

} // namespace semantic
} // namespace expanse
