#pragma once

#include "expanse/model/call.h"
#include "expanse/model/context.h"
#include "expanse/model/expressions.h"
#include "expanse/model/types.h"
#include "expanse/source_location.h"
#include <string>
#include <vector>

namespace expanse {
namespace model {

// Parameter as written in an init or func declaration. Types are still
// unresolved names at this point.
struct ParameterSyntax {
    std::string label;  // empty for '_'
    std::string name;   // internal name; defaults to the label
    TypeRef type;
    bool isExpanded = false;
    bool isInout = false;
    ExprPtr defaultValue;
    SourceLocation location;
};

struct InitDeclaration {
    VisibilityLevel visibility = VisibilityLevel::Internal;
    std::vector<ParameterSyntax> parameters;
    SourceLocation location;
    SiteContext declaredAt;
};

struct TypeDeclaration {
    enum class Kind {
        Struct,
        Class,
        Interface
    };

    std::string name;
    Kind kind = Kind::Struct;
    std::string supertype;
    std::vector<InitDeclaration> initializers;
    SourceLocation location;
    SiteContext declaredAt;
};

struct ExtensionDeclaration {
    std::string extendedType;
    std::vector<InitDeclaration> initializers;
    SourceLocation location;
    SiteContext declaredAt;
};

struct FunctionDeclaration {
    std::string name;
    VisibilityLevel visibility = VisibilityLevel::Internal;
    std::vector<ParameterSyntax> parameters;
    TypeRef returnType;
    SourceLocation location;
    SiteContext declaredAt;
};

struct VariableDeclaration {
    std::string name;
    TypeRef type;
    SourceLocation location;
    SiteContext declaredAt;
};

// A call statement. References in the arguments are unbound (error type)
// until the checker elaborates them.
struct CallStatement {
    std::string callee;
    ArgumentList arguments;
    SourceLocation location;
    SiteContext site;
};

// Everything one fixture file declares, each list in source order
class Program {
public:
    Program() {}

    void addType(TypeDeclaration decl) { types_.push_back(std::move(decl)); }
    void addExtension(ExtensionDeclaration decl) { extensions_.push_back(std::move(decl)); }
    void addFunction(FunctionDeclaration decl) { functions_.push_back(std::move(decl)); }
    void addVariable(VariableDeclaration decl) { variables_.push_back(std::move(decl)); }
    void addCall(CallStatement call) { calls_.push_back(std::move(call)); }

    const std::vector<TypeDeclaration>& getTypes() const { return types_; }
    const std::vector<ExtensionDeclaration>& getExtensions() const { return extensions_; }
    const std::vector<FunctionDeclaration>& getFunctions() const { return functions_; }
    const std::vector<VariableDeclaration>& getVariables() const { return variables_; }
    const std::vector<CallStatement>& getCalls() const { return calls_; }

private:
    std::vector<TypeDeclaration> types_;
    std::vector<ExtensionDeclaration> extensions_;
    std::vector<FunctionDeclaration> functions_;
    std::vector<VariableDeclaration> variables_;
    std::vector<CallStatement> calls_;
};

} // namespace model
} // namespace expanse
