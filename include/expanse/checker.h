#pragma once

#include "expanse/model/call.h"
#include "expanse/model/signature.h"
#include "expanse/semantic/argument_matcher.h"
#include "expanse/semantic/resolution_result.h"
#include <string>
#include <vector>
#include <memory>

namespace expanse {

class ErrorReporter;

namespace model {
    class Program;
    struct CallStatement;
    struct ParameterSyntax;
}

namespace semantic {
    class TypeEnvironment;
    class SymbolTable;
    class AccessControlOracle;
    class LiteralTypeOracle;
    class CatalogBuilder;
    class CatalogCache;
    class ExpansionEngine;
}

struct CheckerOptions {
    bool verbose = false;
    // Worker threads for call resolution; 0 picks the hardware default
    unsigned jobs = 0;
    // Report only the first violation per signature
    bool stopAtFirstViolation = false;
};

// Parse a --jobs value. Accepts decimal digits only, so negative and
// out-of-range counts are rejected.
bool parseJobCount(const std::string& text, unsigned& jobs);

// Outcome of checking one call statement
struct CallCheck {
    enum class Status {
        Skipped,     // unresolvable callee, argument or invalid signature
        Resolved,    // engine result (possibly an error) is available
        NoOverload   // no single overload accepts the arguments
    };

    const model::CallStatement* call = nullptr;  // Non-owning, into the program
    model::ArgumentList arguments;               // elaborated arguments
    std::vector<size_t> overloadSet;             // signature indices considered
    size_t signatureIndex = 0;                   // selected signature (Resolved)
    Status status = Status::Skipped;
    semantic::ResolutionResult result = semantic::ResolutionResult::notApplicable(model::ArgumentList());
    std::vector<semantic::ArgumentIssue> issues;
    size_t viableOverloads = 0;                  // NoOverload only
};

class Checker {
public:
    Checker(CheckerOptions options = CheckerOptions());
    ~Checker();

    // Check a source file
    bool check(const std::string& sourceFile);

    // Check from source string (for testing)
    bool checkFromString(const std::string& source);

    // Check from source string with a virtual filename (for better diagnostics)
    bool checkFromString(const std::string& source, const std::string& virtualFile);

    ErrorReporter& getErrorReporter() { return *errorReporter_; }
    const CheckerOptions& getOptions() const { return options_; }

    // Parsed program (nullptr before a successful parse)
    model::Program* getProgram() const { return program_.get(); }

    const semantic::TypeEnvironment& getTypeEnvironment() const { return *environment_; }
    const std::vector<model::Signature>& getSignatures() const { return signatures_; }
    bool isSignatureValid(size_t index) const;
    const std::vector<CallCheck>& getCallChecks() const { return calls_; }
    const semantic::CatalogCache& getCatalogCache() const { return *catalogs_; }

private:
    CheckerOptions options_;
    std::unique_ptr<ErrorReporter> errorReporter_;
    std::unique_ptr<model::Program> program_;

    std::unique_ptr<semantic::TypeEnvironment> environment_;
    std::unique_ptr<semantic::SymbolTable> symbols_;
    std::unique_ptr<semantic::AccessControlOracle> visibility_;
    std::unique_ptr<semantic::LiteralTypeOracle> typeCheck_;
    std::unique_ptr<semantic::CatalogBuilder> catalogBuilder_;
    std::unique_ptr<semantic::CatalogCache> catalogs_;
    std::unique_ptr<semantic::ExpansionEngine> engine_;

    std::vector<model::Signature> signatures_;
    std::vector<bool> signatureValid_;
    std::vector<CallCheck> calls_;

    void reset();
    bool parse(const std::string& source, const std::string& virtualFile);

    // Checking phases, in order
    void declareTypes();
    void registerConstructors();
    void declareVariables();
    void buildSignatures();
    void elaborateCalls();
    void resolveCalls();
    void reportCalls();

    bool resolveTypes(std::vector<model::ParameterSyntax>& params);
    bool resolveType(model::TypeRef& type, const SourceLocation& location);
    void resolveCall(CallCheck& check) const;
    void reportIssue(const semantic::ArgumentIssue& issue, const CallCheck& check);
    void log(const std::string& message) const;
};

} // namespace expanse
