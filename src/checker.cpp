#include "expanse/checker.h"
#include "expanse/error_reporter.h"
#include "expanse/source_location.h"
#include "expanse/model/program.h"
#include "expanse/semantic/catalog_builder.h"
#include "expanse/semantic/diagnostics.h"
#include "expanse/semantic/expansion_engine.h"
#include "expanse/semantic/oracles.h"
#include "expanse/semantic/symbol_table.h"
#include "expanse/semantic/type_environment.h"
#include <fstream>
#include <sstream>
#include <iostream>
#include <map>
#include <set>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/ThreadPool.h>
#include <llvm/Support/Threading.h>

// ANTLR4 includes (used only for lexing)
#include "ExpanseLexer.h"
#include <antlr4-runtime.h>

// Custom parser
#include "expanse/parser/parser.h"

namespace expanse {

namespace {

semantic::TypeDeclKind declKindFor(model::TypeDeclaration::Kind kind) {
    switch (kind) {
        case model::TypeDeclaration::Kind::Class: return semantic::TypeDeclKind::Class;
        case model::TypeDeclaration::Kind::Interface: return semantic::TypeDeclKind::Interface;
        case model::TypeDeclaration::Kind::Struct: return semantic::TypeDeclKind::Struct;
    }
    return semantic::TypeDeclKind::Struct;
}

const char* declKindName(semantic::TypeDeclKind kind) {
    switch (kind) {
        case semantic::TypeDeclKind::Builtin: return "builtin type";
        case semantic::TypeDeclKind::Struct: return "struct";
        case semantic::TypeDeclKind::Class: return "class";
        case semantic::TypeDeclKind::Interface: return "interface";
    }
    return "type";
}

std::string argumentName(const model::CallArgument& arg) {
    return arg.label.empty() ? std::string("_") : arg.label;
}

std::string parameterName(const model::ParameterDeclaration& param) {
    return param.label.empty() ? std::string("_") : param.label;
}

class CheckerLexerErrorListener : public antlr4::BaseErrorListener {
public:
    CheckerLexerErrorListener(ErrorReporter& reporter, const std::string& file)
        : reporter_(reporter), file_(file) {}

    void syntaxError(antlr4::Recognizer* recognizer,
                     antlr4::Token* offendingSymbol,
                     size_t line,
                     size_t charPositionInLine,
                     const std::string& msg,
                     std::exception_ptr e) override {
        (void)recognizer;
        (void)e;
        SourceLocation loc(line, charPositionInLine + 1, file_);
        size_t len = 1;
        if (offendingSymbol && !offendingSymbol->getText().empty()) {
            len = offendingSymbol->getText().size();
        }

        ErrorCode code(ErrorCodes::SYNTAX_ERROR, "syntax");
        if (msg.find("token recognition error") != std::string::npos) {
            code = ErrorCode(ErrorCodes::UNEXPECTED_TOKEN, "syntax");
        }
        reporter_.error(loc, "Syntax error: " + msg, code, len);
    }

private:
    ErrorReporter& reporter_;
    std::string file_;
};

} // namespace

bool parseJobCount(const std::string& text, unsigned& jobs) {
    unsigned value = 0;
    // Rejects anything but digits, and values wider than unsigned
    if (llvm::StringRef(text).getAsInteger(10, value)) {
        return false;
    }
    jobs = value;
    return true;
}

Checker::Checker(CheckerOptions options)
    : options_(options)
    , errorReporter_(std::make_unique<ErrorReporter>()) {
    reset();
}

Checker::~Checker() = default;

void Checker::reset() {
    program_.reset();
    engine_.reset();
    catalogs_.reset();
    catalogBuilder_.reset();

    environment_ = std::make_unique<semantic::TypeEnvironment>();
    symbols_ = std::make_unique<semantic::SymbolTable>();
    visibility_ = std::make_unique<semantic::AccessControlOracle>();
    typeCheck_ = std::make_unique<semantic::LiteralTypeOracle>(*environment_);
    catalogBuilder_ = std::make_unique<semantic::CatalogBuilder>(*environment_, *visibility_);
    catalogs_ = std::make_unique<semantic::CatalogCache>(*catalogBuilder_);

    semantic::ValidatorOptions validatorOptions;
    validatorOptions.stopAtFirstViolation = options_.stopAtFirstViolation;
    engine_ = std::make_unique<semantic::ExpansionEngine>(*catalogs_, *typeCheck_, *visibility_,
                                                          validatorOptions);

    signatures_.clear();
    signatureValid_.clear();
    calls_.clear();
}

bool Checker::isSignatureValid(size_t index) const {
    return index < signatureValid_.size() && signatureValid_[index];
}

void Checker::log(const std::string& message) const {
    if (options_.verbose) {
        std::cout << message << "\n";
    }
}

bool Checker::check(const std::string& sourceFile) {
    errorReporter_->clear();

    std::ifstream file(sourceFile);
    if (!file.is_open()) {
        errorReporter_->error(
            SourceLocation(1, 1, sourceFile),
            "Cannot open file: " + sourceFile
        );
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string source = buffer.str();
    file.close();

    return checkFromString(source, sourceFile);
}

bool Checker::checkFromString(const std::string& source) {
    return checkFromString(source, "");
}

bool Checker::checkFromString(const std::string& source, const std::string& virtualFile) {
    errorReporter_->clear();
    errorReporter_->setSource(virtualFile, source);
    reset();

    if (!parse(source, virtualFile)) {
        return false;
    }
    log("Parsed " + std::to_string(program_->getTypes().size()) + " types, " +
        std::to_string(program_->getFunctions().size()) + " functions, " +
        std::to_string(program_->getCalls().size()) + " calls");

    declareTypes();
    registerConstructors();
    declareVariables();
    buildSignatures();
    elaborateCalls();
    resolveCalls();
    reportCalls();

    log("Built " + std::to_string(catalogs_->getBuildCount()) + " constructor catalogs");
    return !errorReporter_->hasErrors();
}

bool Checker::parse(const std::string& source, const std::string& virtualFile) {
    antlr4::ANTLRInputStream input(source);

    ExpanseLexer lexer(&input);
    lexer.removeErrorListeners();
    CheckerLexerErrorListener errorListener(*errorReporter_, virtualFile);
    lexer.addErrorListener(&errorListener);

    // Tokenize via ANTLR and adapt to custom parser tokens
    antlr4::CommonTokenStream tokens(&lexer);
    tokens.fill();

    if (errorReporter_->hasErrors()) {
        return false;
    }

    parser::TokenStreamAdapter tokenAdapter(tokens, virtualFile);
    parser::ExpanseParser parser(tokenAdapter, *errorReporter_, virtualFile);
    program_ = parser.parseProgram();

    if (!program_) {
        errorReporter_->error(
            SourceLocation(1, 1, virtualFile),
            "Failed to parse program"
        );
        return false;
    }
    return !errorReporter_->hasErrors();
}

bool Checker::resolveType(model::TypeRef& type, const SourceLocation& location) {
    std::vector<std::string> unknown;
    type = environment_->resolve(type, unknown);
    for (const auto& name : unknown) {
        errorReporter_->error(location, "cannot find type '" + name + "' in scope",
                              ErrorCode(ErrorCodes::UNDEFINED_TYPE, "declaration"));
    }
    return unknown.empty();
}

bool Checker::resolveTypes(std::vector<model::ParameterSyntax>& params) {
    bool ok = true;
    for (auto& param : params) {
        if (!resolveType(param.type, param.location)) {
            ok = false;
        }
    }
    return ok;
}

void Checker::declareTypes() {
    environment_->declareBuiltins();

    // Names first, so supertypes may refer to types declared later
    std::map<std::string, const model::TypeDeclaration*> declared;
    std::set<const model::TypeDeclaration*> duplicates;
    for (const auto& decl : program_->getTypes()) {
        const semantic::TypeDecl* builtin = environment_->lookupType(decl.name);
        auto it = declared.find(decl.name);
        if (builtin || it != declared.end()) {
            errorReporter_->error(decl.location, "invalid redeclaration of type '" + decl.name + "'",
                                  ErrorCode(ErrorCodes::REDEFINED_TYPE, "declaration"),
                                  decl.name.size());
            if (it != declared.end()) {
                errorReporter_->addNote("'" + decl.name + "' previously declared at " +
                                        it->second->location.toString());
            } else {
                errorReporter_->addNote("'" + decl.name + "' is a builtin type");
            }
            duplicates.insert(&decl);
            continue;
        }
        declared[decl.name] = &decl;
    }

    // Accepted superclass edges, checked for cycles as they are added
    std::map<std::string, std::string> supertypes;
    for (const auto& decl : program_->getTypes()) {
        if (duplicates.count(&decl) > 0) {
            continue;
        }

        semantic::TypeDecl typeDecl;
        typeDecl.name = decl.name;
        typeDecl.kind = declKindFor(decl.kind);
        typeDecl.declaredAt = decl.declaredAt;
        typeDecl.location = decl.location;

        if (!decl.supertype.empty()) {
            auto super = declared.find(decl.supertype);
            if (decl.kind != model::TypeDeclaration::Kind::Class) {
                errorReporter_->error(decl.location, "only classes may declare a supertype; '" +
                                      decl.name + "' is not a class",
                                      ErrorCode(ErrorCodes::INVALID_SUPERTYPE, "declaration"));
            } else if (super == declared.end()) {
                if (environment_->hasType(decl.supertype)) {
                    errorReporter_->error(decl.location, "class '" + decl.name +
                                          "' cannot inherit from builtin type '" + decl.supertype + "'",
                                          ErrorCode(ErrorCodes::INVALID_SUPERTYPE, "declaration"));
                } else {
                    errorReporter_->error(decl.location, "cannot find type '" + decl.supertype + "' in scope",
                                          ErrorCode(ErrorCodes::UNDEFINED_TYPE, "declaration"));
                }
            } else if (super->second->kind == model::TypeDeclaration::Kind::Struct) {
                errorReporter_->error(decl.location, "class '" + decl.name +
                                      "' cannot inherit from struct '" + decl.supertype + "'",
                                      ErrorCode(ErrorCodes::INVALID_SUPERTYPE, "declaration"));
            } else {
                bool cycle = false;
                std::string cursor = decl.supertype;
                while (!cursor.empty()) {
                    if (cursor == decl.name) {
                        cycle = true;
                        break;
                    }
                    auto next = supertypes.find(cursor);
                    cursor = next == supertypes.end() ? std::string() : next->second;
                }
                if (cycle) {
                    errorReporter_->error(decl.location, "'" + decl.name +
                                          "' inherits from itself through '" + decl.supertype + "'",
                                          ErrorCode(ErrorCodes::INVALID_SUPERTYPE, "declaration"));
                } else {
                    supertypes[decl.name] = decl.supertype;
                    typeDecl.supertype = decl.supertype;
                }
            }
        }

        environment_->declareType(typeDecl);
        log("Declared " + std::string(declKindName(typeDecl.kind)) + " " + decl.name +
            (typeDecl.supertype.empty() ? "" : " : " + typeDecl.supertype));
    }
}

void Checker::registerConstructors() {
    auto addInits = [this](const std::string& typeName, const std::vector<model::InitDeclaration>& inits) {
        for (const auto& init : inits) {
            std::vector<model::ParameterSyntax> params = init.parameters;
            bool ok = resolveTypes(params);

            model::ConstructorCandidate candidate;
            candidate.owningType = environment_->typeFor(typeName);
            candidate.visibility = init.visibility;
            candidate.declaringModule = init.declaredAt.module;
            candidate.declaredAt = init.declaredAt;
            candidate.location = init.location;
            for (const auto& param : params) {
                if (param.isExpanded) {
                    errorReporter_->error(param.location,
                                          "'@expanded' may only be applied to function parameters",
                                          ErrorCode(ErrorCodes::INVALID_EXPANDED_PLACEMENT, "expansion"));
                    ok = false;
                }
                candidate.parameterLabels.push_back(param.label);
                candidate.parameterTypes.push_back(param.type);
            }
            if (!ok) {
                continue;
            }
            environment_->addConstructor(typeName, candidate);
            log("Registered " + candidate.getDisplayName() + " (" +
                model::visibilityToString(candidate.visibility) + ", " +
                candidate.declaredAt.toString() + ")");
        }
    };

    std::set<std::string> seen;
    for (const auto& decl : program_->getTypes()) {
        // A redeclared type's initializers were reported with it
        if (!seen.insert(decl.name).second) {
            continue;
        }
        const semantic::TypeDecl* typeDecl = environment_->lookupType(decl.name);
        if (!typeDecl || typeDecl->kind == semantic::TypeDeclKind::Builtin) {
            continue;
        }
        addInits(decl.name, decl.initializers);
    }

    for (const auto& ext : program_->getExtensions()) {
        if (!environment_->hasType(ext.extendedType)) {
            errorReporter_->error(ext.location, "cannot find type '" + ext.extendedType + "' in scope",
                                  ErrorCode(ErrorCodes::UNDEFINED_TYPE, "declaration"));
            errorReporter_->addHelp("declare the type before extending it");
            continue;
        }
        addInits(ext.extendedType, ext.initializers);
    }
}

void Checker::declareVariables() {
    for (const auto& decl : program_->getVariables()) {
        model::TypeRef type = decl.type;
        resolveType(type, decl.location);

        auto symbol = std::make_unique<semantic::VariableSymbol>(decl.name, decl.location, type);
        if (!symbols_->insert(std::move(symbol))) {
            errorReporter_->error(decl.location, "invalid redeclaration of '" + decl.name + "'",
                                  ErrorCode(ErrorCodes::REDEFINED_VARIABLE, "declaration"),
                                  decl.name.size());
            const semantic::Symbol* previous = symbols_->lookup(decl.name);
            if (previous) {
                errorReporter_->addNote("'" + decl.name + "' previously declared at " +
                                        previous->getLocation().toString());
            }
        }
    }
}

void Checker::buildSignatures() {
    const auto& functions = program_->getFunctions();

    // Overload sets: same name, same module
    std::map<std::pair<model::ModuleId, std::string>, size_t> setSizes;
    for (const auto& decl : functions) {
        setSizes[std::make_pair(decl.declaredAt.module, decl.name)]++;
    }

    for (size_t i = 0; i < functions.size(); ++i) {
        const model::FunctionDeclaration& decl = functions[i];
        std::vector<model::ParameterSyntax> params = decl.parameters;
        bool valid = resolveTypes(params);

        std::vector<model::ParameterDeclaration> parameters;
        for (size_t j = 0; j < params.size(); ++j) {
            const model::ParameterSyntax& syntax = params[j];
            model::ParameterDeclaration param;
            param.label = syntax.label;
            param.positionalIndex = j;
            param.declaredType = syntax.type;
            param.isExpanded = syntax.isExpanded;
            param.hasDefaultValue = syntax.defaultValue != nullptr;
            param.isByReference = syntax.isInout;
            param.defaultValue = syntax.defaultValue;
            param.location = syntax.location;

            // Literal defaults are checked here; references are left to the
            // host's ordinary expression checking.
            if (param.defaultValue && param.defaultValue->isLiteral() &&
                !param.declaredType.containsError() &&
                !typeCheck_->typeChecks(*param.defaultValue, param.declaredType)) {
                errorReporter_->error(param.defaultValue->getLocation(),
                                      "default value '" + param.defaultValue->toString() +
                                      "' does not match parameter type '" +
                                      param.declaredType.toString() + "'",
                                      ErrorCode(ErrorCodes::ARGUMENT_TYPE_MISMATCH, "type"));
            }
            parameters.push_back(param);
        }

        bool hasSiblings = setSizes[std::make_pair(decl.declaredAt.module, decl.name)] > 1;
        model::Signature signature(decl.name, std::move(parameters), hasSiblings,
                                   decl.declaredAt, decl.location);

        std::vector<semantic::ResolutionError> errors = engine_->validateSignature(signature);
        if (!errors.empty()) {
            semantic::reportSignatureErrors(*errorReporter_, signature, errors);
            valid = false;
        }

        const model::ParameterDeclaration* expanded = signature.getExpandedParameter();
        if (expanded && errors.empty() && expanded->declaredType.isOptional()) {
            errorReporter_->warning(expanded->location,
                                    "expanded parameter '" + parameterName(*expanded) +
                                    "' has optional type '" + expanded->declaredType.toString() +
                                    "'; its arguments build an '" + model::kOptionalDeclName +
                                    "', not the wrapped type",
                                    ErrorCode(ErrorCodes::OPTIONAL_EXPANDED_TYPE, "expansion"));
        }

        log("Signature " + signature.toString() + (valid ? "" : " (invalid)"));
        signatures_.push_back(signature);
        signatureValid_.push_back(valid);

        auto symbol = std::make_unique<semantic::FunctionSymbol>(&decl, i);
        if (!symbols_->insert(std::move(symbol))) {
            errorReporter_->error(decl.location, "invalid redeclaration of '" + decl.name + "'",
                                  ErrorCode(ErrorCodes::REDEFINED_VARIABLE, "declaration"),
                                  decl.name.size());
            errorReporter_->addNote("'" + decl.name + "' is already declared as a variable");
        }
    }
}

void Checker::elaborateCalls() {
    for (const auto& call : program_->getCalls()) {
        CallCheck check;
        check.call = &call;
        bool ok = true;

        for (const auto& arg : call.arguments) {
            model::CallArgument elaborated = arg;
            if (arg.value && arg.value->getKind() == model::Expression::Kind::Reference) {
                const semantic::Symbol* symbol = symbols_->lookup(arg.value->getText());
                if (!symbol || symbol->getKind() != semantic::SymbolKind::Variable) {
                    errorReporter_->error(arg.value->getLocation(),
                                          "cannot find '" + arg.value->getText() + "' in scope",
                                          ErrorCode(ErrorCodes::UNDEFINED_VARIABLE, "declaration"),
                                          arg.value->getText().size());
                    ok = false;
                } else {
                    elaborated.value = model::makeReference(arg.value->getLocation(),
                                                            arg.value->getText(),
                                                            *symbol->getType());
                }
            }
            check.arguments.push_back(elaborated);
        }

        // The call's own module first, then public functions elsewhere
        std::vector<semantic::FunctionSymbol*> set =
            symbols_->lookupOverloadSet(call.callee, call.site.module);
        if (set.empty()) {
            for (semantic::Symbol* symbol : symbols_->lookupAll(call.callee)) {
                if (symbol->getKind() != semantic::SymbolKind::Function) {
                    continue;
                }
                const model::FunctionDeclaration* function = symbol->getFunction();
                if (function->visibility == model::VisibilityLevel::Public) {
                    set = symbols_->lookupOverloadSet(call.callee, function->declaredAt.module);
                    break;
                }
            }
        }

        if (set.empty()) {
            errorReporter_->error(call.location, "cannot find function '" + call.callee + "' in scope",
                                  ErrorCode(ErrorCodes::UNDEFINED_FUNCTION, "declaration"),
                                  call.callee.size());
            const semantic::Symbol* symbol = symbols_->lookup(call.callee);
            if (symbol && symbol->getKind() == semantic::SymbolKind::Variable) {
                errorReporter_->addNote("'" + call.callee + "' is a variable, not a function");
            }
            ok = false;
        }

        bool anyValid = false;
        for (semantic::FunctionSymbol* function : set) {
            check.overloadSet.push_back(function->getSignatureIndex());
            if (isSignatureValid(function->getSignatureIndex())) {
                anyValid = true;
            }
        }

        // Calls to signatures that failed validation are not resolved
        check.status = (ok && anyValid) ? CallCheck::Status::Resolved : CallCheck::Status::Skipped;
        calls_.push_back(check);
    }
}

void Checker::resolveCall(CallCheck& check) const {
    semantic::ArgumentMatcher matcher(*typeCheck_);

    std::vector<size_t> candidates;
    for (size_t index : check.overloadSet) {
        if (isSignatureValid(index)) {
            candidates.push_back(index);
        }
    }

    if (candidates.size() == 1) {
        const model::Signature& signature = signatures_[candidates.front()];
        check.signatureIndex = candidates.front();
        check.result = engine_->resolveCall(signature, check.arguments, check.call->site);
        check.issues = matcher.matchResult(signature, check.result);
        return;
    }

    // Overloads never carry expanded parameters, so plain matching decides
    std::vector<size_t> viable;
    for (size_t index : candidates) {
        if (matcher.match(signatures_[index], check.arguments).empty()) {
            viable.push_back(index);
        }
    }
    if (viable.size() != 1) {
        check.status = CallCheck::Status::NoOverload;
        check.viableOverloads = viable.size();
        return;
    }
    check.signatureIndex = viable.front();
    check.result = semantic::ResolutionResult::notApplicable(check.arguments);
}

void Checker::resolveCalls() {
    std::vector<size_t> pending;
    for (size_t i = 0; i < calls_.size(); ++i) {
        if (calls_[i].status == CallCheck::Status::Resolved) {
            pending.push_back(i);
        }
    }
    if (pending.empty()) {
        return;
    }

    // Every call reads shared immutable state and writes only its own slot;
    // catalogs are shared through the insert-once cache.
    llvm::ThreadPool pool(llvm::hardware_concurrency(options_.jobs));
    log("Resolving " + std::to_string(pending.size()) + " calls on " +
        std::to_string(pool.getThreadCount()) + " threads");
    for (size_t index : pending) {
        CallCheck* check = &calls_[index];
        pool.async([this, check] { resolveCall(*check); });
    }
    pool.wait();
}

void Checker::reportIssue(const semantic::ArgumentIssue& issue, const CallCheck& check) {
    const model::Signature& signature = signatures_[check.signatureIndex];
    const std::string param = parameterName(issue.parameter);

    switch (issue.kind) {
        case semantic::ArgumentIssue::Kind::TypeMismatch:
            errorReporter_->error(issue.argument.location,
                                  "cannot convert value '" + issue.argument.value->toString() +
                                  "' to expected argument type '" +
                                  issue.parameter.declaredType.toString() + "'",
                                  ErrorCode(ErrorCodes::ARGUMENT_TYPE_MISMATCH, "type"));
            errorReporter_->addNote("parameter '" + param + "' of " + signature.toString());
            break;
        case semantic::ArgumentIssue::Kind::LabelMismatch:
            errorReporter_->error(issue.argument.location,
                                  "incorrect argument label '" + argumentName(issue.argument) +
                                  "', expected '" + param + "'",
                                  ErrorCode(ErrorCodes::ARGUMENT_LABEL_MISMATCH, "resolution"));
            break;
        case semantic::ArgumentIssue::Kind::MissingArgument:
            errorReporter_->error(check.call->location,
                                  "missing argument for parameter '" + param + "' in call to '" +
                                  signature.getName() + "'",
                                  ErrorCode(ErrorCodes::MISSING_ARGUMENT, "resolution"),
                                  check.call->callee.size());
            errorReporter_->addNote("declared as " + signature.toString());
            break;
        case semantic::ArgumentIssue::Kind::ExtraArgument:
            errorReporter_->error(issue.argument.location,
                                  "extra argument '" + argumentName(issue.argument) +
                                  "' in call to '" + signature.getName() + "'",
                                  ErrorCode(ErrorCodes::EXTRA_ARGUMENT, "resolution"));
            break;
    }
}

void Checker::reportCalls() {
    for (const auto& check : calls_) {
        const model::CallStatement& call = *check.call;

        if (check.status == CallCheck::Status::Skipped) {
            continue;
        }

        if (check.status == CallCheck::Status::NoOverload) {
            const std::string shape = call.callee + model::labelShape(check.arguments);
            if (check.viableOverloads == 0) {
                errorReporter_->error(call.location, "no overload of '" + call.callee +
                                      "' accepts the arguments of '" + shape + "'",
                                      ErrorCode(ErrorCodes::NO_MATCHING_OVERLOAD, "resolution"),
                                      call.callee.size());
            } else {
                errorReporter_->error(call.location, "ambiguous use of '" + shape + "'",
                                      ErrorCode(ErrorCodes::NO_MATCHING_OVERLOAD, "resolution"),
                                      call.callee.size());
            }
            for (size_t index : check.overloadSet) {
                errorReporter_->addNote("candidate: " + signatures_[index].toString());
            }
            continue;
        }

        const model::Signature& signature = signatures_[check.signatureIndex];
        log(call.location.toString() + ": " + call.callee + model::labelShape(check.arguments) +
            " -> " + check.result.toString());

        if (check.result.isError()) {
            semantic::reportCallError(*errorReporter_, check.result.getError(), signature,
                                      check.arguments, call.location);
            continue;
        }
        for (const auto& issue : check.issues) {
            reportIssue(issue, check);
        }
    }
}

} // namespace expanse
