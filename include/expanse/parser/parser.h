#pragma once

#include "expanse/error_reporter.h"
#include "expanse/model/program.h"
#include "expanse/parser/token.h"
#include <memory>
#include <string>
#include <vector>

namespace antlr4 {
class CommonTokenStream;
}

namespace expanse {

class ErrorReporter;

namespace parser {

// Adapter that consumes an ANTLR CommonTokenStream and exposes Token objects
// for the recursive-descent parser.
class TokenStreamAdapter {
public:
    TokenStreamAdapter(antlr4::CommonTokenStream& stream,
                       const std::string& filename);

    const Token& current() const { return current_; }
    const Token& lookahead(std::size_t n);

    void advance();

private:
    antlr4::CommonTokenStream& stream_;
    std::string filename_;
    std::size_t index_;
    Token current_;
    Token lookahead_;

    Token makeTokenFromAntlr(int rawType, const std::string& text,
                             std::size_t line, std::size_t column);
    void refreshCurrent();
};

// Recursive-descent parser for .xp fixture files.
class ExpanseParser {
public:
    ExpanseParser(TokenStreamAdapter& tokens,
                  expanse::ErrorReporter& errorReporter,
                  const std::string& filename);

    std::unique_ptr<model::Program> parseProgram();

private:
    TokenStreamAdapter& tokens_;
    expanse::ErrorReporter& errorReporter_;
    std::string filename_;

    // Declaration context tracked while parsing
    std::string currentModule_;
    std::string currentFile_;
    size_t nextOrdinal_;

    // Utility
    const Token& current() const { return tokens_.current(); }
    void advance() { tokens_.advance(); }
    bool match(TokenKind kind);
    bool expect(TokenKind kind, const char* message);
    void reportSyntaxError(const std::string& message, std::size_t length = 0);
    void synchronize();

    model::SiteContext nextSite(const std::string& scope);

    // Declarations
    void parseDeclaration(model::Program& program);
    void parseModuleDirective();
    void parseFileDirective();
    void parseTypeDecl(model::Program& program);
    void parseExtension(model::Program& program);
    bool parseInitList(const std::string& scope, std::vector<model::InitDeclaration>& inits);
    bool parseInit(const std::string& scope, model::VisibilityLevel visibility,
                   std::vector<model::InitDeclaration>& inits);
    void parseFunctionDecl(model::Program& program, model::VisibilityLevel visibility);
    void parseLetDecl(model::Program& program);
    void parseCallStmt(model::Program& program);
    bool parseAccessModifier(model::VisibilityLevel& level);

    // Parameters and arguments
    bool parseParameterList(std::vector<model::ParameterSyntax>& params);
    bool parseParameter(model::ParameterSyntax& param);
    bool parseArgumentList(model::ArgumentList& args);

    // Types and expressions
    bool parseType(model::TypeRef& type);
    bool parsePrimaryType(model::TypeRef& type);
    model::ExprPtr parseExpression();
    model::ExprPtr parseClosure();
};

} // namespace parser
} // namespace expanse
