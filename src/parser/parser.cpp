#include "expanse/parser/parser.h"
#include "expanse/error_reporter.h"
#include "ExpanseLexer.h"
#include <antlr4-runtime.h>

using namespace antlr4;

namespace expanse {
namespace parser {

const char* tokenKindToString(TokenKind kind) {
    switch (kind) {
        case TokenKind::EndOfFile: return "end of file";
        case TokenKind::Identifier: return "identifier";
        case TokenKind::IntLiteral: return "integer literal";
        case TokenKind::FloatLiteral: return "float literal";
        case TokenKind::StringLiteral: return "string literal";
        case TokenKind::KwModule: return "'module'";
        case TokenKind::KwFile: return "'file'";
        case TokenKind::KwStruct: return "'struct'";
        case TokenKind::KwClass: return "'class'";
        case TokenKind::KwInterface: return "'interface'";
        case TokenKind::KwExtension: return "'extension'";
        case TokenKind::KwInit: return "'init'";
        case TokenKind::KwFunc: return "'func'";
        case TokenKind::KwLet: return "'let'";
        case TokenKind::KwPublic: return "'public'";
        case TokenKind::KwInternal: return "'internal'";
        case TokenKind::KwFilePrivate: return "'fileprivate'";
        case TokenKind::KwPrivate: return "'private'";
        case TokenKind::KwInout: return "'inout'";
        case TokenKind::KwTrue: return "'true'";
        case TokenKind::KwFalse: return "'false'";
        case TokenKind::KwNil: return "'nil'";
        case TokenKind::LParen: return "'('";
        case TokenKind::RParen: return "')'";
        case TokenKind::LBrace: return "'{'";
        case TokenKind::RBrace: return "'}'";
        case TokenKind::Colon: return "':'";
        case TokenKind::Semicolon: return "';'";
        case TokenKind::Comma: return "','";
        case TokenKind::At: return "'@'";
        case TokenKind::Question: return "'?'";
        case TokenKind::Assign: return "'='";
        case TokenKind::Underscore: return "'_'";
        case TokenKind::Arrow: return "'->'";
        case TokenKind::Operator: return "operator";
    }
    return "unknown";
}

// -------- TokenStreamAdapter --------

TokenStreamAdapter::TokenStreamAdapter(CommonTokenStream& stream,
                                       const std::string& filename)
    : stream_(stream), filename_(filename), index_(0) {
    stream_.fill();
    refreshCurrent();
}

Token TokenStreamAdapter::makeTokenFromAntlr(int rawType,
                                             const std::string& text,
                                             std::size_t line,
                                             std::size_t column) {
    TokenKind kind = TokenKind::EndOfFile;

    switch (rawType) {
    case ExpanseLexer::IDENTIFIER: kind = TokenKind::Identifier; break;
    case ExpanseLexer::INT_LITERAL: kind = TokenKind::IntLiteral; break;
    case ExpanseLexer::FLOAT_LITERAL: kind = TokenKind::FloatLiteral; break;
    case ExpanseLexer::STRING_LITERAL: kind = TokenKind::StringLiteral; break;

    case ExpanseLexer::MODULE: kind = TokenKind::KwModule; break;
    case ExpanseLexer::FILE_: kind = TokenKind::KwFile; break;
    case ExpanseLexer::STRUCT: kind = TokenKind::KwStruct; break;
    case ExpanseLexer::CLASS: kind = TokenKind::KwClass; break;
    case ExpanseLexer::INTERFACE: kind = TokenKind::KwInterface; break;
    case ExpanseLexer::EXTENSION: kind = TokenKind::KwExtension; break;
    case ExpanseLexer::INIT: kind = TokenKind::KwInit; break;
    case ExpanseLexer::FUNC: kind = TokenKind::KwFunc; break;
    case ExpanseLexer::LET: kind = TokenKind::KwLet; break;
    case ExpanseLexer::PUBLIC: kind = TokenKind::KwPublic; break;
    case ExpanseLexer::INTERNAL: kind = TokenKind::KwInternal; break;
    case ExpanseLexer::FILEPRIVATE: kind = TokenKind::KwFilePrivate; break;
    case ExpanseLexer::PRIVATE: kind = TokenKind::KwPrivate; break;
    case ExpanseLexer::INOUT: kind = TokenKind::KwInout; break;
    case ExpanseLexer::TRUE: kind = TokenKind::KwTrue; break;
    case ExpanseLexer::FALSE: kind = TokenKind::KwFalse; break;
    case ExpanseLexer::NIL: kind = TokenKind::KwNil; break;

    case ExpanseLexer::LPAREN: kind = TokenKind::LParen; break;
    case ExpanseLexer::RPAREN: kind = TokenKind::RParen; break;
    case ExpanseLexer::LBRACE: kind = TokenKind::LBrace; break;
    case ExpanseLexer::RBRACE: kind = TokenKind::RBrace; break;
    case ExpanseLexer::COLON: kind = TokenKind::Colon; break;
    case ExpanseLexer::SEMICOLON: kind = TokenKind::Semicolon; break;
    case ExpanseLexer::COMMA: kind = TokenKind::Comma; break;
    case ExpanseLexer::AT: kind = TokenKind::At; break;
    case ExpanseLexer::QUESTION: kind = TokenKind::Question; break;
    case ExpanseLexer::ASSIGN: kind = TokenKind::Assign; break;
    case ExpanseLexer::UNDERSCORE: kind = TokenKind::Underscore; break;
    case ExpanseLexer::ARROW: kind = TokenKind::Arrow; break;
    case ExpanseLexer::OPERATOR: kind = TokenKind::Operator; break;
    default:
        // Trivia is skipped by the callers; anything else ends the stream.
        kind = TokenKind::EndOfFile;
        break;
    }

    Token t;
    t.kind = kind;
    t.lexeme = text;
    t.loc = SourceLocation(line, column, filename_);
    return t;
}

static bool isTrivia(int rawType) {
    return rawType == ExpanseLexer::WS ||
           rawType == ExpanseLexer::LINE_COMMENT ||
           rawType == ExpanseLexer::BLOCK_COMMENT;
}

void TokenStreamAdapter::refreshCurrent() {
    const auto& all = stream_.getTokens();
    while (index_ < all.size()) {
        auto* t = all[index_];
        if (!t) {
            ++index_;
            continue;
        }
        int rawType = static_cast<int>(t->getType());
        if (isTrivia(rawType)) {
            ++index_;
            continue;
        }
        current_ = makeTokenFromAntlr(
            rawType,
            t->getText(),
            static_cast<std::size_t>(t->getLine()),
            static_cast<std::size_t>(t->getCharPositionInLine() + 1));
        return;
    }

    current_.kind = TokenKind::EndOfFile;
    current_.lexeme.clear();
    current_.loc = SourceLocation(0, 0, filename_);
}

const Token& TokenStreamAdapter::lookahead(std::size_t n) {
    const auto& all = stream_.getTokens();
    std::size_t idx = index_;
    std::size_t remaining = n;

    while (idx < all.size()) {
        auto* t = all[idx];
        if (!t) {
            ++idx;
            continue;
        }
        int rawType = static_cast<int>(t->getType());
        if (isTrivia(rawType)) {
            ++idx;
            continue;
        }
        if (remaining == 0) {
            lookahead_ = makeTokenFromAntlr(
                rawType,
                t->getText(),
                static_cast<std::size_t>(t->getLine()),
                static_cast<std::size_t>(t->getCharPositionInLine() + 1));
            return lookahead_;
        }
        --remaining;
        ++idx;
    }

    lookahead_.kind = TokenKind::EndOfFile;
    lookahead_.lexeme.clear();
    lookahead_.loc = SourceLocation(0, 0, filename_);
    return lookahead_;
}

void TokenStreamAdapter::advance() {
    if (index_ < stream_.getTokens().size()) {
        ++index_;
    }
    refreshCurrent();
}

// -------- ExpanseParser --------

static std::string unquote(const std::string& text) {
    if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
        return text.substr(1, text.size() - 2);
    }
    return text;
}

ExpanseParser::ExpanseParser(TokenStreamAdapter& tokens,
                             expanse::ErrorReporter& errorReporter,
                             const std::string& filename)
    : tokens_(tokens)
    , errorReporter_(errorReporter)
    , filename_(filename)
    , currentModule_("main")
    , currentFile_(filename)
    , nextOrdinal_(1) {}

bool ExpanseParser::match(TokenKind kind) {
    if (current().kind == kind) {
        advance();
        return true;
    }
    return false;
}

bool ExpanseParser::expect(TokenKind kind, const char* message) {
    if (match(kind)) {
        return true;
    }
    errorReporter_.error(current().loc,
                         std::string("Syntax error: ") + message + ", found " +
                             tokenKindToString(current().kind),
                         ErrorCode(ErrorCodes::MISSING_TOKEN, "syntax"),
                         current().lexeme.size());
    return false;
}

void ExpanseParser::reportSyntaxError(const std::string& message,
                                      std::size_t length) {
    errorReporter_.error(current().loc, "Syntax error: " + message,
                         ErrorCode(ErrorCodes::SYNTAX_ERROR, "syntax"),
                         length);
}

// Skip to just past the next ';', or up to a '}' that may close the
// enclosing body.
void ExpanseParser::synchronize() {
    while (current().kind != TokenKind::EndOfFile) {
        if (current().kind == TokenKind::Semicolon) {
            advance();
            return;
        }
        if (current().kind == TokenKind::RBrace) {
            return;
        }
        advance();
    }
}

model::SiteContext ExpanseParser::nextSite(const std::string& scope) {
    return model::SiteContext(currentModule_, currentFile_, scope, nextOrdinal_++);
}

std::unique_ptr<model::Program> ExpanseParser::parseProgram() {
    auto program = std::make_unique<model::Program>();

    while (current().kind != TokenKind::EndOfFile) {
        if (current().kind == TokenKind::RBrace) {
            errorReporter_.error(current().loc, "Syntax error: unmatched '}'",
                                 ErrorCode(ErrorCodes::MISMATCHED_BRACKET, "syntax"), 1);
            advance();
            continue;
        }
        parseDeclaration(*program);
    }
    return program;
}

void ExpanseParser::parseDeclaration(model::Program& program) {
    switch (current().kind) {
    case TokenKind::KwModule:
        parseModuleDirective();
        break;
    case TokenKind::KwFile:
        parseFileDirective();
        break;
    case TokenKind::KwStruct:
    case TokenKind::KwClass:
    case TokenKind::KwInterface:
        parseTypeDecl(program);
        break;
    case TokenKind::KwExtension:
        parseExtension(program);
        break;
    case TokenKind::KwFunc:
        parseFunctionDecl(program, model::VisibilityLevel::Internal);
        break;
    case TokenKind::KwPublic:
    case TokenKind::KwInternal:
    case TokenKind::KwFilePrivate:
    case TokenKind::KwPrivate: {
        model::VisibilityLevel level = model::VisibilityLevel::Internal;
        parseAccessModifier(level);
        if (current().kind != TokenKind::KwFunc) {
            reportSyntaxError("expected 'func' after access modifier",
                              current().lexeme.size());
            synchronize();
            return;
        }
        parseFunctionDecl(program, level);
        break;
    }
    case TokenKind::KwLet:
        parseLetDecl(program);
        break;
    case TokenKind::Identifier:
        parseCallStmt(program);
        break;
    case TokenKind::Semicolon:
        // Stray separator
        advance();
        break;
    default:
        errorReporter_.error(current().loc,
                             std::string("Syntax error: unexpected ") +
                                 tokenKindToString(current().kind) + " at top level",
                             ErrorCode(ErrorCodes::UNEXPECTED_TOKEN, "syntax"),
                             current().lexeme.size());
        advance();
        synchronize();
        break;
    }
}

void ExpanseParser::parseModuleDirective() {
    // module Identifier;
    expect(TokenKind::KwModule, "expected 'module'");
    if (current().kind != TokenKind::Identifier) {
        reportSyntaxError("expected module name");
        synchronize();
        return;
    }
    currentModule_ = current().lexeme;
    advance();
    if (!expect(TokenKind::Semicolon, "expected ';' after module name")) {
        synchronize();
    }
}

void ExpanseParser::parseFileDirective() {
    // file "name";
    expect(TokenKind::KwFile, "expected 'file'");
    if (current().kind != TokenKind::StringLiteral) {
        reportSyntaxError("expected file name string");
        synchronize();
        return;
    }
    currentFile_ = unquote(current().lexeme);
    advance();
    if (!expect(TokenKind::Semicolon, "expected ';' after file name")) {
        synchronize();
    }
}

bool ExpanseParser::parseAccessModifier(model::VisibilityLevel& level) {
    switch (current().kind) {
    case TokenKind::KwPublic: level = model::VisibilityLevel::Public; break;
    case TokenKind::KwInternal: level = model::VisibilityLevel::Internal; break;
    case TokenKind::KwFilePrivate: level = model::VisibilityLevel::FilePrivate; break;
    case TokenKind::KwPrivate: level = model::VisibilityLevel::Private; break;
    default:
        return false;
    }
    advance();
    return true;
}

void ExpanseParser::parseTypeDecl(model::Program& program) {
    model::TypeDeclaration decl;
    decl.location = current().loc;
    switch (current().kind) {
    case TokenKind::KwClass: decl.kind = model::TypeDeclaration::Kind::Class; break;
    case TokenKind::KwInterface: decl.kind = model::TypeDeclaration::Kind::Interface; break;
    default: decl.kind = model::TypeDeclaration::Kind::Struct; break;
    }
    advance();

    if (current().kind != TokenKind::Identifier) {
        reportSyntaxError("expected type name");
        synchronize();
        return;
    }
    decl.name = current().lexeme;
    advance();

    if (match(TokenKind::Colon)) {
        if (current().kind != TokenKind::Identifier) {
            reportSyntaxError("expected supertype name after ':'");
            synchronize();
            return;
        }
        decl.supertype = current().lexeme;
        advance();
    }

    decl.declaredAt = nextSite("");
    bool ok = parseInitList(decl.name, decl.initializers);
    program.addType(std::move(decl));
    if (!ok) {
        synchronize();
    }
}

void ExpanseParser::parseExtension(model::Program& program) {
    model::ExtensionDeclaration decl;
    decl.location = current().loc;
    expect(TokenKind::KwExtension, "expected 'extension'");

    if (current().kind != TokenKind::Identifier) {
        reportSyntaxError("expected type name after 'extension'");
        synchronize();
        return;
    }
    decl.extendedType = current().lexeme;
    advance();

    decl.declaredAt = nextSite("");
    bool ok = parseInitList(decl.extendedType, decl.initializers);
    program.addExtension(std::move(decl));
    if (!ok) {
        synchronize();
    }
}

// '{' init* '}'
bool ExpanseParser::parseInitList(const std::string& scope,
                                  std::vector<model::InitDeclaration>& inits) {
    if (!expect(TokenKind::LBrace, "expected '{' to open the declaration body")) {
        return false;
    }

    while (current().kind != TokenKind::RBrace &&
           current().kind != TokenKind::EndOfFile) {
        model::VisibilityLevel level = model::VisibilityLevel::Internal;
        parseAccessModifier(level);
        if (current().kind != TokenKind::KwInit) {
            reportSyntaxError("only 'init' declarations may appear in a type body",
                              current().lexeme.size());
            synchronize();
            continue;
        }
        if (!parseInit(scope, level, inits)) {
            synchronize();
        }
    }

    if (current().kind != TokenKind::RBrace) {
        errorReporter_.error(current().loc,
                             "Syntax error: expected '}' to close the body of '" + scope + "'",
                             ErrorCode(ErrorCodes::MISMATCHED_BRACKET, "syntax"));
        return false;
    }
    advance();
    return true;
}

bool ExpanseParser::parseInit(const std::string& scope,
                              model::VisibilityLevel visibility,
                              std::vector<model::InitDeclaration>& inits) {
    model::InitDeclaration init;
    init.location = current().loc;
    init.visibility = visibility;
    expect(TokenKind::KwInit, "expected 'init'");

    if (!parseParameterList(init.parameters)) {
        return false;
    }
    if (!expect(TokenKind::Semicolon, "expected ';' after initializer")) {
        return false;
    }
    init.declaredAt = nextSite(scope);
    inits.push_back(std::move(init));
    return true;
}

void ExpanseParser::parseFunctionDecl(model::Program& program,
                                      model::VisibilityLevel visibility) {
    model::FunctionDeclaration decl;
    decl.location = current().loc;
    decl.visibility = visibility;
    expect(TokenKind::KwFunc, "expected 'func'");

    if (current().kind != TokenKind::Identifier) {
        reportSyntaxError("expected function name");
        synchronize();
        return;
    }
    decl.name = current().lexeme;
    decl.location = current().loc;
    advance();

    if (!parseParameterList(decl.parameters)) {
        synchronize();
        return;
    }

    decl.returnType = model::TypeRef::tuple({});
    if (match(TokenKind::Arrow)) {
        if (!parseType(decl.returnType)) {
            synchronize();
            return;
        }
    }

    if (!expect(TokenKind::Semicolon, "expected ';' after function declaration")) {
        synchronize();
        return;
    }
    decl.declaredAt = nextSite("");
    program.addFunction(std::move(decl));
}

void ExpanseParser::parseLetDecl(model::Program& program) {
    // let name: Type;
    model::VariableDeclaration decl;
    expect(TokenKind::KwLet, "expected 'let'");

    if (current().kind != TokenKind::Identifier) {
        reportSyntaxError("expected variable name");
        synchronize();
        return;
    }
    decl.name = current().lexeme;
    decl.location = current().loc;
    advance();

    if (!expect(TokenKind::Colon, "expected ':' after variable name") ||
        !parseType(decl.type) ||
        !expect(TokenKind::Semicolon, "expected ';' after variable declaration")) {
        synchronize();
        return;
    }
    decl.declaredAt = nextSite("");
    program.addVariable(std::move(decl));
}

void ExpanseParser::parseCallStmt(model::Program& program) {
    // callee(args) { trailing };
    model::CallStatement call;
    call.callee = current().lexeme;
    call.location = current().loc;
    advance();

    if (current().kind != TokenKind::LParen) {
        reportSyntaxError("expected '(' after '" + call.callee + "'");
        synchronize();
        return;
    }
    advance();

    if (!parseArgumentList(call.arguments)) {
        synchronize();
        return;
    }

    if (current().kind == TokenKind::LBrace) {
        model::ExprPtr closure = parseClosure();
        if (!closure) {
            synchronize();
            return;
        }
        call.arguments.push_back(model::CallArgument("", closure, true));
    }

    if (!expect(TokenKind::Semicolon, "expected ';' after call")) {
        synchronize();
        return;
    }
    call.site = nextSite("");
    program.addCall(std::move(call));
}

// '(' params? ')'
bool ExpanseParser::parseParameterList(std::vector<model::ParameterSyntax>& params) {
    if (!expect(TokenKind::LParen, "expected '(' to open the parameter list")) {
        return false;
    }
    if (match(TokenKind::RParen)) {
        return true;
    }

    while (true) {
        model::ParameterSyntax param;
        if (!parseParameter(param)) {
            return false;
        }
        params.push_back(std::move(param));
        if (match(TokenKind::Comma)) {
            continue;
        }
        break;
    }
    return expect(TokenKind::RParen, "expected ')' after parameters");
}

// (IDENT|'_') IDENT? ':' ('@' IDENT)* 'inout'? type ('=' expr)?
bool ExpanseParser::parseParameter(model::ParameterSyntax& param) {
    param.location = current().loc;
    if (current().kind == TokenKind::Identifier) {
        param.label = current().lexeme;
    } else if (current().kind != TokenKind::Underscore) {
        reportSyntaxError("expected parameter label or '_'", current().lexeme.size());
        return false;
    }
    advance();

    param.name = param.label;
    if (current().kind == TokenKind::Identifier) {
        param.name = current().lexeme;
        advance();
    }

    if (!expect(TokenKind::Colon, "expected ':' after parameter name")) {
        return false;
    }

    while (current().kind == TokenKind::At) {
        advance();
        if (current().kind != TokenKind::Identifier) {
            reportSyntaxError("expected attribute name after '@'");
            return false;
        }
        if (current().lexeme == "expanded") {
            param.isExpanded = true;
        } else {
            reportSyntaxError("unknown attribute '@" + current().lexeme + "'",
                              current().lexeme.size());
        }
        advance();
    }

    if (match(TokenKind::KwInout)) {
        param.isInout = true;
    }

    if (!parseType(param.type)) {
        return false;
    }

    if (match(TokenKind::Assign)) {
        param.defaultValue = parseExpression();
        if (!param.defaultValue) {
            return false;
        }
    }
    return true;
}

// args? ')', the '(' already consumed
bool ExpanseParser::parseArgumentList(model::ArgumentList& args) {
    if (match(TokenKind::RParen)) {
        return true;
    }

    while (true) {
        std::string label;
        SourceLocation labelLoc = current().loc;
        bool labeled = false;
        if (current().kind == TokenKind::Identifier &&
            tokens_.lookahead(1).kind == TokenKind::Colon) {
            label = current().lexeme;
            labeled = true;
            advance();
            advance();
        }

        model::ExprPtr value = parseExpression();
        if (!value) {
            return false;
        }
        model::CallArgument arg(label, value);
        if (labeled) {
            arg.location = labelLoc;
        }
        args.push_back(std::move(arg));

        if (match(TokenKind::Comma)) {
            continue;
        }
        break;
    }
    return expect(TokenKind::RParen, "expected ')' after arguments");
}

// primary '?'*
bool ExpanseParser::parseType(model::TypeRef& type) {
    if (!parsePrimaryType(type)) {
        return false;
    }
    while (match(TokenKind::Question)) {
        type = model::TypeRef::optional(type);
    }
    return true;
}

// IDENT | '(' (type (',' type)*)? ')' ('->' type)?
bool ExpanseParser::parsePrimaryType(model::TypeRef& type) {
    if (current().kind == TokenKind::Identifier) {
        type = model::TypeRef::unresolved(current().lexeme);
        advance();
        return true;
    }

    if (current().kind != TokenKind::LParen) {
        reportSyntaxError("expected type", current().lexeme.size());
        return false;
    }
    advance();

    std::vector<model::TypeRef> elements;
    if (current().kind != TokenKind::RParen) {
        while (true) {
            model::TypeRef element;
            if (!parseType(element)) {
                return false;
            }
            elements.push_back(element);
            if (match(TokenKind::Comma)) {
                continue;
            }
            break;
        }
    }
    if (!expect(TokenKind::RParen, "expected ')' in type")) {
        return false;
    }

    if (match(TokenKind::Arrow)) {
        model::TypeRef result;
        if (!parseType(result)) {
            return false;
        }
        type = model::TypeRef::function(std::move(elements), result);
        return true;
    }

    // A single parenthesized type is just that type
    if (elements.size() == 1) {
        type = elements.front();
    } else {
        type = model::TypeRef::tuple(std::move(elements));
    }
    return true;
}

model::ExprPtr ExpanseParser::parseExpression() {
    const Token& tok = current();
    SourceLocation loc = tok.loc;
    model::ExprPtr expr;

    switch (tok.kind) {
    case TokenKind::IntLiteral:
        expr = model::makeLiteral(loc, model::Expression::Kind::IntLiteral, tok.lexeme);
        break;
    case TokenKind::FloatLiteral:
        expr = model::makeLiteral(loc, model::Expression::Kind::FloatLiteral, tok.lexeme);
        break;
    case TokenKind::StringLiteral:
        expr = model::makeLiteral(loc, model::Expression::Kind::StringLiteral, unquote(tok.lexeme));
        break;
    case TokenKind::KwTrue:
    case TokenKind::KwFalse:
        expr = model::makeLiteral(loc, model::Expression::Kind::BoolLiteral, tok.lexeme);
        break;
    case TokenKind::KwNil:
        expr = model::makeLiteral(loc, model::Expression::Kind::NilLiteral, tok.lexeme);
        break;
    case TokenKind::Identifier:
        // Bound to the variable's declared type during elaboration
        expr = model::makeReference(loc, tok.lexeme, model::TypeRef::error());
        break;
    case TokenKind::LBrace:
        return parseClosure();
    default:
        reportSyntaxError(std::string("expected expression, found ") +
                              tokenKindToString(tok.kind),
                          tok.lexeme.size());
        return nullptr;
    }

    advance();
    return expr;
}

// '{' <balanced tokens> '}'; the body is kept as text
model::ExprPtr ExpanseParser::parseClosure() {
    SourceLocation loc = current().loc;
    expect(TokenKind::LBrace, "expected '{'");

    std::string body;
    int depth = 1;
    while (current().kind != TokenKind::EndOfFile) {
        if (current().kind == TokenKind::LBrace) {
            ++depth;
        } else if (current().kind == TokenKind::RBrace) {
            if (--depth == 0) {
                break;
            }
        }
        if (!body.empty()) {
            body += " ";
        }
        body += current().lexeme;
        advance();
    }

    if (current().kind != TokenKind::RBrace) {
        errorReporter_.error(loc, "Syntax error: unterminated closure",
                             ErrorCode(ErrorCodes::MISMATCHED_BRACKET, "syntax"), 1);
        return nullptr;
    }
    advance();
    return model::makeClosure(loc, body);
}

} // namespace parser
} // namespace expanse
