#pragma once

#include "expanse/source_location.h"
#include <string>

namespace expanse {
namespace parser {

// Token kinds used by the hand-written parser. Decoupled from the generated
// ANTLR lexer so the parser logic does not depend on its headers.
enum class TokenKind {
    EndOfFile,
    Identifier,
    IntLiteral,
    FloatLiteral,
    StringLiteral,

    // Keywords
    KwModule,
    KwFile,
    KwStruct,
    KwClass,
    KwInterface,
    KwExtension,
    KwInit,
    KwFunc,
    KwLet,
    KwPublic,
    KwInternal,
    KwFilePrivate,
    KwPrivate,
    KwInout,
    KwTrue,
    KwFalse,
    KwNil,

    // Punctuation
    LParen,
    RParen,
    LBrace,
    RBrace,
    Colon,
    Semicolon,
    Comma,
    At,
    Question,
    Assign,
    Underscore,
    Arrow,

    // Anything else that may appear inside a closure body
    Operator,
};

struct Token {
    TokenKind kind;
    std::string lexeme;
    expanse::SourceLocation loc;
};

const char* tokenKindToString(TokenKind kind);

} // namespace parser
} // namespace expanse
