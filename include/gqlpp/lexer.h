#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/lexer.h — GraphQL source text to tokens
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    Lexer lexer("{ user(id: 1) { name } }");
//    for (auto tok = lexer.next(); tok.kind != TokenKind::Eof; tok = lexer.next()) {
//        ...
//    }
//
//  Tokens are produced one at a time; the only state is the cursor.
//  Once Eof is reached every further call returns Eof again.
// ═══════════════════════════════════════════════════════════════════

#include "errors.h"
#include <cstddef>
#include <string>
#include <string_view>

namespace gqlpp {

enum class TokenKind {
    Eof,
    Bang,        // !
    Dollar,      // $
    Amp,         // &
    ParenL,      // (
    ParenR,      // )
    Spread,      // ...
    Colon,       // :
    Equals,      // =
    At,          // @
    BracketL,    // [
    BracketR,    // ]
    BraceL,      // {
    Pipe,        // |
    BraceR,      // }
    Name,
    Int,
    Float,
    String,
    BlockString
};

const char* toString(TokenKind kind);

struct Token {
    TokenKind kind = TokenKind::Eof;
    std::string value;          // Name text, numeric text, or decoded string
    Location loc;

    // Human readable form used in parse errors: Name "user", "{", <EOF>
    std::string describe() const;
};

class Lexer {
public:
    explicit Lexer(std::string_view source);

    // Next significant token; throws LexError
    Token next();

    Location location() const { return {line_, static_cast<int>(pos_ - lineStart_) + 1}; }

private:
    std::string_view source_;
    std::size_t pos_ = 0;
    std::size_t lineStart_ = 0;
    int line_ = 1;

    char peek(std::size_t ahead = 0) const {
        return pos_ + ahead < source_.size() ? source_[pos_ + ahead] : '\0';
    }
    bool atEnd() const { return pos_ >= source_.size(); }

    void skipIgnored();
    void newline();

    Token readName(Location start);
    Token readNumber(Location start);
    Token readString(Location start);
    Token readBlockString(Location start);

    unsigned readHex4();
    // Copies one multi-byte UTF-8 sequence into out, rejecting malformed ones
    void readUtf8(std::string& out);
    [[noreturn]] void fail(const std::string& reason) const;
};

// ── Block string dedent (common indentation, blank edge lines) ──
std::string blockStringValue(const std::string& raw);

} // namespace gqlpp
