// ═══════════════════════════════════════════════════════════════════
//  src/lexer.cpp — Tokenizer for GraphQL executable documents
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/lexer.h"

#include <cstdio>
#include <vector>

namespace gqlpp {

namespace detail {

inline bool isNameStart(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

inline bool isNameContinue(char c) {
    return isNameStart(c) || (c >= '0' && c <= '9');
}

inline bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

inline std::string printChar(char c) {
    if (c == '\0') return "<EOF>";
    auto u = static_cast<unsigned char>(c);
    if (u < 0x20 || u >= 0x7F) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "U+%04X", u);
        return buf;
    }
    return std::string("\"") + c + "\"";
}

inline std::string hexByte(unsigned char u) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02X", u);
    return buf;
}

inline void appendUtf8(std::string& out, unsigned cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

inline bool isBlank(const std::string& line) {
    return line.find_first_not_of(" \t") == std::string::npos;
}

} // namespace detail

const char* toString(TokenKind kind) {
    switch (kind) {
        case TokenKind::Eof:         return "<EOF>";
        case TokenKind::Bang:        return "!";
        case TokenKind::Dollar:      return "$";
        case TokenKind::Amp:         return "&";
        case TokenKind::ParenL:      return "(";
        case TokenKind::ParenR:      return ")";
        case TokenKind::Spread:      return "...";
        case TokenKind::Colon:       return ":";
        case TokenKind::Equals:      return "=";
        case TokenKind::At:          return "@";
        case TokenKind::BracketL:    return "[";
        case TokenKind::BracketR:    return "]";
        case TokenKind::BraceL:      return "{";
        case TokenKind::Pipe:        return "|";
        case TokenKind::BraceR:      return "}";
        case TokenKind::Name:        return "Name";
        case TokenKind::Int:         return "Int";
        case TokenKind::Float:       return "Float";
        case TokenKind::String:      return "String";
        case TokenKind::BlockString: return "BlockString";
    }
    return "?";
}

std::string Token::describe() const {
    switch (kind) {
        case TokenKind::Eof:
            return "<EOF>";
        case TokenKind::Name:
        case TokenKind::Int:
        case TokenKind::Float:
        case TokenKind::String:
        case TokenKind::BlockString:
            return std::string(toString(kind)) + " \"" + value + "\"";
        default:
            return std::string("\"") + toString(kind) + "\"";
    }
}

std::string blockStringValue(const std::string& raw) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (true) {
        auto nl = raw.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(raw.substr(start));
            break;
        }
        lines.push_back(raw.substr(start, nl - start));
        start = nl + 1;
    }

    std::size_t commonIndent = std::string::npos;
    for (std::size_t i = 1; i < lines.size(); ++i) {
        auto indent = lines[i].find_first_not_of(" \t");
        if (indent == std::string::npos) continue;
        if (indent < commonIndent) commonIndent = indent;
    }
    if (commonIndent != std::string::npos && commonIndent > 0) {
        for (std::size_t i = 1; i < lines.size(); ++i) {
            lines[i] = lines[i].size() >= commonIndent ? lines[i].substr(commonIndent) : "";
        }
    }

    std::size_t first = 0;
    std::size_t last = lines.size();
    while (first < last && detail::isBlank(lines[first])) ++first;
    while (last > first && detail::isBlank(lines[last - 1])) --last;

    std::string value;
    for (std::size_t i = first; i < last; ++i) {
        if (i > first) value += '\n';
        value += lines[i];
    }
    return value;
}

// ═══════════════════════════════════════════
//  Lexer
// ═══════════════════════════════════════════

Lexer::Lexer(std::string_view source) : source_(source) {
    if (source_.size() >= 3 &&
        static_cast<unsigned char>(source_[0]) == 0xEF &&
        static_cast<unsigned char>(source_[1]) == 0xBB &&
        static_cast<unsigned char>(source_[2]) == 0xBF) {
        pos_ = 3;
        lineStart_ = 3;
    }
}

void Lexer::fail(const std::string& reason) const {
    throw LexError(location(), reason);
}

void Lexer::newline() {
    ++line_;
    lineStart_ = pos_;
}

void Lexer::skipIgnored() {
    while (!atEnd()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == ',') {
            ++pos_;
        } else if (c == '\n') {
            ++pos_;
            newline();
        } else if (c == '\r') {
            ++pos_;
            if (peek() == '\n') ++pos_;
            newline();
        } else if (c == '#') {
            while (!atEnd() && peek() != '\n' && peek() != '\r') ++pos_;
        } else {
            return;
        }
    }
}

Token Lexer::next() {
    skipIgnored();
    Location start = location();
    if (atEnd()) return Token{TokenKind::Eof, "", start};

    auto punct = [&](TokenKind kind, std::size_t width) {
        pos_ += width;
        return Token{kind, "", start};
    };

    char c = peek();
    switch (c) {
        case '!': return punct(TokenKind::Bang, 1);
        case '$': return punct(TokenKind::Dollar, 1);
        case '&': return punct(TokenKind::Amp, 1);
        case '(': return punct(TokenKind::ParenL, 1);
        case ')': return punct(TokenKind::ParenR, 1);
        case ':': return punct(TokenKind::Colon, 1);
        case '=': return punct(TokenKind::Equals, 1);
        case '@': return punct(TokenKind::At, 1);
        case '[': return punct(TokenKind::BracketL, 1);
        case ']': return punct(TokenKind::BracketR, 1);
        case '{': return punct(TokenKind::BraceL, 1);
        case '|': return punct(TokenKind::Pipe, 1);
        case '}': return punct(TokenKind::BraceR, 1);
        case '.':
            if (peek(1) == '.' && peek(2) == '.') return punct(TokenKind::Spread, 3);
            fail("Unexpected \".\", did you mean \"...\"?");
        case '"':
            if (peek(1) == '"' && peek(2) == '"') return readBlockString(start);
            return readString(start);
        default:
            break;
    }

    if (detail::isNameStart(c)) return readName(start);
    if (detail::isDigit(c) || c == '-') return readNumber(start);

    if (c == '\'') fail("Unexpected single quote character ('), did you mean to use a double quote (\")?");
    fail("Unexpected character: " + detail::printChar(c) + ".");
}

Token Lexer::readName(Location start) {
    std::size_t begin = pos_;
    while (!atEnd() && detail::isNameContinue(peek())) ++pos_;
    return Token{TokenKind::Name, std::string(source_.substr(begin, pos_ - begin)), start};
}

Token Lexer::readNumber(Location start) {
    std::size_t begin = pos_;
    bool isFloat = false;

    auto readDigits = [&]() {
        if (!detail::isDigit(peek())) {
            fail("Invalid number, expected digit but got: " + detail::printChar(peek()) + ".");
        }
        while (detail::isDigit(peek())) ++pos_;
    };

    if (peek() == '-') ++pos_;

    if (peek() == '0') {
        ++pos_;
        if (detail::isDigit(peek())) {
            fail("Invalid number, unexpected digit after 0: " + detail::printChar(peek()) + ".");
        }
    } else {
        readDigits();
    }

    if (peek() == '.') {
        isFloat = true;
        ++pos_;
        readDigits();
    }

    if (peek() == 'e' || peek() == 'E') {
        isFloat = true;
        ++pos_;
        if (peek() == '+' || peek() == '-') ++pos_;
        readDigits();
    }

    if (peek() == '.' || detail::isNameStart(peek())) {
        fail("Invalid number, expected digit but got: " + detail::printChar(peek()) + ".");
    }

    return Token{isFloat ? TokenKind::Float : TokenKind::Int,
                 std::string(source_.substr(begin, pos_ - begin)), start};
}

unsigned Lexer::readHex4() {
    unsigned value = 0;
    for (int i = 0; i < 4; ++i) {
        char c = peek();
        value <<= 4;
        if (c >= '0' && c <= '9')      value |= static_cast<unsigned>(c - '0');
        else if (c >= 'a' && c <= 'f') value |= static_cast<unsigned>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') value |= static_cast<unsigned>(c - 'A' + 10);
        else fail("Invalid Unicode escape sequence.");
        ++pos_;
    }
    return value;
}

void Lexer::readUtf8(std::string& out) {
    auto lead = static_cast<unsigned char>(peek());
    std::size_t length = 0;
    unsigned char low = 0x80, high = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) low = 0xA0;    // overlong
        if (lead == 0xED) high = 0x9F;   // surrogates
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) low = 0x90;    // overlong
        if (lead == 0xF4) high = 0x8F;   // above U+10FFFF
    }
    if (length == 0) fail("Invalid UTF-8 sequence within String: " + detail::hexByte(lead) + ".");

    for (std::size_t i = 1; i < length; ++i) {
        auto c = static_cast<unsigned char>(peek(i));
        if (c < low || c > high) {
            fail("Invalid UTF-8 sequence within String: " + detail::hexByte(lead) + " followed by " +
                 detail::hexByte(c) + ".");
        }
        low = 0x80;
        high = 0xBF;
    }
    out.append(source_.substr(pos_, length));
    pos_ += length;
}

Token Lexer::readString(Location start) {
    ++pos_;   // opening quote
    std::string value;

    while (true) {
        if (atEnd() || peek() == '\n' || peek() == '\r') {
            fail("Unterminated string.");
        }
        char c = peek();
        if (c == '"') {
            ++pos_;
            return Token{TokenKind::String, std::move(value), start};
        }
        if (static_cast<unsigned char>(c) < 0x20 && c != '\t') {
            fail("Invalid character within String: " + detail::printChar(c) + ".");
        }
        if (static_cast<unsigned char>(c) >= 0x80) {
            readUtf8(value);
            continue;
        }
        if (c != '\\') {
            value += c;
            ++pos_;
            continue;
        }

        ++pos_;
        char esc = peek();
        ++pos_;
        switch (esc) {
            case '"':  value += '"'; break;
            case '\\': value += '\\'; break;
            case '/':  value += '/'; break;
            case 'b':  value += '\b'; break;
            case 'f':  value += '\f'; break;
            case 'n':  value += '\n'; break;
            case 'r':  value += '\r'; break;
            case 't':  value += '\t'; break;
            case 'u': {
                unsigned cp = readHex4();
                if (cp >= 0xD800 && cp <= 0xDBFF) {
                    if (peek() != '\\' || peek(1) != 'u') {
                        fail("Invalid Unicode escape sequence: unpaired surrogate.");
                    }
                    pos_ += 2;
                    unsigned low = readHex4();
                    if (low < 0xDC00 || low > 0xDFFF) {
                        fail("Invalid Unicode escape sequence: unpaired surrogate.");
                    }
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                    fail("Invalid Unicode escape sequence: unpaired surrogate.");
                }
                detail::appendUtf8(value, cp);
                break;
            }
            default:
                if (esc == '\0') fail("Unterminated string.");
                fail(std::string("Invalid character escape sequence: \"\\") + esc + "\".");
        }
    }
}

Token Lexer::readBlockString(Location start) {
    pos_ += 3;
    std::string raw;

    while (true) {
        if (atEnd()) fail("Unterminated string.");
        char c = peek();
        if (c == '"' && peek(1) == '"' && peek(2) == '"') {
            pos_ += 3;
            return Token{TokenKind::BlockString, blockStringValue(raw), start};
        }
        if (c == '\\' && peek(1) == '"' && peek(2) == '"' && peek(3) == '"') {
            raw += "\"\"\"";
            pos_ += 4;
        } else if (c == '\n') {
            raw += '\n';
            ++pos_;
            newline();
        } else if (c == '\r') {
            raw += '\n';
            ++pos_;
            if (peek() == '\n') ++pos_;
            newline();
        } else if (static_cast<unsigned char>(c) >= 0x80) {
            readUtf8(raw);
        } else {
            raw += c;
            ++pos_;
        }
    }
}

} // namespace gqlpp
