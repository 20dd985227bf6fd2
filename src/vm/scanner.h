#pragma once

#include <cstdint>
#include <cstring>
#include <string_view>

enum TokenType : uint8_t {
    // Single-character tokens.
    TOKEN_LEFT_PAREN, TOKEN_RIGHT_PAREN,
    TOKEN_LEFT_BRACE, TOKEN_RIGHT_BRACE,
    TOKEN_COMMA, TOKEN_DOT, TOKEN_MINUS, TOKEN_PLUS,
    TOKEN_SEMICOLON, TOKEN_SLASH, TOKEN_STAR,
    // One or two character tokens.
    TOKEN_BANG, TOKEN_BANG_EQUAL,
    TOKEN_EQUAL, TOKEN_EQUAL_EQUAL,
    TOKEN_GREATER, TOKEN_GREATER_EQUAL,
    TOKEN_LESS, TOKEN_LESS_EQUAL,
    // Literals.
    TOKEN_IDENTIFIER, TOKEN_STRING, TOKEN_NUMBER,
    // Keywords.
    TOKEN_AND, TOKEN_CLASS, TOKEN_ELSE, TOKEN_FALSE,
    TOKEN_FOR, TOKEN_FUN, TOKEN_IF, TOKEN_NIL, TOKEN_OR,
    TOKEN_PRINT, TOKEN_RETURN, TOKEN_SUPER, TOKEN_THIS,
    TOKEN_TRUE, TOKEN_VAR, TOKEN_WHILE,

    TOKEN_ERROR, TOKEN_EOF,

    TOKEN_COUNT
};

struct Token {
    const char* start;
    int32_t line;
    int32_t length;
    TokenType type;

    std::string_view lexeme() const { return std::string_view(start, (size_t)length); }
};

enum class ScanError : uint8_t {
    None,
    UnexpectedCharacter,
    UnterminatedString
};

inline const char* scan_error_message(ScanError error) {
    switch (error) {
        case ScanError::None: return "";
        case ScanError::UnexpectedCharacter: return "Unexpected character.";
        case ScanError::UnterminatedString: return "Unterminated string.";
    }
    return "";
}

inline bool is_alpha(char c) {
    return (c >= 'a' && c <= 'z') ||
           (c >= 'A' && c <= 'Z') ||
           c == '_';
}

inline bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

// Produces one token per call. After the end of input every call returns
// TOKEN_EOF. A lexical fault yields a TOKEN_ERROR token spanning the
// offending text; last_error() and error_offset() describe it.
class Scanner {
public:
    void init(std::string_view source) {
        m_source = source.data();
        m_start = source.data();
        m_current = source.data();
        m_end = source.data() + source.size();
        m_line = 1;
        m_error = ScanError::None;
        m_error_offset = -1;
    }

    Token scan_token() {
        skip_whitespace();

        m_start = m_current;
        if (is_at_end()) return make_token(TOKEN_EOF);

        char c = advance();
        if (is_alpha(c)) return identifier();
        if (is_digit(c)) return number();

        switch (c) {
            case '(': return make_token(TOKEN_LEFT_PAREN);
            case ')': return make_token(TOKEN_RIGHT_PAREN);
            case '{': return make_token(TOKEN_LEFT_BRACE);
            case '}': return make_token(TOKEN_RIGHT_BRACE);
            case ';': return make_token(TOKEN_SEMICOLON);
            case ',': return make_token(TOKEN_COMMA);
            case '.': return make_token(TOKEN_DOT);
            case '-': return make_token(TOKEN_MINUS);
            case '+': return make_token(TOKEN_PLUS);
            case '/': return make_token(TOKEN_SLASH);
            case '*': return make_token(TOKEN_STAR);
            case '!': return make_token(match('=') ? TOKEN_BANG_EQUAL : TOKEN_BANG);
            case '=': return make_token(match('=') ? TOKEN_EQUAL_EQUAL : TOKEN_EQUAL);
            case '<': return make_token(match('=') ? TOKEN_LESS_EQUAL : TOKEN_LESS);
            case '>': return make_token(match('=') ? TOKEN_GREATER_EQUAL : TOKEN_GREATER);
            case '"': return string();
        }
        return error_token(ScanError::UnexpectedCharacter);
    }

    ScanError last_error() const { return m_error; }

    // Byte offset of the lexeme that produced the last error token.
    int32_t error_offset() const { return m_error_offset; }

private:
    bool is_at_end() const {
        return m_current >= m_end;
    }

    char advance() {
        m_current++;
        return m_current[-1];
    }

    char peek() const {
        if (is_at_end()) return '\0';
        return *m_current;
    }

    char peek_next() const {
        if (m_current + 1 >= m_end) return '\0';
        return m_current[1];
    }

    bool match(char expected) {
        if (is_at_end()) return false;
        if (*m_current != expected) return false;
        m_current++;
        return true;
    }

    Token make_token(TokenType type) const {
        Token token;
        token.start = m_start;
        token.line = m_line;
        token.length = (int32_t)(m_current - m_start);
        token.type = type;
        return token;
    }

    Token error_token(ScanError error) {
        m_error = error;
        m_error_offset = (int32_t)(m_start - m_source);
        return make_token(TOKEN_ERROR);
    }

    void skip_whitespace() {
        for (;;) {
            char c = peek();
            switch (c) {
                case ' ':
                case '\r':
                case '\t':
                    advance();
                    break;
                case '\n':
                    m_line++;
                    advance();
                    break;
                case '/':
                    if (peek_next() == '/') {
                        while (peek() != '\n' && !is_at_end()) advance();
                        break;
                    }
                    return;
                default:
                    return;
            }
        }
    }

    TokenType check_keyword(int32_t start, int32_t length, const char* rest, TokenType type) const {
        if (m_current - m_start == start + length &&
            memcmp(m_start + start, rest, (size_t)length) == 0) {
            return type;
        }
        return TOKEN_IDENTIFIER;
    }

    TokenType identifier_type() const {
        switch (m_start[0]) {
            case 'a': return check_keyword(1, 2, "nd", TOKEN_AND);
            case 'c': return check_keyword(1, 4, "lass", TOKEN_CLASS);
            case 'e': return check_keyword(1, 3, "lse", TOKEN_ELSE);
            case 'f':
                if (m_current - m_start > 1) {
                    switch (m_start[1]) {
                        case 'a': return check_keyword(2, 3, "lse", TOKEN_FALSE);
                        case 'o': return check_keyword(2, 1, "r", TOKEN_FOR);
                        case 'u': return check_keyword(2, 1, "n", TOKEN_FUN);
                    }
                }
                break;
            case 'i': return check_keyword(1, 1, "f", TOKEN_IF);
            case 'n': return check_keyword(1, 2, "il", TOKEN_NIL);
            case 'o': return check_keyword(1, 1, "r", TOKEN_OR);
            case 'p': return check_keyword(1, 4, "rint", TOKEN_PRINT);
            case 'r': return check_keyword(1, 5, "eturn", TOKEN_RETURN);
            case 's': return check_keyword(1, 4, "uper", TOKEN_SUPER);
            case 't':
                if (m_current - m_start > 1) {
                    switch (m_start[1]) {
                        case 'h': return check_keyword(2, 2, "is", TOKEN_THIS);
                        case 'r': return check_keyword(2, 2, "ue", TOKEN_TRUE);
                    }
                }
                break;
            case 'v': return check_keyword(1, 2, "ar", TOKEN_VAR);
            case 'w': return check_keyword(1, 4, "hile", TOKEN_WHILE);
        }

        return TOKEN_IDENTIFIER;
    }

    Token identifier() {
        while (is_alpha(peek()) || is_digit(peek())) advance();
        return make_token(identifier_type());
    }

    Token number() {
        while (is_digit(peek())) advance();

        // A trailing '.' without digits is left for the next token.
        if (peek() == '.' && is_digit(peek_next())) {
            advance();
            while (is_digit(peek())) advance();
        }

        return make_token(TOKEN_NUMBER);
    }

    Token string() {
        while (peek() != '"' && !is_at_end()) {
            if (peek() == '\n') m_line++;
            advance();
        }
        if (is_at_end()) return error_token(ScanError::UnterminatedString);
        advance();
        return make_token(TOKEN_STRING);
    }

    const char* m_source = nullptr;
    const char* m_start = nullptr;
    const char* m_current = nullptr;
    const char* m_end = nullptr;
    int32_t m_line = 1;
    ScanError m_error = ScanError::None;
    int32_t m_error_offset = -1;
};
