#pragma once

#include "core/vector.h"
#include "vm/scanner.h"

#include <fmt/core.h>

#include <cstdio>
#include <string>

enum class CompileErrorKind : uint8_t {
    Lexical,
    Syntax,
    InvalidAssignment,
    TooManyConstants,
    TooDeeplyNested
};

struct CompileError {
    CompileErrorKind kind = CompileErrorKind::Syntax;
    int32_t line = 0;
    bool at_end = false;
    std::string lexeme;
    std::string message;
};

// Token lookahead and error state for one compilation.
class Parser {
public:
    void init(std::string_view source, FILE* err) {
        m_scanner.init(source);
        m_err = err;
        m_had_error = false;
        m_panic_mode = false;
        m_errors.clear();
    }

    void advance() {
        m_previous = m_current;
        for (;;) {
            m_current = m_scanner.scan_token();
            if (m_current.type != TOKEN_ERROR) break;

            error_at(m_current, CompileErrorKind::Lexical, scan_error_message(m_scanner.last_error()));
        }
    }

    void consume(TokenType type, const char* message) {
        if (m_current.type == type) {
            advance();
            return;
        }
        error_at_current(message);
    }

    bool check(TokenType type) const {
        return m_current.type == type;
    }

    bool match(TokenType type) {
        if (!check(type)) return false;
        advance();
        return true;
    }

    // Skips to the next statement boundary so later errors are still reported.
    void synchronize() {
        m_panic_mode = false;

        while (m_current.type != TOKEN_EOF) {
            if (m_previous.type == TOKEN_SEMICOLON) return;
            switch (m_current.type) {
                case TOKEN_CLASS:
                case TOKEN_FUN:
                case TOKEN_VAR:
                case TOKEN_FOR:
                case TOKEN_IF:
                case TOKEN_WHILE:
                case TOKEN_PRINT:
                case TOKEN_RETURN:
                    return;

                default:
                    ;
            }
            advance();
        }
    }

    void error_at_current(const char* message) {
        error_at(m_current, CompileErrorKind::Syntax, message);
    }
    void error(const char* message) {
        error_at(m_previous, CompileErrorKind::Syntax, message);
    }
    void error(CompileErrorKind kind, const char* message) {
        error_at(m_previous, kind, message);
    }
    void error_at(const Token& token, CompileErrorKind kind, const char* message) {
        if (m_panic_mode) return;
        m_panic_mode = true;
        m_had_error = true;

        CompileError error;
        error.kind = kind;
        error.line = token.line;
        error.at_end = token.type == TOKEN_EOF;
        error.lexeme = std::string(token.lexeme());
        error.message = message;

        if (m_err != nullptr) {
            fmt::print(m_err, "[line {}] Error", error.line);
            if (error.at_end) {
                fmt::print(m_err, " at end");
            }
            else if (token.type == TOKEN_ERROR) {
                // The lexeme of a bad token can span lines; the message says enough.
            }
            else {
                fmt::print(m_err, " at '{}'", error.lexeme);
            }
            fmt::print(m_err, ": {}\n", error.message);
        }
        m_errors.push_back(std::move(error));
    }

    const Token& current() const { return m_current; }
    const Token& previous() const { return m_previous; }
    bool had_error() const { return m_had_error; }
    bool panic_mode() const { return m_panic_mode; }
    const Vector<CompileError>& errors() const { return m_errors; }

private:
    Scanner m_scanner;
    FILE* m_err = nullptr;

    Token m_current = {"", 0, 0, TOKEN_EOF};
    Token m_previous = {"", 0, 0, TOKEN_EOF};
    bool m_had_error = false;
    bool m_panic_mode = false;
    Vector<CompileError> m_errors;
};
