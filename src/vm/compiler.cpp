#include "vm/compiler.h"

#include "core/log.h"

// Indexed by TokenType; keep in enum order.
const ParseRule Compiler::s_rules[] = {
    {&Compiler::grouping, nullptr,          PREC_NONE},       // TOKEN_LEFT_PAREN
    {nullptr,             nullptr,          PREC_NONE},       // TOKEN_RIGHT_PAREN
    {nullptr,             nullptr,          PREC_NONE},       // TOKEN_LEFT_BRACE
    {nullptr,             nullptr,          PREC_NONE},       // TOKEN_RIGHT_BRACE
    {nullptr,             nullptr,          PREC_NONE},       // TOKEN_COMMA
    {nullptr,             nullptr,          PREC_NONE},       // TOKEN_DOT
    {&Compiler::unary,    &Compiler::binary, PREC_TERM},      // TOKEN_MINUS
    {nullptr,             &Compiler::binary, PREC_TERM},      // TOKEN_PLUS
    {nullptr,             nullptr,          PREC_NONE},       // TOKEN_SEMICOLON
    {nullptr,             &Compiler::binary, PREC_FACTOR},    // TOKEN_SLASH
    {nullptr,             &Compiler::binary, PREC_FACTOR},    // TOKEN_STAR
    {&Compiler::unary,    nullptr,          PREC_NONE},       // TOKEN_BANG
    {nullptr,             &Compiler::binary, PREC_EQUALITY},  // TOKEN_BANG_EQUAL
    {nullptr,             nullptr,          PREC_NONE},       // TOKEN_EQUAL
    {nullptr,             &Compiler::binary, PREC_EQUALITY},  // TOKEN_EQUAL_EQUAL
    {nullptr,             &Compiler::binary, PREC_COMPARISON},// TOKEN_GREATER
    {nullptr,             &Compiler::binary, PREC_COMPARISON},// TOKEN_GREATER_EQUAL
    {nullptr,             &Compiler::binary, PREC_COMPARISON},// TOKEN_LESS
    {nullptr,             &Compiler::binary, PREC_COMPARISON},// TOKEN_LESS_EQUAL
    {&Compiler::variable, nullptr,          PREC_NONE},       // TOKEN_IDENTIFIER
    {&Compiler::string,   nullptr,          PREC_NONE},       // TOKEN_STRING
    {&Compiler::number,   nullptr,          PREC_NONE},       // TOKEN_NUMBER
    {nullptr,             nullptr,          PREC_NONE},       // TOKEN_AND
    {nullptr,             nullptr,          PREC_NONE},       // TOKEN_CLASS
    {nullptr,             nullptr,          PREC_NONE},       // TOKEN_ELSE
    {&Compiler::literal,  nullptr,          PREC_NONE},       // TOKEN_FALSE
    {nullptr,             nullptr,          PREC_NONE},       // TOKEN_FOR
    {nullptr,             nullptr,          PREC_NONE},       // TOKEN_FUN
    {nullptr,             nullptr,          PREC_NONE},       // TOKEN_IF
    {&Compiler::literal,  nullptr,          PREC_NONE},       // TOKEN_NIL
    {nullptr,             nullptr,          PREC_NONE},       // TOKEN_OR
    {nullptr,             nullptr,          PREC_NONE},       // TOKEN_PRINT
    {nullptr,             nullptr,          PREC_NONE},       // TOKEN_RETURN
    {nullptr,             nullptr,          PREC_NONE},       // TOKEN_SUPER
    {nullptr,             nullptr,          PREC_NONE},       // TOKEN_THIS
    {&Compiler::literal,  nullptr,          PREC_NONE},       // TOKEN_TRUE
    {nullptr,             nullptr,          PREC_NONE},       // TOKEN_VAR
    {nullptr,             nullptr,          PREC_NONE},       // TOKEN_WHILE
    {nullptr,             nullptr,          PREC_NONE},       // TOKEN_ERROR
    {nullptr,             nullptr,          PREC_NONE},       // TOKEN_EOF
};

const ParseRule& Compiler::get_rule(TokenType type) const {
    static_assert(sizeof(s_rules) / sizeof(s_rules[0]) == TOKEN_COUNT,
                  "parse rule table must cover every token type");
    return s_rules[type];
}

bool Compiler::compile() {
    m_parser->advance();
    while (!m_aborted && !m_parser->match(TOKEN_EOF)) {
        declaration();
    }
    return end("<script>");
}

bool Compiler::compile_expression() {
    m_parser->advance();
    expression();
    if (!m_aborted) {
        m_parser->consume(TOKEN_EOF, "Expect end of expression.");
    }
    return end("<expr>");
}

bool Compiler::end(const char* name) {
    emit_return();

    if (m_parser->had_error()) {
        log_debug("Compilation of {} failed with {} error(s)", name, m_parser->errors().size());
        current_chunk()->clear();
        return false;
    }

    log_debug("Compiled {}: {} bytes, {} constants", name,
              current_chunk()->code_count(), current_chunk()->constant_count());
    if (m_config.print_code) {
        current_chunk()->print_disassembly(*m_heap, m_config.trace, name);
    }
    return true;
}
