#pragma once

#include "vm/chunk.h"
#include "vm/config.h"
#include "vm/heap.h"
#include "vm/parser.h"

#include <cstdlib>
#include <string>

enum Precedence : uint8_t {
    PREC_NONE,
    PREC_ASSIGNMENT,  // =
    PREC_OR,          // or
    PREC_AND,         // and
    PREC_EQUALITY,    // == !=
    PREC_COMPARISON,  // < > <= >=
    PREC_TERM,        // + -
    PREC_FACTOR,      // * /
    PREC_UNARY,       // ! -
    PREC_CALL,        // . ()
    PREC_PRIMARY
};

class Compiler;
using ParseFn = void (Compiler::*)(bool);

struct ParseRule {
    ParseFn prefix;
    ParseFn infix;
    Precedence precedence;
};

#define MEMBER_FN(object,ptrToMember)  ((object).*(ptrToMember))

// Single-pass compiler: drives the parser and emits bytecode straight into
// `chunk`, with string constants allocated in `heap`. One instance compiles
// one source. On failure the chunk is left empty.
class Compiler {
public:
    static constexpr int32_t MaxNestingDepth = 200;

    Compiler(Parser* parser, Chunk* chunk, Heap* heap, const Config& config)
    : m_parser(parser), m_chunk(chunk), m_heap(heap), m_config(config) {}

    // program -> declaration* EOF
    bool compile();

    // A single expression followed by EOF; its value is left for OP_RETURN.
    bool compile_expression();

private:
    Chunk* current_chunk() const {
        return m_chunk;
    }

    void emit_byte(uint8_t byte) {
        current_chunk()->write(byte, m_parser->previous().line);
    }

    void emit_byte_at(uint8_t byte, int32_t line) {
        current_chunk()->write(byte, line);
    }

    void emit_bytes(uint8_t byte1, uint8_t byte2) {
        emit_byte(byte1);
        emit_byte(byte2);
    }

    void emit_return() {
        emit_byte(OP_RETURN);
    }

    uint8_t make_constant(Value value) {
        int32_t constant = current_chunk()->add_constant(value);
        if (constant == -1) {
            if (value.is_obj()) m_heap->release(value.as_obj());
            m_parser->error(CompileErrorKind::TooManyConstants, "Too many constants in one chunk.");
            m_aborted = true;
            return 0;
        }
        return (uint8_t) constant;
    }

    void emit_constant(Value value) {
        emit_bytes(OP_CONSTANT, make_constant(value));
    }

    bool end(const char* name);

    void expression() {
        parse_precedence(PREC_ASSIGNMENT);
    }

    void var_declaration() {
        uint8_t global = parse_variable("Expect variable name.");
        if (m_parser->match(TOKEN_EQUAL)) {
            expression();
        }
        else {
            emit_byte(OP_NIL);
        }
        m_parser->consume(TOKEN_SEMICOLON, "Expect ';' after variable declaration.");
        define_variable(global);
    }

    void print_statement() {
        expression();
        m_parser->consume(TOKEN_SEMICOLON, "Expect ';' after value.");
        emit_byte(OP_PRINT);
    }

    void expression_statement() {
        expression();
        m_parser->consume(TOKEN_SEMICOLON, "Expect ';' after expression.");
        emit_byte(OP_POP);
    }

    void declaration() {
        if (m_parser->match(TOKEN_VAR)) {
            var_declaration();
        }
        else {
            statement();
        }

        if (m_parser->panic_mode()) m_parser->synchronize();
    }

    void statement() {
        if (m_parser->match(TOKEN_PRINT)) {
            print_statement();
        }
        else {
            expression_statement();
        }
    }

    void grouping(bool can_assign) {
        expression();
        m_parser->consume(TOKEN_RIGHT_PAREN, "Expect ')' after expression.");
    }

    void number(bool can_assign) {
        std::string lexeme(m_parser->previous().lexeme());
        double value = strtod(lexeme.c_str(), nullptr);
        emit_constant(Value(value));
    }

    void string(bool can_assign) {
        const Token& token = m_parser->previous();
        ObjRef str = m_heap->create_string(token.start + 1, token.length - 2);
        emit_constant(Value(str));
    }

    void named_variable(const Token& name, bool can_assign) {
        uint8_t arg = identifier_constant(name);

        if (can_assign && m_parser->match(TOKEN_EQUAL)) {
            expression();
            emit_bytes(OP_SET_GLOBAL, arg);
        }
        else {
            emit_bytes(OP_GET_GLOBAL, arg);
        }
    }

    void variable(bool can_assign) {
        named_variable(m_parser->previous(), can_assign);
    }

    void unary(bool can_assign) {
        TokenType op_type = m_parser->previous().type;
        int32_t line = m_parser->previous().line;

        parse_precedence(PREC_UNARY);

        switch (op_type) {
            case TOKEN_BANG: emit_byte_at(OP_NOT, line); break;
            case TOKEN_MINUS: emit_byte_at(OP_NEGATE, line); break;
            default: return; // Unreachable.
        }
    }

    void binary(bool can_assign) {
        TokenType op_type = m_parser->previous().type;
        int32_t line = m_parser->previous().line;
        ParseRule rule = get_rule(op_type);
        parse_precedence((Precedence)(rule.precedence + 1));

        switch (op_type) {
            case TOKEN_BANG_EQUAL:    emit_byte_at(OP_EQUAL, line); emit_byte_at(OP_NOT, line); break;
            case TOKEN_EQUAL_EQUAL:   emit_byte_at(OP_EQUAL, line); break;
            case TOKEN_GREATER:       emit_byte_at(OP_GREATER, line); break;
            case TOKEN_GREATER_EQUAL: emit_byte_at(OP_LESS, line); emit_byte_at(OP_NOT, line); break;
            case TOKEN_LESS:          emit_byte_at(OP_LESS, line); break;
            case TOKEN_LESS_EQUAL:    emit_byte_at(OP_GREATER, line); emit_byte_at(OP_NOT, line); break;
            case TOKEN_PLUS:          emit_byte_at(OP_ADD, line); break;
            case TOKEN_MINUS:         emit_byte_at(OP_SUBTRACT, line); break;
            case TOKEN_STAR:          emit_byte_at(OP_MULTIPLY, line); break;
            case TOKEN_SLASH:         emit_byte_at(OP_DIVIDE, line); break;
            default: return; // Unreachable.
        }
    }

    void literal(bool can_assign) {
        switch (m_parser->previous().type) {
            case TOKEN_FALSE: emit_byte(OP_FALSE); break;
            case TOKEN_NIL: emit_byte(OP_NIL); break;
            case TOKEN_TRUE: emit_byte(OP_TRUE); break;
            default: return; // Unreachable.
        }
    }

    void parse_precedence(Precedence precedence) {
        if (m_depth >= MaxNestingDepth) {
            m_parser->error_at(m_parser->current(), CompileErrorKind::TooDeeplyNested, "Expression too deeply nested.");
            return;
        }
        m_depth++;

        m_parser->advance();
        ParseFn prefix_rule = get_rule(m_parser->previous().type).prefix;
        if (prefix_rule == nullptr) {
            m_parser->error("Expect expression.");
        }
        else {
            bool can_assign = precedence <= PREC_ASSIGNMENT;
            MEMBER_FN(*this, prefix_rule)(can_assign);

            while (!m_aborted && precedence <= get_rule(m_parser->current().type).precedence) {
                m_parser->advance();
                ParseFn infix_rule = get_rule(m_parser->previous().type).infix;
                MEMBER_FN(*this, infix_rule)(can_assign);
            }

            if (can_assign && m_parser->match(TOKEN_EQUAL)) {
                m_parser->error(CompileErrorKind::InvalidAssignment, "Invalid assignment target.");
            }
        }

        m_depth--;
    }

    uint8_t identifier_constant(const Token& name) {
        return make_constant(Value(m_heap->create_string(name.lexeme())));
    }

    uint8_t parse_variable(const char* error_message) {
        m_parser->consume(TOKEN_IDENTIFIER, error_message);
        if (m_parser->previous().type != TOKEN_IDENTIFIER) return 0;

        return identifier_constant(m_parser->previous());
    }

    void define_variable(uint8_t global) {
        emit_bytes(OP_DEFINE_GLOBAL, global);
    }

    const ParseRule& get_rule(TokenType type) const;

    static const ParseRule s_rules[];

    Parser* m_parser = nullptr;
    Chunk* m_chunk = nullptr;
    Heap* m_heap = nullptr;
    const Config& m_config;

    int32_t m_depth = 0;
    bool m_aborted = false;
};

#undef MEMBER_FN
