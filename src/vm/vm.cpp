#include "vm/vm.h"

#include "core/log.h"
#include "vm/compiler.h"
#include "vm/parser.h"

VM::VM(const Chunk& chunk, Heap& heap, const Config& config)
: m_chunk(chunk), m_heap(heap), m_config(config) {
    m_ip = m_chunk.m_code.data();
    m_stack_top = m_stack.data();
}

bool VM::get_global(std::string_view name, Value* value) const {
    auto it = m_globals.find(std::string(name));
    if (it == m_globals.end()) return false;
    *value = it->second;
    return true;
}

int32_t VM::current_line() const {
    if (m_chunk.code_count() == 0) return 0;
    int32_t offset = (int32_t)(m_ip - m_chunk.m_code.data()) - 1;
    if (offset < 0) offset = 0;
    if (offset >= m_chunk.code_count()) offset = m_chunk.code_count() - 1;
    return m_chunk.m_lines[offset];
}

void VM::trace_instruction(int32_t offset) const {
    fmt::print(m_config.trace, "          ");
    for (const Value* slot = m_stack.data(); slot < m_stack_top; slot++) {
        fmt::print(m_config.trace, "[ {} ]", value_to_string(m_heap, *slot));
    }
    fmt::print(m_config.trace, "\n");
    m_chunk.disassemble_instruction(m_heap, m_config.trace, offset);
    fflush(m_config.trace);
}

InterpretResult VM::run() {
    const uint8_t* code_end = m_chunk.m_code.data() + m_chunk.code_count();

#define READ_BYTE() (*m_ip++)
#define READ_CONSTANT() (m_chunk.m_constants[READ_BYTE()])
#define CHECK_OPERAND() \
    do { \
        if (m_ip >= code_end || *m_ip >= m_chunk.m_constants.size()) { \
            log_error("Bad constant operand at offset {}", (int32_t)(m_ip - m_chunk.m_code.data())); \
            return runtime_error(RuntimeErrorKind::InvalidBytecode, "Invalid constant operand."); \
        } \
    } while (false)
#define CHECK_STACK(n) \
    do { \
        if (stack_depth() < (n)) { \
            log_error("Stack underflow at offset {}", (int32_t)(m_ip - m_chunk.m_code.data()) - 1); \
            return runtime_error(RuntimeErrorKind::InvalidBytecode, "Stack underflow."); \
        } \
    } while (false)
#define PUSH(value) \
    do { \
        if (!push(value)) { \
            return runtime_error(RuntimeErrorKind::StackOverflow, "Stack overflow."); \
        } \
    } while (false)
#define READ_NAME(name) \
    do { \
        CHECK_OPERAND(); \
        Value name_value = READ_CONSTANT(); \
        name = value_is_string(m_heap, name_value) ? m_heap.get_string(name_value.as_obj()) : nullptr; \
        if (name == nullptr) { \
            log_error("Global name operand is not a string"); \
            return runtime_error(RuntimeErrorKind::InvalidBytecode, "Global name must be a string."); \
        } \
    } while (false)
#define ARITH_OP(op) \
    do { \
        CHECK_STACK(2); \
        Value b = pop(); \
        Value a = pop(); \
        Value result; \
        ValueError error; \
        if (!value_arith(m_heap, op, a, b, &result, &error)) { \
            return runtime_error(RuntimeErrorKind::Arithmetic, "{}", error.message); \
        } \
        PUSH(result); \
    } while (false)
#define COMPARE_OP(op) \
    do { \
        CHECK_STACK(2); \
        Value b = pop(); \
        Value a = pop(); \
        Value result; \
        ValueError error; \
        if (!value_compare(op, a, b, &result, &error)) { \
            return runtime_error(RuntimeErrorKind::Comparison, "{}", error.message); \
        } \
        PUSH(result); \
    } while (false)

    for (;;) {
        if (m_ip >= code_end) {
            log_error("Instruction pointer ran past the end of a {} byte chunk", m_chunk.code_count());
            return runtime_error(RuntimeErrorKind::InvalidBytecode, "Unexpected end of bytecode.");
        }

        if (m_config.trace_execution) {
            trace_instruction((int32_t)(m_ip - m_chunk.m_code.data()));
        }

        uint8_t byte = READ_BYTE();
        OpCode inst;
        if (!decode_opcode(byte, &inst)) {
            log_error("Unknown opcode {} at offset {}", byte, (int32_t)(m_ip - m_chunk.m_code.data()) - 1);
            return runtime_error(RuntimeErrorKind::InvalidBytecode, "Unknown opcode {}.", byte);
        }

        switch (inst) {
            case OP_RETURN: {
                if (stack_depth() > 0) {
                    m_result = pop();
                    m_has_result = true;
                }
                return InterpretResult::Ok;
            }
            case OP_CONSTANT: {
                CHECK_OPERAND();
                PUSH(READ_CONSTANT());
                break;
            }
            case OP_NEGATE: {
                CHECK_STACK(1);
                Value result;
                ValueError error;
                if (!value_negate(peek(0), &result, &error)) {
                    return runtime_error(RuntimeErrorKind::Negation, "{}", error.message);
                }
                pop();
                PUSH(result);
                break;
            }
            case OP_ADD: ARITH_OP(ArithOp::Add); break;
            case OP_SUBTRACT: ARITH_OP(ArithOp::Subtract); break;
            case OP_MULTIPLY: ARITH_OP(ArithOp::Multiply); break;
            case OP_DIVIDE: ARITH_OP(ArithOp::Divide); break;
            case OP_NIL: PUSH(Value()); break;
            case OP_TRUE: PUSH(Value(true)); break;
            case OP_FALSE: PUSH(Value(false)); break;
            case OP_NOT: {
                CHECK_STACK(1);
                PUSH(Value(pop().is_falsey()));
                break;
            }
            case OP_EQUAL: {
                CHECK_STACK(2);
                Value b = pop();
                Value a = pop();
                PUSH(Value(values_equal(m_heap, a, b)));
                break;
            }
            case OP_GREATER: COMPARE_OP(CompareOp::Greater); break;
            case OP_LESS: COMPARE_OP(CompareOp::Less); break;
            case OP_PRINT: {
                CHECK_STACK(1);
                fmt::print(m_config.out, "{}\n", value_to_string(m_heap, pop()));
                break;
            }
            case OP_POP: {
                CHECK_STACK(1);
                pop();
                break;
            }
            case OP_DEFINE_GLOBAL: {
                ObjString* name;
                READ_NAME(name);
                CHECK_STACK(1);
                m_globals[std::string(name->view())] = peek(0);
                pop();
                break;
            }
            case OP_GET_GLOBAL: {
                ObjString* name;
                READ_NAME(name);
                auto it = m_globals.find(std::string(name->view()));
                if (it == m_globals.end()) {
                    return runtime_error(RuntimeErrorKind::UndefinedVariable, "Undefined variable '{}'.", name->view());
                }
                PUSH(it->second);
                break;
            }
            case OP_SET_GLOBAL: {
                ObjString* name;
                READ_NAME(name);
                CHECK_STACK(1);
                auto it = m_globals.find(std::string(name->view()));
                if (it == m_globals.end()) {
                    return runtime_error(RuntimeErrorKind::UndefinedVariable, "Undefined variable '{}'.", name->view());
                }
                it->second = peek(0);
                break;
            }
            case OP_COUNT:
                return runtime_error(RuntimeErrorKind::InvalidBytecode, "Unknown opcode {}.", byte);
        }
    }

#undef READ_BYTE
#undef READ_CONSTANT
#undef CHECK_OPERAND
#undef CHECK_STACK
#undef PUSH
#undef READ_NAME
#undef ARITH_OP
#undef COMPARE_OP
}

static InterpretResult compile_and_run(std::string_view source, const Config& config, bool expression_mode,
                                       std::string* result, RuntimeError* error) {
    Heap heap;
    Chunk chunk;
    Parser parser;
    parser.init(source, config.err);
    Compiler compiler(&parser, &chunk, &heap, config);

    bool compiled = expression_mode ? compiler.compile_expression() : compiler.compile();
    if (!compiled) {
        return InterpretResult::CompileError;
    }

    VM vm(chunk, heap, config);
    InterpretResult res = vm.run();
    if (res == InterpretResult::RuntimeError) {
        log_debug("Runtime error on line {}: {}", vm.error().line, vm.error().message);
        if (error != nullptr) *error = vm.error();
        return res;
    }

    if (result != nullptr) {
        *result = vm.has_result() ? value_to_string(heap, vm.result()) : "nil";
    }
    return res;
}

InterpretResult interpret(std::string_view source, const Config& config, RuntimeError* error) {
    return compile_and_run(source, config, false, nullptr, error);
}

InterpretResult evaluate(std::string_view source, const Config& config, std::string* result, RuntimeError* error) {
    return compile_and_run(source, config, true, result, error);
}
