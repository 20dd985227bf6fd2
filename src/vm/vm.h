#pragma once

#include "core/array.h"
#include "core/map.h"
#include "vm/chunk.h"
#include "vm/config.h"
#include "vm/heap.h"
#include "vm/value.h"

#include <fmt/core.h>

#include <string>
#include <string_view>

enum class InterpretResult {
    Ok,
    CompileError,
    RuntimeError
};

enum class RuntimeErrorKind : uint8_t {
    UndefinedVariable,
    Arithmetic,
    Negation,
    Comparison,
    StackOverflow,
    InvalidBytecode
};

struct RuntimeError {
    RuntimeErrorKind kind = RuntimeErrorKind::InvalidBytecode;
    std::string message;
    int32_t line = 0;
};

// Executes one chunk. The chunk is borrowed read-only for the lifetime of the
// VM; the heap receives strings created at runtime. A VM runs exactly once.
class VM {
public:
    static constexpr int32_t MaxStackSize = 256;

    VM(const Chunk& chunk, Heap& heap, const Config& config);

    InterpretResult run();

    const RuntimeError& error() const { return m_error; }

    // Value popped by OP_RETURN, if the stack was not empty.
    bool has_result() const { return m_has_result; }
    Value result() const { return m_result; }

    bool get_global(std::string_view name, Value* value) const;
    int32_t global_count() const { return (int32_t)m_globals.size(); }

    int32_t stack_depth() const { return (int32_t)(m_stack_top - m_stack.data()); }

private:
    bool push(Value value) {
        if (m_stack_top == m_stack.end()) return false;
        *m_stack_top = value;
        m_stack_top++;
        return true;
    }

    Value pop() {
        m_stack_top--;
        return *m_stack_top;
    }

    Value peek(int32_t distance) const {
        return m_stack_top[-1 - distance];
    }

    int32_t current_line() const;

    void trace_instruction(int32_t offset) const;

    template <typename ...Args>
    InterpretResult runtime_error(RuntimeErrorKind kind, fmt::format_string<Args...> fmt, Args&&... args) {
        m_error.kind = kind;
        m_error.message = fmt::format(fmt, std::forward<Args>(args)...);
        m_error.line = current_line();
        return InterpretResult::RuntimeError;
    }

    const Chunk& m_chunk;
    Heap& m_heap;
    const Config& m_config;

    const uint8_t* m_ip = nullptr;

    Array<Value, MaxStackSize> m_stack;
    Value* m_stack_top = nullptr;

    Map<std::string, Value> m_globals;

    RuntimeError m_error;
    Value m_result;
    bool m_has_result = false;
};

// Compiles and runs a program in a fresh heap and VM. `error` receives the
// runtime fault, if any.
InterpretResult interpret(std::string_view source, const Config& config, RuntimeError* error = nullptr);

// Compiles a single expression, runs it and writes the display form of its
// value to `result`.
InterpretResult evaluate(std::string_view source, const Config& config, std::string* result, RuntimeError* error = nullptr);
