#pragma once

#include "core/vector.h"

#include "vm/opcode.h"
#include "vm/value.h"

#include <cstdio>
#include <initializer_list>

class Heap;

class Chunk {
public:
    // Constant operands are a single byte.
    static constexpr int32_t MaxConstants = UINT8_MAX + 1;

    Vector<uint8_t> m_code;
    Vector<int32_t> m_lines;
    Vector<Value> m_constants;

    Chunk() = default;

    int32_t code_count() const { return m_code.ssize(); }
    int32_t constant_count() const { return m_constants.ssize(); }

    void write(OpCode opcode, int32_t line, std::initializer_list<uint8_t> bytes);
    void write(uint8_t byte, int32_t line);

    // Returns the index of the new constant, or -1 when the pool is full.
    int32_t add_constant(Value value);

    void clear();

    void print_disassembly(const Heap& heap, FILE* out, const char* name) const;

    // Prints the instruction at `offset` and returns the offset of the next one.
    int32_t disassemble_instruction(const Heap& heap, FILE* out, int32_t offset) const;

private:
    int32_t print_simple_instruction(FILE* out, OpCode opcode, int32_t offset) const;

    int32_t print_constant_instruction(const Heap& heap, FILE* out, OpCode opcode, int32_t offset) const;
};
