#include "vm/chunk.h"

#include "vm/heap.h"

#include <fmt/core.h>

void Chunk::write(OpCode opcode, int32_t line, std::initializer_list<uint8_t> bytes) {
    write(opcode, line);
    for (uint8_t byte : bytes) {
        write(byte, line);
    }
}

void Chunk::write(uint8_t byte, int32_t line) {
    m_code.push_back(byte);
    m_lines.push_back(line);
}

int32_t Chunk::add_constant(Value value) {
    if (m_constants.ssize() >= MaxConstants) {
        return -1;
    }
    m_constants.push_back(value);
    return m_constants.ssize() - 1;
}

void Chunk::clear() {
    m_code.clear();
    m_lines.clear();
    m_constants.clear();
}

void Chunk::print_disassembly(const Heap& heap, FILE* out, const char *name) const {
    fmt::print(out, "== {} ==\n", name);
    for (int32_t offset = 0; offset < m_code.ssize(); ) {
        offset = disassemble_instruction(heap, out, offset);
    }
}

int32_t Chunk::disassemble_instruction(const Heap& heap, FILE* out, int32_t offset) const {
    fmt::print(out, "{:04d} ", offset);
    if (offset > 0 && m_lines[offset] == m_lines[offset - 1]) {
        fmt::print(out, "   | ");
    }
    else {
        fmt::print(out, "{:4d} ", m_lines[offset]);
    }

    uint8_t instr = m_code[offset];
    OpCode opcode;
    if (!decode_opcode(instr, &opcode)) {
        fmt::print(out, "Unknown opcode {}\n", instr);
        return offset + 1;
    }

    switch (opcode_operand_count(opcode)) {
        case 0:
            return print_simple_instruction(out, opcode, offset);
        default:
            return print_constant_instruction(heap, out, opcode, offset);
    }
}

int32_t Chunk::print_simple_instruction(FILE* out, OpCode opcode, int32_t offset) const {
    fmt::print(out, "{}\n", g_opcode_str[opcode]);
    return offset + 1;
}

int32_t Chunk::print_constant_instruction(const Heap& heap, FILE* out, OpCode opcode, int32_t offset) const {
    if (offset + 1 >= m_code.ssize()) {
        fmt::print(out, "{:16s} <truncated>\n", g_opcode_str[opcode]);
        return m_code.ssize();
    }
    uint8_t constant_loc = m_code[offset + 1];
    if (constant_loc >= m_constants.size()) {
        fmt::print(out, "{:16s} {:4d} <out of range>\n", g_opcode_str[opcode], constant_loc);
        return offset + 2;
    }
    fmt::print(out, "{:16s} {:4d} '{}'\n", g_opcode_str[opcode], constant_loc,
               value_to_string(heap, m_constants[constant_loc]));
    return offset + 2;
}
