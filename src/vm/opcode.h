#pragma once

#include <cstdint>

// Byte encoding is part of the chunk format: append new opcodes at the end,
// never renumber existing ones.
#define OPCODE_LIST(X)          \
    X(OP_RETURN, 0)             \
    X(OP_CONSTANT, 1)           \
    X(OP_NEGATE, 2)             \
    X(OP_ADD, 3)                \
    X(OP_SUBTRACT, 4)           \
    X(OP_MULTIPLY, 5)           \
    X(OP_DIVIDE, 6)             \
    X(OP_NIL, 7)                \
    X(OP_TRUE, 8)               \
    X(OP_FALSE, 9)              \
    X(OP_NOT, 10)               \
    X(OP_EQUAL, 11)             \
    X(OP_GREATER, 12)           \
    X(OP_LESS, 13)              \
    X(OP_PRINT, 14)             \
    X(OP_POP, 15)               \
    X(OP_DEFINE_GLOBAL, 16)     \
    X(OP_GET_GLOBAL, 17)        \
    X(OP_SET_GLOBAL, 18)

enum OpCode : uint8_t {
#define X(name, code) name = code,
    OPCODE_LIST(X)
#undef X
    OP_COUNT
};

extern const char* g_opcode_str[OP_COUNT];

// Fails on any byte that is not a member of OPCODE_LIST.
bool decode_opcode(uint8_t byte, OpCode* opcode);

// Number of operand bytes following the opcode.
int32_t opcode_operand_count(OpCode opcode);
