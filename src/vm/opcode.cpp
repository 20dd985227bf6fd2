#include "vm/opcode.h"

namespace {
enum OpCodePosition {
#define X(name, code) name##_POSITION,
    OPCODE_LIST(X)
#undef X
};
}

#define X(name, code) static_assert(code == name##_POSITION, "opcodes must be listed in encoding order without gaps");
OPCODE_LIST(X)
#undef X

const char* g_opcode_str[OP_COUNT] = {
#define X(name, code) #name,
    OPCODE_LIST(X)
#undef X
};

bool decode_opcode(uint8_t byte, OpCode* opcode) {
    switch (byte) {
#define X(name, code) case code: *opcode = name; return true;
        OPCODE_LIST(X)
#undef X
        default:
            return false;
    }
}

int32_t opcode_operand_count(OpCode opcode) {
    switch (opcode) {
        case OP_CONSTANT:
        case OP_DEFINE_GLOBAL:
        case OP_GET_GLOBAL:
        case OP_SET_GLOBAL:
            return 1;
        default:
            return 0;
    }
}
