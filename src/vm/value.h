#pragma once

#include <cstdint>
#include <string>
#include <type_traits>

#include "vm/object.h"

class Heap;

enum ValueType : uint8_t {
    VAL_NIL,
    VAL_BOOL,
    VAL_NUMBER,
    VAL_OBJ
};

struct Value {
    ValueType type;
    union {
        bool boolean;
        double number;
        ObjRef obj;
    } as;

    Value() : type(VAL_NIL) { as.number = 0; }

    // Need to do this template shenanigans to prevent any T* -> bool implicit conversions (C++ wtf)
    template <typename T, typename = std::enable_if_t<std::is_same_v<T, bool>>>
    explicit Value(T boolean) : type(VAL_BOOL) { as.boolean = boolean; }

    explicit Value(double number) : type(VAL_NUMBER) { as.number = number; }
    explicit Value(ObjRef obj) : type(VAL_OBJ) { as.obj = obj; }

    bool is_nil() const { return type == VAL_NIL; }
    bool is_bool() const { return type == VAL_BOOL; }
    bool is_number() const { return type == VAL_NUMBER; }
    bool is_obj() const { return type == VAL_OBJ; }

    bool as_bool() const { return as.boolean; }
    double as_number() const { return as.number; }
    ObjRef as_obj() const { return as.obj; }

    bool is_falsey() const {
        return is_nil() || (is_bool() && !as_bool());
    }
};

enum class ArithOp : uint8_t {
    Add,
    Subtract,
    Multiply,
    Divide
};

enum class CompareOp : uint8_t {
    Greater,
    Less
};

const char* arith_op_symbol(ArithOp op);
const char* compare_op_symbol(CompareOp op);

enum class ValueErrorKind : uint8_t {
    Arithmetic,
    Negation,
    Comparison
};

struct ValueError {
    ValueErrorKind kind;
    std::string message;
};

// Partial operators: return false and fill `error` when the operand types are
// not supported. `heap` receives the result of string concatenation.
bool value_arith(Heap& heap, ArithOp op, Value a, Value b, Value* result, ValueError* error);
bool value_negate(Value a, Value* result, ValueError* error);
bool value_compare(CompareOp op, Value a, Value b, Value* result, ValueError* error);

bool values_equal(const Heap& heap, Value a, Value b);

bool value_is_string(const Heap& heap, Value value);

std::string value_to_string(const Heap& heap, Value value);
