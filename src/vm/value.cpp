#include "vm/value.h"

#include "vm/heap.h"
#include "vm/string.h"

#include <fmt/format.h>

#include <cmath>

const char* arith_op_symbol(ArithOp op) {
    switch (op) {
        case ArithOp::Add:      return "+";
        case ArithOp::Subtract: return "-";
        case ArithOp::Multiply: return "*";
        case ArithOp::Divide:   return "/";
    }
    return "?";
}

const char* compare_op_symbol(CompareOp op) {
    switch (op) {
        case CompareOp::Greater: return ">";
        case CompareOp::Less:    return "<";
    }
    return "?";
}

bool value_arith(Heap& heap, ArithOp op, Value a, Value b, Value* result, ValueError* error) {
    if (a.is_number() && b.is_number()) {
        double x = a.as_number();
        double y = b.as_number();
        switch (op) {
            case ArithOp::Add:      *result = Value(x + y); break;
            case ArithOp::Subtract: *result = Value(x - y); break;
            case ArithOp::Multiply: *result = Value(x * y); break;
            case ArithOp::Divide:   *result = Value(x / y); break;
        }
        return true;
    }

    if (op == ArithOp::Add) {
        if (value_is_string(heap, a) && value_is_string(heap, b)) {
            *result = Value(heap.concat_strings(a.as_obj(), b.as_obj()));
            return true;
        }
        error->kind = ValueErrorKind::Arithmetic;
        error->message = "Operands of '+' must be two numbers or two strings.";
        return false;
    }

    error->kind = ValueErrorKind::Arithmetic;
    error->message = fmt::format("Operands of '{}' must be numbers.", arith_op_symbol(op));
    return false;
}

bool value_negate(Value a, Value* result, ValueError* error) {
    if (!a.is_number()) {
        error->kind = ValueErrorKind::Negation;
        error->message = "Operand of '-' must be a number.";
        return false;
    }
    *result = Value(-a.as_number());
    return true;
}

bool value_compare(CompareOp op, Value a, Value b, Value* result, ValueError* error) {
    if (!a.is_number() || !b.is_number()) {
        error->kind = ValueErrorKind::Comparison;
        error->message = fmt::format("Operands of '{}' must be numbers.", compare_op_symbol(op));
        return false;
    }
    switch (op) {
        case CompareOp::Greater: *result = Value(a.as_number() > b.as_number()); break;
        case CompareOp::Less:    *result = Value(a.as_number() < b.as_number()); break;
    }
    return true;
}

bool values_equal(const Heap& heap, Value a, Value b) {
    if (a.type != b.type) return false;
    switch (a.type) {
        case VAL_NIL:    return true;
        case VAL_BOOL:   return a.as_bool() == b.as_bool();
        case VAL_NUMBER: return a.as_number() == b.as_number();
        case VAL_OBJ: {
            if (a.as_obj() == b.as_obj()) return true;
            const ObjString* x = heap.get_string(a.as_obj());
            const ObjString* y = heap.get_string(b.as_obj());
            if (x == nullptr || y == nullptr) return false;
            return obj_strings_equal(x, y);
        }
    }
    return false;
}

bool value_is_string(const Heap& heap, Value value) {
    return value.is_obj() && heap.get_string(value.as_obj()) != nullptr;
}

std::string value_to_string(const Heap& heap, Value value) {
    switch (value.type) {
        case VAL_NIL:    return "nil";
        case VAL_BOOL:   return value.as_bool() ? "true" : "false";
        case VAL_NUMBER:
            // Sign of a NaN is not meaningful.
            if (std::isnan(value.as_number())) return "nan";
            return fmt::format("{}", value.as_number());
        case VAL_OBJ: {
            Obj* obj = heap.get(value.as_obj());
            if (obj == nullptr) return "<freed>";
            switch (obj->type) {
                case OBJ_STRING: return std::string(reinterpret_cast<ObjString*>(obj)->view());
            }
            return "";
        }
    }
    return "";
}
