#pragma once

#include <cstdint>

#include "log.h"

// Fixed-capacity array with checked indexing.
template <class T, uint32_t _Size>
class Array {
public:
    T _data[_Size];

    constexpr uint32_t size() const { return _Size; }

    const T* data() const { return _data; }
    T* data() { return _data; }

    const T* begin() const { return _data; }
    T* begin() { return _data; }

    const T* end() const { return _data + _Size; }
    T* end() { return _data + _Size; }

    const T& operator[](uint32_t i) const {
        log_assert(i < _Size, "Array index {} out of range (size {})", i, _Size);
        return _data[i];
    }
    T& operator[](uint32_t i) {
        log_assert(i < _Size, "Array index {} out of range (size {})", i, _Size);
        return _data[i];
    }
};
