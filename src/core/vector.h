#pragma once

#include <type_traits>
#include <initializer_list>
#include <cstdint>
#include <cstring>
#include <utility>

#include "log.h"

// Growable array. Elements must be default-constructible and copy-assignable;
// storage is always fully constructed up to capacity.
template <class T>
class Vector {
    uint32_t m_capacity = 0, m_size = 0;
    T* m_data = nullptr;

public:
    Vector() = default;

    explicit Vector(uint32_t size) : m_capacity(size), m_size(size), m_data(size ? new T[size] : nullptr) {}

    Vector(uint32_t size, const T& item) : Vector(size) {
        for (uint32_t i = 0; i < m_size; i++) {
            m_data[i] = item;
        }
    }

    ~Vector() {
        delete[] m_data;
    }

    Vector(const Vector& other) : m_capacity(other.m_size), m_size(other.m_size),
                                  m_data(other.m_size ? new T[other.m_size] : nullptr)
    {
        copy(other.m_data, other.m_size, m_data);
    }

    friend void swap(Vector& first, Vector& second) noexcept {
        using std::swap;

        swap(first.m_capacity, second.m_capacity);
        swap(first.m_size, second.m_size);
        swap(first.m_data, second.m_data);
    }

    Vector(Vector&& other) noexcept {
        swap(*this, other);
    }

    Vector& operator=(Vector other) {
        swap(*this, other);
        return *this;
    }

    Vector(std::initializer_list<T> lst) : Vector((uint32_t)lst.size()) {
        uint32_t i = 0;
        for (const T& item : lst) {
            m_data[i++] = item;
        }
    }

    uint32_t size() const { return m_size; }
    int32_t ssize() const { return (int32_t)m_size; }

    uint32_t capacity() const { return m_capacity; }

    const T* data() const { return m_data; }
    T* data() { return m_data; }

    const T* begin() const { return m_data; }
    T* begin() { return m_data; }

    const T* end() const { return m_data + m_size; }
    T* end() { return m_data + m_size; }

    const T& operator[](uint32_t i) const {
        log_assert(i < m_size, "Vector index {} out of range (size {})", i, m_size);
        return m_data[i];
    }
    T& operator[](uint32_t i) {
        log_assert(i < m_size, "Vector index {} out of range (size {})", i, m_size);
        return m_data[i];
    }

    const T& back() const { return m_data[m_size - 1]; }
    T& back() { return m_data[m_size - 1]; }

    bool empty() const { return m_size == 0; }

    void push_back(T elem) {
        ensure_capacity(m_size + 1);
        m_data[m_size++] = std::move(elem);
    }

    T pop_back() {
        log_assert(m_size > 0, "pop_back on empty Vector");
        return std::move(m_data[--m_size]);
    }

    void reserve(uint32_t new_capacity) {
        if (new_capacity <= m_capacity) return;
        reallocate(new_capacity);
    }

    void clear() {
        delete[] m_data;
        m_data = nullptr;
        m_capacity = m_size = 0;
    }

private:
    static void copy(const T* src, uint32_t n, T* dst) {
        if constexpr (std::is_trivially_copyable<T>::value) {
            if (n > 0) memcpy(dst, src, sizeof(T) * n);
        }
        else {
            for (uint32_t i = 0; i < n; i++) {
                dst[i] = src[i];
            }
        }
    }

    void reallocate(uint32_t new_capacity) {
        T* new_data = new T[new_capacity];
        for (uint32_t i = 0; i < m_size; i++) {
            new_data[i] = std::move(m_data[i]);
        }
        delete[] m_data;
        m_data = new_data;
        m_capacity = new_capacity;
    }

    void ensure_capacity(uint32_t min_capacity) {
        if (min_capacity <= m_capacity) return;
        uint32_t new_capacity = m_capacity * 2;
        if (new_capacity < min_capacity) new_capacity = min_capacity < 8 ? 8 : min_capacity;
        reallocate(new_capacity);
    }
};
