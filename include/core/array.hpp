#pragma once

#include "core/types.hpp"
#include <new>

namespace strata::system {

/**
 * @brief Growable array backed by the kernel heap
 * 
 * Elements must be default-constructible and move-assignable. Storage
 * comes from the nothrow forms of operator new[], which the embedding
 * kernel's heap provides; growth reports allocation failure through the
 * return value so callers can unwind and report OUT_OF_MEMORY.
 */
template<typename T>
class DynamicArray {
private:
    T* m_data;
    u32 m_size;
    u32 m_capacity;

public:
    DynamicArray() : m_data(nullptr), m_size(0), m_capacity(0) {}
    
    ~DynamicArray() {
        delete[] m_data;
    }
    
    DynamicArray(DynamicArray&& other) noexcept
        : m_data(other.m_data), m_size(other.m_size), m_capacity(other.m_capacity) {
        other.m_data = nullptr;
        other.m_size = 0;
        other.m_capacity = 0;
    }
    
    DynamicArray& operator=(DynamicArray&& other) noexcept {
        if (this != &other) {
            delete[] m_data;
            m_data = other.m_data;
            m_size = other.m_size;
            m_capacity = other.m_capacity;
            other.m_data = nullptr;
            other.m_size = 0;
            other.m_capacity = 0;
        }
        return *this;
    }
    
    // Prevent copying
    DynamicArray(const DynamicArray&) = delete;
    DynamicArray& operator=(const DynamicArray&) = delete;
    
    /**
     * @brief Ensure room for at least capacity elements
     * @return false if the allocation failed (contents unchanged)
     */
    bool reserve(u32 capacity) {
        if (capacity <= m_capacity) return true;
        
        T* grown = new (std::nothrow) T[capacity];
        if (!grown) return false;
        
        for (u32 i = 0; i < m_size; i++) {
            grown[i] = static_cast<T&&>(m_data[i]);
        }
        delete[] m_data;
        m_data = grown;
        m_capacity = capacity;
        return true;
    }
    
    /**
     * @brief Resize to count elements, default-constructing new slots
     */
    bool resize(u32 count) {
        if (!reserve(count)) return false;
        for (u32 i = m_size; i < count; i++) {
            m_data[i] = T();
        }
        m_size = count;
        return true;
    }
    
    bool push_back(const T& value) {
        if (m_size == m_capacity && !reserve(m_capacity ? m_capacity * 2 : 4)) {
            return false;
        }
        m_data[m_size++] = value;
        return true;
    }
    
    bool push_back(T&& value) {
        if (m_size == m_capacity && !reserve(m_capacity ? m_capacity * 2 : 4)) {
            return false;
        }
        m_data[m_size++] = static_cast<T&&>(value);
        return true;
    }
    
    void pop_back() {
        if (m_size > 0) {
            m_data[--m_size] = T();
        }
    }
    
    /**
     * @brief Remove element at index, preserving order of the rest
     */
    void remove_at(u32 index) {
        if (index >= m_size) return;
        for (u32 i = index; i + 1 < m_size; i++) {
            m_data[i] = static_cast<T&&>(m_data[i + 1]);
        }
        pop_back();
    }
    
    void clear() {
        delete[] m_data;
        m_data = nullptr;
        m_size = 0;
        m_capacity = 0;
    }
    
    void swap(DynamicArray& other) {
        T* data = m_data;
        u32 size = m_size;
        u32 capacity = m_capacity;
        m_data = other.m_data;
        m_size = other.m_size;
        m_capacity = other.m_capacity;
        other.m_data = data;
        other.m_size = size;
        other.m_capacity = capacity;
    }
    
    T& operator[](u32 index) { return m_data[index]; }
    const T& operator[](u32 index) const { return m_data[index]; }
    
    T& back() { return m_data[m_size - 1]; }
    
    T* data() { return m_data; }
    const T* data() const { return m_data; }
    
    u32 size() const { return m_size; }
    u32 capacity() const { return m_capacity; }
    bool empty() const { return m_size == 0; }
};

} // namespace strata::system
