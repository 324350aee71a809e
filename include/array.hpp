#ifndef __APPD_ARRAY_HPP
#define __APPD_ARRAY_HPP

#include <cstdlib>
#include <new>
#include <type_traits>
#include <utility>

#include "base.hpp"

namespace appd {

// Dynamic array type. This is used as a lightweight alternative to std::vector.
// Indexing is not bounds checked; callers that need checks (e.g.
// memory_region) do them up front.
template<typename t>
struct dyn_array {
    u32 capacity;
    u32 size;
    t* data;

    dyn_array()
        : capacity{16}
        , size{0}
        , data{(t*)malloc(sizeof(t)*capacity)} {
        if (data == nullptr) {
            throw std::bad_alloc{};
        }
    }
    dyn_array(const dyn_array<t>& other)
        : capacity{other.capacity}
        , size{other.size}
        , data{(t*)malloc(other.capacity*sizeof(t))} {
        if (data == nullptr) {
            throw std::bad_alloc{};
        }
        for (u32 i = 0; i < size; ++i) {
            new(&data[i]) t{other[i]};
        }
    }
    dyn_array(dyn_array<t>&& other)
        : capacity{other.capacity}
        , size{other.size}
        , data{other.data} {
        other.capacity = 0;
        other.size = 0;
        other.data = nullptr;
    }
    ~dyn_array() {
        for (u32 i = 0; i < size; ++i) {
            data[i].~t();
        }
        free(data);
    }
    dyn_array& operator= (const dyn_array<t>& other) {
        if (this == &other) {
            return *this;
        }
        dyn_array<t> tmp{other};
        *this = std::move(tmp);
        return *this;
    }
    dyn_array& operator= (dyn_array<t>&& other) {
        std::swap(capacity, other.capacity);
        std::swap(size, other.size);
        std::swap(data, other.data);
        return *this;
    }

    // Grow the buffer so it can hold at least min_cap elements. On allocation
    // failure this throws std::bad_alloc and the array is left unchanged.
    void ensure_capacity(u32 min_cap) {
        if (capacity >= min_cap) {
            return;
        }
        u64 new_cap = capacity == 0 ? 16 : capacity;
        while (new_cap < min_cap) {
            new_cap *= 2;
        }
        if (new_cap > UINT32_MAX) {
            new_cap = UINT32_MAX;
        }
        t* new_data;
        if constexpr (std::is_trivially_copyable<t>::value) {
            new_data = (t*)realloc(data, new_cap*sizeof(t));
            if (new_data == nullptr) {
                throw std::bad_alloc{};
            }
        } else {
            new_data = (t*)malloc(new_cap*sizeof(t));
            if (new_data == nullptr) {
                throw std::bad_alloc{};
            }
            for (u32 i = 0; i < size; ++i) {
                new(&new_data[i]) t{std::move(data[i])};
                data[i].~t();
            }
            free(data);
        }
        data = new_data;
        capacity = (u32)new_cap;
    }
    void push_back(const t& item) {
        ensure_capacity(size + 1);
        new(&data[size]) t{item};
        ++size;
    }
    void push_back(t&& item) {
        ensure_capacity(size + 1);
        new(&data[size]) t{std::move(item)};
        ++size;
    }

    // change the size. New elements are value-initialized (so numeric types
    // become 0) and elements past new_size are destroyed.
    void resize(u32 new_size) {
        if (new_size < size) {
            for (u32 i = new_size; i < size; ++i) {
                data[i].~t();
            }
            size = new_size;
            return;
        }
        ensure_capacity(new_size);
        for (u32 i = size; i < new_size; ++i) {
            new(&data[i]) t{};
        }
        size = new_size;
    }

    inline t& operator[](u32 i) {
        return data[i];
    }
    inline const t& operator[](u32 i) const {
        return data[i];
    }

    struct iterator {
        u32 i;
        dyn_array<t>* arr;
        t& operator*() {
            return (*arr)[i];
        }
        iterator& operator++() {
            ++i;
            return *this;
        }
        bool operator!=(const iterator& other) const {
            return i != other.i;
        }
    };
    iterator begin() {
        return iterator {.i = 0, .arr=this};
    }
    iterator end() {
        return iterator {.i = size, .arr=this};
    }

    struct const_iterator {
        u32 i;
        const dyn_array<t>* arr;
        const t& operator*() const {
            return (*arr)[i];
        }
        const_iterator& operator++() {
            ++i;
            return *this;
        }
        bool operator!=(const const_iterator& other) const {
            return i != other.i;
        }
    };
    const_iterator begin() const {
        return const_iterator {.i = 0, .arr=this};
    }
    const_iterator end() const {
        return const_iterator {.i = size, .arr=this};
    }
};

}

#endif
