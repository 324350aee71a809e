#ifndef __APPD_TABLE_HPP
#define __APPD_TABLE_HPP

#include <cstdlib>
#include <new>

#include "base.hpp"

namespace appd {

static const float REHASH_THRESHOLD = 0.75;

/// hash table using linear probing. Keys must have a hash<K> specialization.
template <typename K, typename T> class table {
public:
    // hash table entry
    struct entry {
        bool live;
        K key;
        T val;

        entry(const K& k, const T& v) : live{true}, key{k}, val{v} { }
    };

private:
    u32 cap;
    u32 threshold;
    u32 size;
    entry* array;

    static entry* alloc_entries(u32 n) {
        auto res = (entry*)malloc(sizeof(entry)*n);
        if (res == nullptr) {
            throw std::bad_alloc{};
        }
        for (u32 i = 0; i < n; ++i) {
            res[i].live = false;
        }
        return res;
    }

    void destroy_entries() {
        for (u32 i = 0; i < cap; ++i) {
            if (array[i].live) {
                array[i].~entry();
            }
        }
        free(array);
    }

    // slot holding k, or the empty slot where k would go
    u32 find_slot(const K& k) const {
        u32 i = hash<K>(k) % cap;
        while (array[i].live && !(array[i].key == k)) {
            i = (i+1) % cap;
        }
        return i;
    }

    // increase the capacity by a factor of 2. this involves recomputing all hashes
    void increase_cap() {
        auto prev = array;
        auto old_cap = cap;

        array = alloc_entries(cap*2);
        cap *= 2;
        threshold = (u32)(REHASH_THRESHOLD * cap);
        size = 0;

        // move the old data over, destroying old entries as we go
        for (u32 i=0; i<old_cap; ++i) {
            if (prev[i].live) {
                auto j = find_slot(prev[i].key);
                new (&array[j]) entry{prev[i].key, prev[i].val};
                ++size;
                prev[i].~entry();
            }
        }
        free(prev);
    }

public:
    table(u32 init_cap=8)
        : cap{init_cap}
        , threshold{(u32)(REHASH_THRESHOLD * (float) init_cap)}
        , size{0}
        , array{alloc_entries(init_cap)} {
    }
    table(const table<K,T>& src)
        : cap{src.cap}
        , threshold{src.threshold}
        , size{src.size}
        , array{alloc_entries(src.cap)} {
        for (u32 i = 0; i < cap; ++i) {
            if (src.array[i].live) {
                new (&array[i]) entry{src.array[i].key, src.array[i].val};
            }
        }
    }
    ~table() {
        destroy_entries();
    }

    table<K,T>& operator=(const table<K,T>& src) {
        if (this == &src) {
            return *this;
        }
        auto new_array = alloc_entries(src.cap);
        for (u32 i = 0; i < src.cap; ++i) {
            if (src.array[i].live) {
                new (&new_array[i]) entry{src.array[i].key, src.array[i].val};
            }
        }
        destroy_entries();
        cap = src.cap;
        threshold = src.threshold;
        size = src.size;
        array = new_array;
        return *this;
    }

    u32 get_size() const {
        return size;
    }

    // insert/overwrite a new entry
    T& insert(const K& k, T v) {
        if (size >= threshold) {
            increase_cap();
        }

        auto i = find_slot(k);
        if (array[i].live) {
            array[i].val = v;
        } else {
            new (&array[i]) entry{k, v};
            ++size;
        }
        return array[i].val;
    }

    // pointer to the entry for k, or nullptr if there isn't one. The value may
    // be updated in place.
    entry* get2(const K& k) {
        auto i = find_slot(k);
        return array[i].live ? &array[i] : nullptr;
    }
    const entry* get2(const K& k) const {
        auto i = find_slot(k);
        return array[i].live ? &array[i] : nullptr;
    }
};


}

#endif
