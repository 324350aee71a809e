// export_table.hpp -- definitions exported by one domain, keyed by name

#ifndef __APPD_EXPORT_TABLE_HPP
#define __APPD_EXPORT_TABLE_HPP

#include "array.hpp"
#include "base.hpp"
#include "names.hpp"
#include "table.hpp"

namespace appd {

// Maps qualified names to values (scripts or classes). Entries are kept in
// insertion order. A secondary index on the local name lets multiname lookups
// check each candidate namespace without building qualified names.
template<typename T> class export_table {
private:
    struct export_entry {
        qualified_name name;
        T val;
    };

    dyn_array<export_entry> entries;
    // indices into entries, by local name
    table<string,dyn_array<u32>> by_local;

    // index of name in entries, or -1
    i64 find(const qualified_name& name) const {
        auto x = by_local.get2(name.local);
        if (!x) {
            return -1;
        }
        for (auto i : x->val) {
            if (entries[i].name.ns == name.ns) {
                return i;
            }
        }
        return -1;
    }

public:
    u32 size() const {
        return entries.size;
    }

    bool contains(const qualified_name& name) const {
        return find(name) != -1;
    }

    // returns nullptr if the name isn't in the table
    const T* get(const qualified_name& name) const {
        auto i = find(name);
        return i == -1 ? nullptr : &entries[(u32)i].val;
    }

    // insert/overwrite an entry. Overwriting keeps the original position.
    void insert(const qualified_name& name, const T& v) {
        auto i = find(name);
        if (i != -1) {
            entries[(u32)i].val = v;
            return;
        }
        auto id = entries.size;
        entries.push_back(export_entry{name, v});
        auto x = by_local.get2(name.local);
        if (x) {
            x->val.push_back(id);
        } else {
            dyn_array<u32> ids;
            ids.push_back(id);
            by_local.insert(name.local, ids);
        }
    }

    // Find the first entry (in insertion order) with mn's local name whose
    // namespace is in mn's namespace set. If ns_out is non-null, the matching
    // namespace is written there. Returns nullptr for the any name.
    const T* get_for_multiname(const multiname& mn,
            ns_ref* ns_out=nullptr) const {
        if (mn.is_any_name()) {
            return nullptr;
        }
        auto x = by_local.get2(*mn.local);
        if (!x) {
            return nullptr;
        }
        for (auto i : x->val) {
            if (mn.has_ns(entries[i].name.ns)) {
                if (ns_out) {
                    *ns_out = entries[i].name.ns;
                }
                return &entries[i].val;
            }
        }
        return nullptr;
    }

    // all names in insertion order
    dyn_array<qualified_name> names() const {
        dyn_array<qualified_name> res;
        for (auto& e : entries) {
            res.push_back(e.name);
        }
        return res;
    }
};

}

#endif
