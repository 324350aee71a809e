#include "script.hpp"

namespace appd {

bool value::operator==(const value& v) const {
    if (kind != v.kind) {
        return false;
    }
    switch (kind) {
    case vk_number:
        return num == v.num;
    case vk_string:
        return str == v.str;
    case vk_class:
        return cls == v.cls;
    default:
        return true;
    }
}

bool value::operator!=(const value& v) const {
    return !(*this == v);
}

value vbox_undefined() {
    return value{};
}

value vbox_null() {
    return value{.kind=vk_null};
}

value vbox_number(f64 num) {
    return value{.kind=vk_number, .num=num};
}

value vbox_string(const string& str) {
    return value{.kind=vk_string, .str=str};
}

value vbox_class(const shared_ptr<class_def>& cls) {
    return value{.kind=vk_class, .cls=cls};
}

script::script(const string& name, script_initializer init)
    : name{name}
    , init{std::move(init)}
    , initialized{false} {
}

void script::declare(const qualified_name& def_name) {
    for (auto& x : defs) {
        if (x == def_name) {
            return;
        }
    }
    defs.push_back(def_name);
}

void script::declare_class(const shared_ptr<class_def>& cls) {
    declare(cls->name);
    classes.push_back(cls);
}

table<qualified_name,value>& script::globals() {
    if (!initialized) {
        initialized = true;
        for (auto& c : classes) {
            global_tab.insert(c->name, vbox_class(c));
        }
        if (init) {
            init(*this);
        }
    }
    return global_tab;
}

void script::set_global(const qualified_name& def_name, const value& v) {
    global_tab.insert(def_name, v);
}

bool script::get_global(value& out, const qualified_name& def_name) {
    auto x = globals().get2(def_name);
    if (!x) {
        return false;
    }
    out = x->val;
    return true;
}

}
