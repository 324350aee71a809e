// script.hpp -- scripts and the values of their top-level definitions

#ifndef __APPD_SCRIPT_HPP
#define __APPD_SCRIPT_HPP

#include "array.hpp"
#include "base.hpp"
#include "class_def.hpp"
#include "names.hpp"
#include "table.hpp"

#include <functional>

namespace appd {

enum value_kind : u8 {
    vk_undefined,
    vk_null,
    vk_number,
    vk_string,
    vk_class
};

// Values of global definitions. Only the kinds needed to hand definitions back
// to reflection APIs are represented here; the interpreter has its own richer
// representation.
struct value {
    value_kind kind = vk_undefined;
    f64 num = 0;
    string str;
    shared_ptr<class_def> cls;

    // classes compare by identity
    bool operator==(const value& v) const;
    bool operator!=(const value& v) const;
};

value vbox_undefined();
value vbox_null();
value vbox_number(f64 num);
value vbox_string(const string& str);
value vbox_class(const shared_ptr<class_def>& cls);

inline bool vis_undefined(const value& v) {
    return v.kind == vk_undefined;
}
inline bool vis_class(const value& v) {
    return v.kind == vk_class;
}

class script;

// Run the first time a script's globals are requested. This is where the
// loader's compiled top-level code gets hooked in.
using script_initializer = std::function<void(script& s)>;

class script {
private:
    // used in diagnostics, e.g. the file the script came from
    string name;
    // names of top-level definitions, in declaration order
    dyn_array<qualified_name> defs;
    dyn_array<shared_ptr<class_def>> classes;
    table<qualified_name,value> global_tab;
    script_initializer init;
    bool initialized;

public:
    script(const string& name, script_initializer init=nullptr);

    const string& get_name() const {
        return name;
    }
    bool is_initialized() const {
        return initialized;
    }

    // declare a top-level definition. Declarations are what gets exported
    // when the script is loaded into a domain.
    void declare(const qualified_name& def_name);
    // declare a class. The class's name is also declared as a definition, and
    // its global is set to the class when the script is initialized.
    void declare_class(const shared_ptr<class_def>& cls);
    const dyn_array<qualified_name>& declared_names() const {
        return defs;
    }
    const dyn_array<shared_ptr<class_def>>& declared_classes() const {
        return classes;
    }

    // Get the globals table, initializing the script if necessary. The script
    // is marked as initialized before the initializer runs, so a re-entrant
    // request sees the globals as they are so far.
    table<qualified_name,value>& globals();

    // set a global without triggering initialization. Used by initializers.
    void set_global(const qualified_name& def_name, const value& v);
    // get a global, initializing the script first if necessary. Returns false
    // if the script never set it.
    bool get_global(value& out, const qualified_name& def_name);
};

}

#endif
