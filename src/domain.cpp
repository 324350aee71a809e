#include "domain.hpp"

#include "export_table.hpp"

namespace appd {

struct domain::domain_data {
    domain_env* env;
    // definitions and the scripts that exported them
    export_table<shared_ptr<script>> defs;
    export_table<shared_ptr<class_def>> classes;
    optional<domain> parent;
    // Null only for bootstrap domains which haven't had init_default_memory()
    // called yet.
    shared_ptr<memory_region> mem;
};

domain::domain(shared_ptr<domain_data> d)
    : d{std::move(d)} {
}

static void trace(domain_env* env, const string& message) {
    if (env->log && env->config.trace_exports) {
        env->log->log_info("domain", message);
    }
}

domain domain::create_uninitialized(domain_env* env,
        const optional<domain>& parent) {
    auto data = std::make_shared<domain_data>();
    data->env = env;
    data->parent = parent;
    return domain{data};
}

domain domain::create_child(const domain& parent) {
    auto res = create_uninitialized(parent.env(), parent);
    res.init_default_memory();
    return res;
}

domain bootstrap_system_domain(domain_env* env) {
    auto res = domain::create_uninitialized(env);
    env->system_domain = res;
    return res;
}

optional<domain> domain::parent() const {
    return d->parent;
}

domain_env* domain::env() const {
    return d->env;
}

bool domain::is_system_domain() const {
    return d->env->system_domain.has_value()
        && *d->env->system_domain == *this;
}

// Parents are fixed at creation, so walking the chain always terminates.
bool domain::has_definition(const qualified_name& name) const {
    for (auto x = d.get(); x != nullptr;
         x = x->parent ? x->parent->d.get() : nullptr) {
        if (x->defs.contains(name)) {
            return true;
        }
    }
    return false;
}

bool domain::has_class(const qualified_name& name) const {
    for (auto x = d.get(); x != nullptr;
         x = x->parent ? x->parent->d.get() : nullptr) {
        if (x->classes.contains(name)) {
            return true;
        }
    }
    return false;
}

void domain::export_definition(const qualified_name& name,
        const shared_ptr<script>& s) {
    if (has_definition(name)) {
        trace(d->env, "Ignored re-export of " + name.to_string()
                + " from script " + s->get_name() + ".");
        return;
    }
    d->defs.insert(name, s);
    trace(d->env, "Exported " + name.to_string() + " from script "
            + s->get_name() + ".");
}

void domain::export_class(const shared_ptr<class_def>& cls) {
    if (has_class(cls->name)) {
        trace(d->env, "Ignored re-export of class "
                + cls->name.to_string() + ".");
        return;
    }
    d->classes.insert(cls->name, cls);
    trace(d->env, "Exported class " + cls->name.to_string() + ".");
}

void domain::load_script(const shared_ptr<script>& s) {
    for (auto& name : s->declared_names()) {
        export_definition(name, s);
    }
    for (auto& cls : s->declared_classes()) {
        export_class(cls);
    }
}

bool domain::get_defining_script(qualified_name& out_name,
        shared_ptr<script>& out_script,
        const multiname& mn) const {
    if (mn.is_any_name()) {
        return false;
    }
    for (auto x = d.get(); x != nullptr;
         x = x->parent ? x->parent->d.get() : nullptr) {
        ns_ref ns;
        auto s = x->defs.get_for_multiname(mn, &ns);
        if (s) {
            out_name = qualified_name{.ns=ns, .local=*mn.local};
            out_script = *s;
            return true;
        }
    }
    return false;
}

void domain::find_defining_script(qualified_name& out_name,
        shared_ptr<script>& out_script,
        const multiname& mn) const {
    if (mn.is_any_name()) {
        throw malformed_name_error{"domain",
                "Attempted to resolve a multiname with no local name."};
    }
    if (!get_defining_script(out_name, out_script, mn)) {
        throw reference_error{"domain",
                "Variable " + *mn.local + " is not defined."};
    }
}

shared_ptr<class_def> domain::get_class(const multiname& mn) const {
    shared_ptr<class_def> res;
    for (auto x = d.get(); x != nullptr;
         x = x->parent ? x->parent->d.get() : nullptr) {
        auto c = x->classes.get_for_multiname(mn);
        if (c) {
            res = *c;
            break;
        }
    }
    if (!res || !mn.param || mn.param->is_any_name()) {
        return res;
    }
    // the parameter is resolved from here, not from the domain that defined
    // the generic class
    auto param = get_class(*mn.param);
    if (!param) {
        return nullptr;
    }
    return apply_type_param(res, param);
}

value domain::get_defined_value(const qualified_name& name) const {
    qualified_name def_name;
    shared_ptr<script> s;
    find_defining_script(def_name, s, mk_multiname(name));
    value res;
    if (!s->get_global(res, def_name)) {
        // declared but never set by the script
        return vbox_undefined();
    }
    return res;
}

value domain::get_defined_value_handling_vector(const string& text) const {
    string base_text, param_text;
    if (!destruct_vector_name(text, &base_text, &param_text)) {
        return get_defined_value(parse_qualified_name(text));
    }

    // Both names are looked up before either error is reported, and an error
    // looking up the parameter takes precedence.
    value base;
    optional<reference_error> base_err;
    try {
        base = get_defined_value(parse_qualified_name(base_text));
    } catch (const reference_error& e) {
        base_err.emplace(e);
    }
    auto param = get_defined_value(parse_qualified_name(param_text));
    if (base_err) {
        throw *base_err;
    }

    if (!vis_class(base)) {
        throw type_error{"domain", "Vector type " + base_text
                + " was not a class.", ERR_COERCE_FAILED};
    }
    if (!vis_class(param)) {
        throw type_error{"domain", "Type parameter " + param_text
                + " of " + text + " was not a class.", ERR_COERCE_FAILED};
    }
    return vbox_class(apply_type_param(base.cls, param.cls));
}

bool domain::has_defined_value(const string& text) const {
    try {
        get_defined_value_handling_vector(text);
    } catch (const reference_error&) {
        return false;
    } catch (const type_error&) {
        return false;
    }
    return true;
}

dyn_array<qualified_name> domain::get_defined_names() const {
    return d->defs.names();
}

shared_ptr<memory_region> domain::memory() const {
    if (!d->mem) {
        invariant_violation e{"domain",
                "Domain must have valid memory at all times. "
                "init_default_memory() was not called after bootstrapping."};
        if (d->env->log) {
            d->env->log->log_exception(e);
        }
        throw e;
    }
    return d->mem;
}

bool domain::has_memory() const {
    return d->mem != nullptr;
}

void domain::set_memory(const shared_ptr<memory_region>& mem) {
    if (!mem || mem->length() < MIN_MEMORY_LENGTH) {
        throw range_error{"domain", "The specified range is invalid. "
                "Domain memory must be at least "
                + std::to_string(MIN_MEMORY_LENGTH) + " bytes long."};
    }
    d->mem = mem;
}

void domain::init_default_memory() {
    if (d->mem) {
        return;
    }
    auto length = d->env->config.default_memory_length;
    if (length < MIN_MEMORY_LENGTH) {
        if (d->env->log) {
            d->env->log->log_warning("domain", "Configured domain memory "
                    "length " + std::to_string(length) + " is below the "
                    "minimum. Using " + std::to_string(MIN_MEMORY_LENGTH)
                    + " bytes instead.");
        }
        length = MIN_MEMORY_LENGTH;
    }
    d->mem = std::make_shared<memory_region>(length);
}

}
