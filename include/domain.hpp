// domain.hpp -- application domains, name resolution, and domain memory

#ifndef __APPD_DOMAIN_HPP
#define __APPD_DOMAIN_HPP

#include "array.hpp"
#include "base.hpp"
#include "class_def.hpp"
#include "log.hpp"
#include "memory_region.hpp"
#include "names.hpp"
#include "script.hpp"

namespace appd {

struct domain_env;

// A set of scripts and classes sharing definitions, plus an optional parent to
// fall back on. Domains form a chain rooted at the system domain. Parents are
// only set on creation, so chains are acyclic.
//
// domain objects are handles: copies refer to the same underlying domain, and
// two handles compare equal iff they refer to the same domain. The domain
// lives as long as any handle to it (including child domains) does.
class domain {
private:
    struct domain_data;
    shared_ptr<domain_data> d;

    explicit domain(shared_ptr<domain_data> d);

public:
    // Create a domain without memory. This is only for bootstrap domains made
    // before byte buffers are available. init_default_memory() must be called
    // on the result before any user code runs.
    static domain create_uninitialized(domain_env* env,
            const optional<domain>& parent=std::nullopt);
    // Create a domain under parent with default domain memory. It shares the
    // parent's environment.
    static domain create_child(const domain& parent);

    optional<domain> parent() const;
    domain_env* env() const;
    bool is_system_domain() const;

    // tell whether a definition/class is exported by this domain or any of its
    // ancestors
    bool has_definition(const qualified_name& name) const;
    bool has_class(const qualified_name& name) const;

    // Export a definition provided by script s. If name is already defined
    // here or in an ancestor, this does nothing: the first export wins.
    void export_definition(const qualified_name& name,
            const shared_ptr<script>& s);
    // Export a class under its own name. First export wins as above.
    void export_class(const shared_ptr<class_def>& cls);
    // export every definition and class declared by s
    void load_script(const shared_ptr<script>& s);

    // Find the script defining mn, searching this domain and then its
    // ancestors. On success, out_name is set to the qualified name that
    // matched. Returns false if the name isn't defined anywhere in the chain.
    bool get_defining_script(qualified_name& out_name,
            shared_ptr<script>& out_script,
            const multiname& mn) const;
    // Like get_defining_script, but raises reference_error when the name isn't
    // found, and malformed_name_error when mn has no local name.
    void find_defining_script(qualified_name& out_name,
            shared_ptr<script>& out_script,
            const multiname& mn) const;

    // Find the class named by mn, or nullptr. If mn carries a type parameter
    // other than *, the parameter is resolved from this domain and applied to
    // the class. An unresolvable parameter makes the lookup fail.
    shared_ptr<class_def> get_class(const multiname& mn) const;

    // Get the value of a definition, initializing its script if needed.
    // Raises reference_error if nothing defines name.
    value get_defined_value(const qualified_name& name) const;
    // Look up a definition by its textual name, as reflection APIs do. Text
    // like "Vector.<T>" is looked up as the vector class applied to T.
    value get_defined_value_handling_vector(const string& text) const;
    // tell whether get_defined_value_handling_vector would succeed
    bool has_defined_value(const string& text) const;

    // names exported from this domain only (not its ancestors), in the order
    // they were exported
    dyn_array<qualified_name> get_defined_names() const;

    // Get the domain memory. Raises invariant_violation if the domain was
    // never given any.
    shared_ptr<memory_region> memory() const;
    bool has_memory() const;
    // replace the domain memory. Raises range_error if mem is shorter than
    // MIN_MEMORY_LENGTH.
    void set_memory(const shared_ptr<memory_region>& mem);
    // allocate default domain memory if this domain doesn't have any yet. The
    // configured length is raised to MIN_MEMORY_LENGTH if it's smaller.
    void init_default_memory();

    bool operator==(const domain& other) const {
        return d == other.d;
    }
    bool operator!=(const domain& other) const {
        return d != other.d;
    }
};

struct domain_config {
    // length of memory created for new domains, at least MIN_MEMORY_LENGTH
    u32 default_memory_length = DEFAULT_MEMORY_LENGTH;
    // log every export (and every ignored re-export) at info level
    bool trace_exports = false;
};

// State shared by all domains of one virtual machine. This must outlive every
// domain created with it.
struct domain_env {
    domain_config config;
    // may be null, in which case nothing is logged
    logger* log = nullptr;
    // set by bootstrap_system_domain()
    optional<domain> system_domain;
};

// Create the system domain for env. Like create_uninitialized(), the result
// has no memory until init_default_memory() is called.
domain bootstrap_system_domain(domain_env* env);

}

#endif
