// names.hpp -- namespaces, qualified names, and multinames

#ifndef __APPD_NAMES_HPP
#define __APPD_NAMES_HPP

#include "array.hpp"
#include "base.hpp"

namespace appd {

enum ns_kind : u8 {
    nk_package,
    nk_internal,
    nk_protected,
    nk_private
};

// A namespace, e.g. the package namespace "flash.display". Namespaces compare
// by kind and uri, so two package namespaces with the same uri are the same
// namespace.
struct ns_ref {
    ns_kind kind = nk_package;
    string uri;

    bool operator==(const ns_ref& other) const;
    bool operator!=(const ns_ref& other) const;
};

ns_ref package_ns(const string& uri);
// the public namespace is the package namespace with an empty uri
ns_ref public_ns();

// a (namespace, local name) pair naming one exact definition
struct qualified_name {
    ns_ref ns;
    string local;

    bool operator==(const qualified_name& other) const;
    bool operator!=(const qualified_name& other) const;

    // "uri::local", or just "local" in the public namespace
    string to_string() const;
};

template<> u64 hash<qualified_name>(const qualified_name& q);

// Parse a name as written by reflection APIs. The text is split at the last
// "::", or failing that at the last ".". The prefix becomes a package
// namespace. Text without either separator is a public name.
qualified_name parse_qualified_name(const string& text);

// A name reference that may match in any of several namespaces. A multiname
// with no local name is the "any" name; as a type parameter it means *.
struct multiname {
    dyn_array<ns_ref> ns_set;
    optional<string> local;
    // type parameter for generic applications like Vector.<T>
    shared_ptr<multiname> param;

    bool is_any_name() const {
        return !local.has_value();
    }
    bool has_ns(const ns_ref& ns) const;
    string to_string() const;
};

multiname mk_multiname(const string& local, const ns_ref& ns);
multiname mk_multiname(const qualified_name& name);
multiname mk_any_name();
// base applied to param, e.g. Vector.<int>
multiname mk_generic_multiname(const multiname& base, const multiname& param);


// vector name destructuring

constexpr const char* VECTOR_PACKAGE = "__AS3__.vec";
constexpr const char* VECTOR_NAME = "Vector";

// Split text of the form "Vector.<Inner>" or "__AS3__.vec::Vector.<Inner>"
// into the qualified vector name and "Inner". Returns false, leaving base and
// param alone, if the text doesn't have this form. Only the first ".<" is
// considered, so nested vectors produce an inner name that fails to resolve
// later on.
bool destruct_vector_name(const string& text, string* base, string* param);

}

#endif
