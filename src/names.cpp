#include "names.hpp"

namespace appd {

bool ns_ref::operator==(const ns_ref& other) const {
    return kind == other.kind && uri == other.uri;
}

bool ns_ref::operator!=(const ns_ref& other) const {
    return !(*this == other);
}

ns_ref package_ns(const string& uri) {
    return ns_ref{.kind=nk_package, .uri=uri};
}

ns_ref public_ns() {
    return package_ns("");
}

bool qualified_name::operator==(const qualified_name& other) const {
    return ns == other.ns && local == other.local;
}

bool qualified_name::operator!=(const qualified_name& other) const {
    return !(*this == other);
}

string qualified_name::to_string() const {
    if (ns.uri.empty()) {
        return local;
    }
    return ns.uri + "::" + local;
}

template<> u64 hash<qualified_name>(const qualified_name& q) {
    auto res = hash<string>(q.local);
    res ^= hash<string>(q.ns.uri) * 31;
    res ^= (u64)q.ns.kind << 56;
    return res;
}

qualified_name parse_qualified_name(const string& text) {
    auto p = text.rfind("::");
    if (p != string::npos) {
        return qualified_name{
            .ns=package_ns(text.substr(0, p)),
            .local=text.substr(p + 2)
        };
    }
    p = text.rfind('.');
    if (p != string::npos) {
        return qualified_name{
            .ns=package_ns(text.substr(0, p)),
            .local=text.substr(p + 1)
        };
    }
    return qualified_name{.ns=public_ns(), .local=text};
}

bool multiname::has_ns(const ns_ref& ns) const {
    for (auto& x : ns_set) {
        if (x == ns) {
            return true;
        }
    }
    return false;
}

string multiname::to_string() const {
    string res = local.has_value() ? *local : "*";
    if (param) {
        res += ".<" + param->to_string() + ">";
    }
    return res;
}

multiname mk_multiname(const string& local, const ns_ref& ns) {
    multiname res;
    res.ns_set.push_back(ns);
    res.local = local;
    return res;
}

multiname mk_multiname(const qualified_name& name) {
    return mk_multiname(name.local, name.ns);
}

multiname mk_any_name() {
    return multiname{};
}

multiname mk_generic_multiname(const multiname& base, const multiname& param) {
    multiname res = base;
    res.param = std::make_shared<multiname>(param);
    return res;
}

bool destruct_vector_name(const string& text, string* base, string* param) {
    auto full_prefix = string{VECTOR_PACKAGE} + "::" + VECTOR_NAME + ".<";
    auto short_prefix = string{VECTOR_NAME} + ".<";
    if (!(text.starts_with(full_prefix) || text.starts_with(short_prefix))
            || !text.ends_with(">")) {
        return false;
    }
    // both prefixes contain ".<", and the text is at least one character
    // longer than either prefix
    auto start = text.find(".<") + 2;
    *param = text.substr(start, text.size() - 1 - start);
    *base = string{VECTOR_PACKAGE} + "::" + VECTOR_NAME;
    return true;
}

}
