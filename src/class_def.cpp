#include "class_def.hpp"

namespace appd {

shared_ptr<class_def> mk_class(const qualified_name& name, bool generic) {
    auto res = std::make_shared<class_def>();
    res->name = name;
    res->generic = generic;
    return res;
}

shared_ptr<class_def> apply_type_param(const shared_ptr<class_def>& base,
        const shared_ptr<class_def>& param) {
    if (!param) {
        return base;
    }
    if (!base->generic) {
        throw type_error{"class", "Type application attempted on a "
                "non-parameterized type " + base->name.to_string() + ".",
                ERR_NOT_PARAMETERIZED};
    }

    auto key = (u64)(uintptr_t)param.get();
    auto x = base->applications.get2(key);
    if (x && x->val->param.lock() == param) {
        return x->val;
    }

    auto res = std::make_shared<class_def>();
    res->name = qualified_name{
        .ns=base->name.ns,
        .local=base->name.local + ".<" + param->name.to_string() + ">"
    };
    res->generic_base = base;
    res->param = param;
    base->applications.insert(key, res);
    return res;
}

}
