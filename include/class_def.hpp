// class_def.hpp -- class descriptors and generic specialization

#ifndef __APPD_CLASS_DEF_HPP
#define __APPD_CLASS_DEF_HPP

#include "base.hpp"
#include "names.hpp"
#include "table.hpp"

namespace appd {

struct class_def {
    qualified_name name;
    // true if this class accepts a type parameter (i.e. it's Vector)
    bool generic = false;

    // for specializations: the class the parameter was applied to, and the
    // parameter itself. Both are empty for ordinary classes. Neither is owned,
    // since the parameter may be the base itself (Vector.<Vector.<*>>).
    weak_ptr<class_def> generic_base;
    weak_ptr<class_def> param;

    // specializations of this class, keyed by the address of the parameter
    // class. An entry whose parameter has expired is stale and gets replaced
    // if the address is reused.
    table<u64,shared_ptr<class_def>> applications;
};

shared_ptr<class_def> mk_class(const qualified_name& name, bool generic=false);

// Specialize base with a type parameter. A null param stands for the *
// type, in which case base is returned unchanged. Results are memoized on
// base, so applying the same parameter twice yields the same object. Raises
// type_error if base is not generic.
shared_ptr<class_def> apply_type_param(const shared_ptr<class_def>& base,
        const shared_ptr<class_def>& param);

}

#endif
