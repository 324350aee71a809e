#define BOOST_TEST_MODULE Class Test Module
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "base.hpp"
#include "class_def.hpp"
#include "names.hpp"

using namespace appd;

static shared_ptr<class_def> mk_vector_class() {
    return mk_class(qualified_name{
            .ns=package_ns(VECTOR_PACKAGE),
            .local=VECTOR_NAME}, true);
}

BOOST_AUTO_TEST_CASE( apply_type_param_test ) {
    auto vec = mk_vector_class();
    auto sprite = mk_class(parse_qualified_name("flash.display::Sprite"));

    auto v1 = apply_type_param(vec, sprite);
    BOOST_TEST_REQUIRE((v1 != nullptr));
    BOOST_TEST((v1 != vec));
    BOOST_TEST(v1->name.to_string()
            == "__AS3__.vec::Vector.<flash.display::Sprite>");
    BOOST_TEST((v1->param.lock() == sprite));
    BOOST_TEST((v1->generic_base.lock() == vec));
    BOOST_TEST(!v1->generic);

    // memoized on the base class
    auto v2 = apply_type_param(vec, sprite);
    BOOST_TEST((v1 == v2));
    BOOST_TEST(vec->applications.get_size() == 1);

    // a different parameter gets a different specialization, even if it has
    // the same name
    auto other_sprite = mk_class(parse_qualified_name("flash.display::Sprite"));
    auto v3 = apply_type_param(vec, other_sprite);
    BOOST_TEST((v3 != v1));
    BOOST_TEST(vec->applications.get_size() == 2);
}

BOOST_AUTO_TEST_CASE( apply_any_type_test ) {
    auto vec = mk_vector_class();
    BOOST_TEST((apply_type_param(vec, nullptr) == vec));
    BOOST_TEST(vec->applications.get_size() == 0);

    // applying * to a non-generic class is also a no-op
    auto foo = mk_class(parse_qualified_name("Foo"));
    BOOST_TEST((apply_type_param(foo, nullptr) == foo));
}

BOOST_AUTO_TEST_CASE( apply_non_generic_test ) {
    auto foo = mk_class(parse_qualified_name("Foo"));
    auto bar = mk_class(parse_qualified_name("Bar"));
    BOOST_CHECK_THROW(apply_type_param(foo, bar), type_error);
    try {
        apply_type_param(foo, bar);
    } catch (const type_error& e) {
        BOOST_TEST(e.code == ERR_NOT_PARAMETERIZED);
    }

    // specializations can't be specialized again
    auto vec_bar = apply_type_param(mk_vector_class(), bar);
    BOOST_CHECK_THROW(apply_type_param(vec_bar, foo), type_error);
}

BOOST_AUTO_TEST_CASE( apply_to_self_test ) {
    weak_ptr<class_def> weak_vec;
    weak_ptr<class_def> weak_spec;
    {
        auto vec = mk_vector_class();
        weak_vec = vec;
        auto vv = apply_type_param(vec, vec);
        weak_spec = vv;
        BOOST_TEST(vv->name.to_string()
                == "__AS3__.vec::Vector.<__AS3__.vec::Vector>");
        BOOST_TEST((vv->param.lock() == vec));
        BOOST_TEST((apply_type_param(vec, vec) == vv));

        // Vector.<Vector.<Vector.<*>>>
        auto vvv = apply_type_param(vec, vv);
        BOOST_TEST((vvv->param.lock() == vv));
        BOOST_TEST(vec->applications.get_size() == 2);
    }
    // nothing keeps the base alive once all handles are gone
    BOOST_TEST(weak_vec.expired());
    BOOST_TEST(weak_spec.expired());
}

BOOST_AUTO_TEST_CASE( apply_expired_param_test ) {
    auto vec = mk_vector_class();
    auto bar = mk_class(parse_qualified_name("Bar"));
    auto key = (u64)(uintptr_t)bar.get();
    apply_type_param(vec, bar);
    bar.reset();

    // the memo entry stays until its key is reused, but no longer matches a
    // live parameter
    auto x = vec->applications.get2(key);
    BOOST_TEST_REQUIRE((x != nullptr));
    BOOST_TEST(x->val->param.expired());

    auto baz = mk_class(parse_qualified_name("Baz"));
    auto spec = apply_type_param(vec, baz);
    BOOST_TEST((spec->param.lock() == baz));
    BOOST_TEST(spec->name.to_string() == "__AS3__.vec::Vector.<Baz>");
}
