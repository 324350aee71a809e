#define BOOST_TEST_MODULE Names Test Module
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "base.hpp"
#include "names.hpp"

using namespace appd;

static inline void test_parse(const char* text, const char* uri,
        const char* local) {
    auto q = parse_qualified_name(text);
    BOOST_TEST(q.ns.kind == nk_package);
    BOOST_TEST(q.ns.uri == uri);
    BOOST_TEST(q.local == local);
}

static inline void test_vector(const char* text, const char* param) {
    string base, p;
    BOOST_TEST(destruct_vector_name(text, &base, &p));
    BOOST_TEST(base == "__AS3__.vec::Vector");
    BOOST_TEST(p == param);
}

static inline void test_not_vector(const char* text) {
    string base = "unchanged", p = "unchanged";
    BOOST_TEST(!destruct_vector_name(text, &base, &p));
    BOOST_TEST(base == "unchanged");
    BOOST_TEST(p == "unchanged");
}

BOOST_AUTO_TEST_CASE( parse_qualified_name_test ) {
    test_parse("Foo", "", "Foo");
    test_parse("flash.display.Sprite", "flash.display", "Sprite");
    test_parse("flash.display::Sprite", "flash.display", "Sprite");
    test_parse("__AS3__.vec::Vector", "__AS3__.vec", "Vector");
    // "::" takes priority over the last '.'
    test_parse("a.b::c.d", "a.b", "c.d");
    test_parse("", "", "");
}

BOOST_AUTO_TEST_CASE( qualified_name_test ) {
    auto a = qualified_name{.ns=package_ns("flash.display"), .local="Sprite"};
    auto b = parse_qualified_name("flash.display::Sprite");
    BOOST_TEST((a == b));
    BOOST_TEST(hash(a) == hash(b));
    BOOST_TEST(a.to_string() == "flash.display::Sprite");

    auto pub = qualified_name{.ns=public_ns(), .local="Foo"};
    BOOST_TEST(pub.to_string() == "Foo");
    BOOST_TEST((pub != a));

    // same uri, different kind
    auto priv = qualified_name{
        .ns=ns_ref{.kind=nk_private, .uri=""},
        .local="Foo"
    };
    BOOST_TEST((priv != pub));
}

BOOST_AUTO_TEST_CASE( multiname_test ) {
    auto mn = mk_multiname("Foo", public_ns());
    mn.ns_set.push_back(package_ns("my.pkg"));
    BOOST_TEST(!mn.is_any_name());
    BOOST_TEST(mn.has_ns(public_ns()));
    BOOST_TEST(mn.has_ns(package_ns("my.pkg")));
    BOOST_TEST(!mn.has_ns(package_ns("other.pkg")));
    BOOST_TEST(mn.to_string() == "Foo");

    auto any = mk_any_name();
    BOOST_TEST(any.is_any_name());
    BOOST_TEST(any.to_string() == "*");

    auto vec = mk_generic_multiname(
            mk_multiname("Vector", package_ns(VECTOR_PACKAGE)),
            mk_multiname("int", public_ns()));
    BOOST_TEST(vec.to_string() == "Vector.<int>");
    BOOST_TEST(*vec.local == "Vector");
    BOOST_TEST(*vec.param->local == "int");

    auto vec_any = mk_generic_multiname(
            mk_multiname("Vector", package_ns(VECTOR_PACKAGE)),
            mk_any_name());
    BOOST_TEST(vec_any.to_string() == "Vector.<*>");
    BOOST_TEST(vec_any.param->is_any_name());
}

BOOST_AUTO_TEST_CASE( destruct_vector_name_test ) {
    test_vector("Vector.<int>", "int");
    test_vector("__AS3__.vec::Vector.<int>", "int");
    test_vector("Vector.<flash.display::Sprite>", "flash.display::Sprite");
    test_vector("Vector.<flash.display.Sprite>", "flash.display.Sprite");
    test_vector("Vector.<>", "");
    // only one level is recognized; the inner text is passed through
    test_vector("Vector.<Vector.<int>>", "Vector.<int>");

    test_not_vector("Vector");
    test_not_vector("__AS3__.vec::Vector");
    test_not_vector("Vector.<int");
    test_not_vector("my.pkg::Vector.<int>");
    test_not_vector("Vectors.<int>");
}
