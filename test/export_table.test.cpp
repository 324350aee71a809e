#define BOOST_TEST_MODULE Export Table Test Module
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "base.hpp"
#include "export_table.hpp"
#include "names.hpp"

using namespace appd;

static qualified_name qn(const char* uri, const char* local) {
    return qualified_name{.ns=package_ns(uri), .local=local};
}

BOOST_AUTO_TEST_CASE( export_table_insert_test ) {
    export_table<int> tab;
    BOOST_TEST(tab.size() == 0);
    BOOST_TEST((tab.get(qn("", "Foo")) == nullptr));

    tab.insert(qn("", "Foo"), 1);
    tab.insert(qn("my.pkg", "Foo"), 2);
    tab.insert(qn("", "Bar"), 3);
    BOOST_TEST(tab.size() == 3);
    BOOST_TEST(tab.contains(qn("", "Foo")));
    BOOST_TEST(tab.contains(qn("my.pkg", "Foo")));
    BOOST_TEST(!tab.contains(qn("other.pkg", "Foo")));
    BOOST_TEST(*tab.get(qn("", "Foo")) == 1);
    BOOST_TEST(*tab.get(qn("my.pkg", "Foo")) == 2);
    BOOST_TEST(*tab.get(qn("", "Bar")) == 3);

    // overwrite in place
    tab.insert(qn("", "Foo"), 4);
    BOOST_TEST(tab.size() == 3);
    BOOST_TEST(*tab.get(qn("", "Foo")) == 4);
    auto names = tab.names();
    BOOST_TEST((names[0] == qn("", "Foo")));
}

BOOST_AUTO_TEST_CASE( export_table_names_order_test ) {
    export_table<int> tab;
    // enough entries to force the local name index to grow several times
    for (int i = 0; i < 100; ++i) {
        tab.insert(qn("pkg", ("name" + std::to_string(i)).c_str()), i);
    }
    auto names = tab.names();
    BOOST_TEST(names.size == 100);
    for (u32 i = 0; i < 100; ++i) {
        BOOST_TEST(names[i].local == "name" + std::to_string(i));
        BOOST_TEST(*tab.get(names[i]) == (int)i);
    }
}

BOOST_AUTO_TEST_CASE( export_table_multiname_test ) {
    export_table<int> tab;
    tab.insert(qn("a", "Foo"), 1);
    tab.insert(qn("b", "Foo"), 2);

    ns_ref ns;
    auto mn = mk_multiname("Foo", package_ns("b"));
    auto x = tab.get_for_multiname(mn, &ns);
    BOOST_TEST_REQUIRE((x != nullptr));
    BOOST_TEST(*x == 2);
    BOOST_TEST(ns.uri == "b");

    // with several candidates, the first matching entry in insertion order
    // wins, regardless of the order of the namespace set
    mn.ns_set.push_back(package_ns("a"));
    x = tab.get_for_multiname(mn, &ns);
    BOOST_TEST_REQUIRE((x != nullptr));
    BOOST_TEST(*x == 1);
    BOOST_TEST(ns.uri == "a");

    BOOST_TEST((tab.get_for_multiname(mk_multiname("Foo", package_ns("c")))
            == nullptr));
    BOOST_TEST((tab.get_for_multiname(mk_multiname("Bar", package_ns("a")))
            == nullptr));
    BOOST_TEST((tab.get_for_multiname(mk_any_name()) == nullptr));
}
