#undef NDEBUG
#include <cassert>
#include <iostream>
#include <string>

#include "portbridge/errors.hpp"
#include "portbridge/registry.hpp"

using namespace portbridge;

template <class E, class F>
static bool throws(F&& f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

int main() {
    // Test 1: registered modules resolve
    {
        Registry r;
        r.add_module("util")
            .add("twice", [](const List& a, const Dict&) { return Value(List{a[0], a[0]}); })
            .add("kw", [](const List&, const Dict& k) { return Value(k); }, true);
        assert(&r.add_module("util") == r.find_module("util"));
        assert(r.find_module("other") == nullptr);
        assert((r.module_names() == std::vector<std::string>{"util"}));
        assert((r.find_module("util")->function_names() == std::vector<std::string>{"kw", "twice"}));

        const Function& twice = r.resolve("util", "twice");
        assert(twice.name() == "twice" && !twice.accepts_keywords());
        assert(twice({1}, {}) == Value(List{1, 1}));
        assert(r.resolve("util", "kw")({}, Dict{{"a", 1}}) == Value(Dict{{"a", 1}}));
        std::cout << "resolve ok" << std::endl;
    }

    // Test 2: keyword arguments are refused unless declared
    {
        Registry r;
        r.add_module("util").add("id", [](const List& a, const Dict&) { return a.at(0); });
        const Function& id = r.resolve("util", "id");
        assert(id({7}, {}) == Value(7));
        try {
            id({7}, Dict{{"x", 1}});
            assert(false);
        } catch (const type_error& e) {
            assert(std::string(e.what()) == "id() takes no keyword arguments");
        }
        std::cout << "keyword refusal ok" << std::endl;
    }

    // Test 3: lookup failures carry module and function names
    {
        Registry r;
        r.add_module("util");
        try {
            r.resolve("missing", "f");
            assert(false);
        } catch (const module_not_found& e) {
            assert(e.module() == "missing");
            assert(std::string(e.what()) == "No module named 'missing'");
        }
        try {
            r.resolve("util", "nope");
            assert(false);
        } catch (const function_not_found& e) {
            assert(e.module() == "util" && e.function() == "nope");
            assert(std::string(e.what()) == "module 'util' has no attribute 'nope'");
        }
        assert(throws<module_not_found>([&] { r.import_module("../etc/passwd"); }));
        assert(throws<module_not_found>([&] { r.import_module(""); }));
        std::cout << "lookup failures ok" << std::endl;
    }

    // Test 4: plugins load from the search path on first use
    {
        Registry r;
        r.add_search_path("/nonexistent/portbridge/modules");
        r.add_search_path(PORTBRIDGE_TEST_PLUGIN_DIR);
        assert(r.search_paths().size() == 2);
        assert(r.find_module("sample") == nullptr);

        assert(r.resolve("sample", "greet")({"bridge"}, {}) == Value("hello, bridge"));
        assert(r.find_module("sample") != nullptr);

        const Function& scale = r.resolve("sample", "scale");
        assert(scale.accepts_keywords());
        Value doubled = scale({NdArray::from_values<std::int32_t>({1, 2, 3})}, {});
        assert(doubled.as<NdArray>().dtype() == DType::F64);
        assert(doubled.as<NdArray>().at<double>(2) == 6.0);
        Value tripled = scale({NdArray::from_values<double>({1.5})}, Dict{{"factor", 3}});
        assert(tripled.as<NdArray>().at<double>(0) == 4.5);

        assert(throws<function_not_found>([&] { r.resolve("sample", "missing"); }));
        assert(throws<module_not_found>([&] { r.resolve("absent_plugin", "f"); }));
        std::cout << "plugin loading ok" << std::endl;
    }

    // Test 5: without a search path nothing is imported
    {
        Registry r;
        assert(throws<module_not_found>([&] { r.import_module("sample"); }));
        std::cout << "empty search path ok" << std::endl;
    }

    std::cout << "\nAll registry tests passed!" << std::endl;
    return 0;
}
