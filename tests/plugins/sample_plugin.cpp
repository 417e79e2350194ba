// Loadable module "sample" used by registry_test.
#include "portbridge/args.hpp"
#include "portbridge/plugin.hpp"

PORTBRIDGE_DEFINE_PLUGIN_ABI

extern "C" void portbridge_plugin_init(portbridge::Module& module) {
    using namespace portbridge;

    module.add("greet", [](const List& a, const Dict&) {
        args::expect_count(a, 1, "greet");
        return Value("hello, " + args::string(a[0], "greet"));
    });
    module.add("scale", [](const List& a, const Dict& k) {
        args::expect_count(a, 1, 2, "scale");
        NdArray out = args::array(a[0], "scale").astype(DType::F64);
        const Value* factor = args::option(a, k, 1, "factor");
        const double f = factor ? args::number(*factor, "scale") : 2.0;
        for (std::size_t i = 0; i < out.size(); ++i) out.set_from_double(i, out.as_double(i) * f);
        return Value(std::move(out));
    }, true);
}
