#include "portbridge/errors.hpp"

#include <cstdlib>
#include <memory>
#include <typeinfo>

#include <cxxabi.h>
#include <nlohmann/json.hpp>

namespace portbridge {

namespace {

std::string one_line(std::string s) {
    for (auto& c : s) {
        if (c == '\n' || c == '\r') c = ' ';
    }
    return s;
}

} // namespace

std::string exception_type_name(const std::exception& e) {
    const char* mangled = typeid(e).name();
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    if (status == 0 && demangled) return demangled.get();
    return mangled;
}

std::string describe_exception(const std::exception& e) {
    std::string msg;
    if (auto* m = dynamic_cast<const module_not_found*>(&e)) {
        msg = "Module not found: " + m->module() + " - " + m->what();
    } else if (auto* f = dynamic_cast<const function_not_found*>(&e)) {
        msg = "Function not found: " + f->function() + " in " + f->module() + " - " + f->what();
    } else if (dynamic_cast<const unsupported_type_error*>(&e)) {
        msg = std::string("Unsupported type: ") + e.what();
    } else if (dynamic_cast<const type_error*>(&e) ||
               dynamic_cast<const nlohmann::json::type_error*>(&e)) {
        msg = std::string("Type error: ") + e.what();
    } else if (dynamic_cast<const value_error*>(&e) ||
               dynamic_cast<const nlohmann::json::out_of_range*>(&e)) {
        msg = std::string("Value error: ") + e.what();
    } else {
        msg = exception_type_name(e) + ": " + e.what();
    }
    return one_line(std::move(msg));
}

} // namespace portbridge
