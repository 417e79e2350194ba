#include "portbridge/registry.hpp"

#include <dlfcn.h>

#include <spdlog/spdlog.h>

#include "portbridge/errors.hpp"

namespace fs = std::filesystem;

namespace portbridge {

namespace {

using abi_version_fn = int (*)();
using plugin_init_fn = void (*)(Module&);

bool is_importable_name(const std::string& name) {
    if (name.empty() || name.front() == '.') return false;
    return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

} // namespace

// ---------------------------------------------------------------------------
// Function / Module
// ---------------------------------------------------------------------------

Function::Function(std::string name, Callable fn, bool accepts_keywords)
    : name_(std::move(name)), fn_(std::move(fn)), accepts_keywords_(accepts_keywords) {}

Value Function::operator()(const List& args, const Dict& kwargs) const {
    if (!kwargs.empty() && !accepts_keywords_) {
        throw type_error(name_ + "() takes no keyword arguments");
    }
    return fn_(args, kwargs);
}

Module::Module(std::string name) : name_(std::move(name)) {}

Module& Module::add(const std::string& name, Callable fn, bool accepts_keywords) {
    functions_.insert_or_assign(name, Function(name, std::move(fn), accepts_keywords));
    return *this;
}

const Function* Module::find(const std::string& name) const {
    auto it = functions_.find(name);
    return it == functions_.end() ? nullptr : &it->second;
}

std::vector<std::string> Module::function_names() const {
    std::vector<std::string> out;
    out.reserve(functions_.size());
    for (const auto& [name, _] : functions_) out.push_back(name);
    return out;
}

// ---------------------------------------------------------------------------
// Registry
// ---------------------------------------------------------------------------

Registry::Registry() = default;

Registry::~Registry() {
    // callables may live in plugin code: drop them before unloading
    modules_.clear();
    for (auto it = plugins_.rbegin(); it != plugins_.rend(); ++it) {
        if (it->handle) dlclose(it->handle);
    }
}

Module& Registry::add_module(const std::string& name) {
    auto& slot = modules_[name];
    if (!slot) slot = std::make_unique<Module>(name);
    return *slot;
}

void Registry::add_search_path(fs::path dir) {
    search_paths_.push_back(std::move(dir));
}

const Module* Registry::find_module(const std::string& name) const {
    auto it = modules_.find(name);
    return it == modules_.end() ? nullptr : it->second.get();
}

const Module& Registry::import_module(const std::string& name) {
    if (const Module* m = find_module(name)) return *m;
    return load_plugin(name);
}

Module& Registry::load_plugin(const std::string& name) {
    const std::string missing = "No module named '" + name + "'";
    if (!is_importable_name(name)) throw module_not_found(name, missing);

    for (const auto& dir : search_paths_) {
        const fs::path so_path = dir / (name + ".so");
        std::error_code ec;
        if (!fs::is_regular_file(so_path, ec)) continue;

        void* handle = dlopen(so_path.c_str(), RTLD_NOW | RTLD_LOCAL);
        if (!handle) {
            const char* err = dlerror();
            throw module_not_found(name, err ? err : "dlopen failed");
        }

        auto ver_fn = reinterpret_cast<abi_version_fn>(dlsym(handle, "portbridge_plugin_abi_version"));
        if (!ver_fn) {
            dlclose(handle);
            throw module_not_found(name, "symbol portbridge_plugin_abi_version not found in " + so_path.string());
        }
        if (ver_fn() != PORTBRIDGE_PLUGIN_ABI_VERSION) {
            dlclose(handle);
            throw module_not_found(name, "plugin ABI version mismatch in " + so_path.string());
        }

        auto init_fn = reinterpret_cast<plugin_init_fn>(dlsym(handle, "portbridge_plugin_init"));
        if (!init_fn) {
            dlclose(handle);
            throw module_not_found(name, "symbol portbridge_plugin_init not found in " + so_path.string());
        }

        auto module = std::make_unique<Module>(name);
        try {
            init_fn(*module);
        } catch (const std::exception& e) {
            module.reset();
            dlclose(handle);
            throw module_not_found(name, std::string("plugin init failed: ") + e.what());
        }

        plugins_.push_back({handle, so_path});
        spdlog::info("loaded module '{}' from {} ({} functions)",
                     name, so_path.string(), module->function_names().size());

        auto& slot = modules_[name];
        slot = std::move(module);
        return *slot;
    }
    throw module_not_found(name, missing);
}

const Function& Registry::resolve(const std::string& module, const std::string& function) {
    const Module& m = import_module(module);
    const Function* f = m.find(function);
    if (!f) {
        throw function_not_found(module, function,
                                 "module '" + module + "' has no attribute '" + function + "'");
    }
    return *f;
}

std::vector<std::string> Registry::module_names() const {
    std::vector<std::string> out;
    out.reserve(modules_.size());
    for (const auto& [name, _] : modules_) out.push_back(name);
    return out;
}

} // namespace portbridge
