#pragma once
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "portbridge/value.hpp"

#define PORTBRIDGE_PLUGIN_ABI_VERSION 1

namespace portbridge {

using Callable = std::function<Value(const List& args, const Dict& kwargs)>;

class Function {
public:
    Function(std::string name, Callable fn, bool accepts_keywords);

    const std::string& name() const noexcept { return name_; }
    bool accepts_keywords() const noexcept { return accepts_keywords_; }

    // Keyword arguments reach the callable only when there are some;
    // a function declared without them rejects a non-empty mapping.
    Value operator()(const List& args, const Dict& kwargs) const;

private:
    std::string name_;
    Callable fn_;
    bool accepts_keywords_;
};

class Module {
public:
    explicit Module(std::string name);

    const std::string& name() const noexcept { return name_; }

    Module& add(const std::string& name, Callable fn, bool accepts_keywords = false);
    const Function* find(const std::string& name) const;
    std::vector<std::string> function_names() const;

private:
    std::string name_;
    std::map<std::string, Function> functions_;
};

// (module, function) -> callable. Modules are registered up front or
// imported on first use from <dir>/<module>.so along the search path.
class Registry {
public:
    Registry();
    ~Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // Returns the existing module of that name or a new empty one.
    Module& add_module(const std::string& name);

    void add_search_path(std::filesystem::path dir);
    const std::vector<std::filesystem::path>& search_paths() const noexcept { return search_paths_; }

    // Throws module_not_found when neither registered nor importable.
    const Module& import_module(const std::string& name);

    // nullptr when the module is not registered; never imports.
    const Module* find_module(const std::string& name) const;

    // Throws module_not_found / function_not_found.
    const Function& resolve(const std::string& module, const std::string& function);

    std::vector<std::string> module_names() const;

private:
    struct PluginHandle {
        void* handle;
        std::filesystem::path path;
    };

    Module& load_plugin(const std::string& name);

    std::map<std::string, std::unique_ptr<Module>> modules_;
    std::vector<std::filesystem::path> search_paths_;
    std::vector<PluginHandle> plugins_;
};

} // namespace portbridge
