#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace portbridge {

// Wrong kind or number of arguments passed to a callable.
class type_error : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Argument of the right kind but an unacceptable value.
class value_error : public std::domain_error {
public:
    using std::domain_error::domain_error;
};

// Malformed marker payload (bad base64, dtype/shape mismatch, wrong field types).
class codec_error : public value_error {
public:
    using value_error::value_error;
};

// Marker for a value kind this instance was started without.
class unsupported_type_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class module_not_found : public std::runtime_error {
public:
    module_not_found(std::string module, const std::string& detail)
        : std::runtime_error(detail), module_(std::move(module)) {}

    const std::string& module() const noexcept { return module_; }

private:
    std::string module_;
};

class function_not_found : public std::runtime_error {
public:
    function_not_found(std::string module, std::string function, const std::string& detail)
        : std::runtime_error(detail), module_(std::move(module)), function_(std::move(function)) {}

    const std::string& module() const noexcept { return module_; }
    const std::string& function() const noexcept { return function_; }

private:
    std::string module_;
    std::string function_;
};

// Single-line description of an exception as it goes into the "error" field.
std::string describe_exception(const std::exception& e);

// Name of the dynamic type of e, demangled where the ABI allows it.
std::string exception_type_name(const std::exception& e);

} // namespace portbridge
