#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Invalid counting configuration. Values are rejected, never clamped.
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

// process() reached before the counting lines could be resolved
class NotConfiguredError : public std::logic_error {
public:
    explicit NotConfiguredError(const std::string& what) : std::logic_error(what) {}
};

#endif // ERRORS_HPP
