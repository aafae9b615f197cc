#ifndef COUNTERS_HPP
#define COUNTERS_HPP

#include <map>
#include <string>
#include "common.hpp"

// Named directional counters. The total is always summed from them.
class Counters {
public:
    Counters() {}

    // Makes `name` visible at zero without touching an existing value
    void declare(const std::string& name) { values_.emplace(name, 0); }
    void increment(const std::string& name) { ++values_[name]; }

    int get(const std::string& name) const;
    int total() const;
    void reset();

    const std::map<std::string, int>& values() const { return values_; }
    CountSnapshot snapshot() const;

private:
    std::map<std::string, int> values_;
};

#endif // COUNTERS_HPP
