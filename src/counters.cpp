#include "../include/counters.hpp"

int Counters::get(const std::string& name) const {
    auto it = values_.find(name);
    return it == values_.end() ? 0 : it->second;
}

int Counters::total() const {
    int sum = 0;
    for (const auto& pair : values_) {
        sum += pair.second;
    }
    return sum;
}

void Counters::reset() {
    for (auto& pair : values_) {
        pair.second = 0;
    }
}

CountSnapshot Counters::snapshot() const {
    CountSnapshot snapshot;
    snapshot.counters = values_;
    snapshot.total = total();
    return snapshot;
}
