#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include <chrono>
#include <string>
#include <utility>
#include <vector>
#include "../include/common.hpp"
#include "../include/line_registry.hpp"
#include "../include/logging.h"

// Keeps every message so tests can assert on what was logged
class CapturingLogger : public ILogger {
public:
    using ILogger::log;

    void log(Severity severity, const char* msg) noexcept override {
        messages.emplace_back(severity, msg);
    }

    size_t count(Severity severity) const {
        size_t n = 0;
        for (const auto& message : messages) {
            if (message.first == severity) ++n;
        }
        return n;
    }

    std::vector<std::pair<Severity, std::string>> messages;
};

inline Timestamp at(double seconds) {
    return Timestamp() + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
}

// 40x40 box centered on (cx, cy)
inline Detection vehicle(int track_id, float cy, float cx = 320.0f, float confidence = 0.9f, int class_id = 2) {
    return Detection(cx - 20.0f, cy - 20.0f, cx + 20.0f, cy + 20.0f, confidence, class_id, track_id);
}

inline LineSpec mainLine(float ratio = 0.5f, int tolerance = 15) {
    return LineSpec("main", ratio, tolerance, "down", "up");
}

#endif // TEST_HELPERS_HPP
