#include "../include/common.hpp"
#include "../include/logging.h"
#include <cmath>

bool isWellFormed(const Detection& det, std::string* reason) {
    const char* problem = nullptr;
    if (!std::isfinite(det.x1) || !std::isfinite(det.y1) ||
        !std::isfinite(det.x2) || !std::isfinite(det.y2)) {
        problem = "non-finite box coordinates";
    } else if (det.x2 <= det.x1 || det.y2 <= det.y1) {
        problem = "empty or inverted box";
    } else if (!(det.confidence >= 0.0f && det.confidence <= 1.0f)) {
        problem = "confidence outside [0, 1]";
    }

    if (problem && reason) *reason = problem;
    return problem == nullptr;
}

Logger& defaultLogger() {
    static Logger logger;
    return logger;
}
