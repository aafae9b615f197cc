#ifndef LOGGING_H
#define LOGGING_H

#include <iostream>
#include <string>

// Sink for the counter's diagnostics
class ILogger {
public:
    enum class Severity {
        kERROR = 0,
        kWARNING = 1,
        kINFO = 2,
        kVERBOSE = 3
    };

    virtual ~ILogger() {}
    virtual void log(Severity severity, const char* msg) noexcept = 0;

    void log(Severity severity, const std::string& msg) noexcept { log(severity, msg.c_str()); }
};

// Console logger: everything at or above `reportable` goes to stderr
class Logger : public ILogger {
public:
    explicit Logger(Severity reportable = Severity::kWARNING) : reportable_(reportable) {}

    using ILogger::log;

    void log(Severity severity, const char* msg) noexcept override {
        if (severity > reportable_) return;
        std::cerr << "[VehicleCounter] " << severityTag(severity) << msg << std::endl;
    }

private:
    Severity reportable_;

    static const char* severityTag(Severity severity) {
        switch (severity) {
            case Severity::kERROR:   return "ERROR: ";
            case Severity::kWARNING: return "WARNING: ";
            case Severity::kINFO:    return "";
            case Severity::kVERBOSE: return "DEBUG: ";
        }
        return "";
    }
};

// Shared console logger used when a caller does not inject one
Logger& defaultLogger();

#endif // LOGGING_H
