#include "parkpool/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace parkpool {

namespace {
std::atomic<LogLevel> minLevel{LogLevel::Info};
std::mutex outMu;
} // namespace

void setLogLevel(LogLevel level) { minLevel.store(level, std::memory_order_relaxed); }
LogLevel logLevel() { return minLevel.load(std::memory_order_relaxed); }

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
    }
    return "?";
}

void log(LogLevel level, const std::string& msg) {
    if (level < logLevel()) return;
    std::ostream& os = level >= LogLevel::Warn ? std::cerr : std::cout;
    std::lock_guard<std::mutex> lk(outMu);
    os << "[" << toString(level) << "] " << msg << "\n";
}

} // namespace parkpool
