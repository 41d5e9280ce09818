#pragma once

#include <string>

namespace parkpool {

enum class LogLevel { Debug = 0, Info, Warn, Error, Fatal };

// Messages below this level are dropped. Defaults to Info.
void setLogLevel(LogLevel level);
LogLevel logLevel();

// One line per call, "[INFO] msg". Warn and above go to stderr. Safe to call
// from several threads at once.
void log(LogLevel level, const std::string& msg);

inline void logDebug(const std::string& msg) { log(LogLevel::Debug, msg); }
inline void logInfo(const std::string& msg)  { log(LogLevel::Info, msg); }
inline void logWarn(const std::string& msg)  { log(LogLevel::Warn, msg); }
inline void logError(const std::string& msg) { log(LogLevel::Error, msg); }
inline void logFatal(const std::string& msg) { log(LogLevel::Fatal, msg); }

const char* toString(LogLevel level);

} // namespace parkpool
