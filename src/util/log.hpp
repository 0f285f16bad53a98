#ifndef UTIL_LOG_H_
#define UTIL_LOG_H_

#include <chrono>
#include <cstdio>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

namespace lensgen {

enum class LogLevel {
  kDebug,
  kVerbose,
  kInfo,
  kWarning,
  kError,
};


struct LogMessage {
  LogLevel level;
  std::chrono::system_clock::time_point time;
  std::string tag;
  std::string text;
};

// e.g. 12:03:45.120[INFO]<march> text
std::string FormatLogMessage(const LogMessage& msg);


class LogDestination {
 public:
  virtual ~LogDestination() = default;
  virtual void Write(const LogMessage& msg) = 0;
};

using LogDestPtr = std::shared_ptr<LogDestination>;


class LogStreamDest : public LogDestination {
 public:
  explicit LogStreamDest(std::FILE* stream) : stream_(stream) {}

  void Write(const LogMessage& msg) override;

  static LogDestPtr Stdout();
  static LogDestPtr Stderr();

 private:
  std::FILE* stream_;
};


/**
 * @brief Routes every message to the destinations whose level set contains the message level.
 *
 * A destination receives a message at most once, even if it is registered several times. By default info goes
 * to stdout (verbose and debug too in DEBUG builds), and warning and error go to stderr.
 */
class Logger {
 public:
  void EmitLog(LogLevel level, const char* tag, const char* fmt, ...);
  void AddDestination(std::initializer_list<LogLevel> levels, LogDestPtr dest);

  static Logger* GetInstance();

  static constexpr size_t kMaxMessageLength = 1024;

 private:
  Logger();

  struct Route {
    std::vector<LogLevel> levels_;
    LogDestPtr dest_;
  };
  std::vector<Route> routes_;
};

}  // namespace lensgen

#define LOG_DEBUG(fmt, ...) \
  lensgen::Logger::GetInstance()->EmitLog(lensgen::LogLevel::kDebug, "", (fmt), ##__VA_ARGS__)
#define LOG_VERBOSE(fmt, ...) \
  lensgen::Logger::GetInstance()->EmitLog(lensgen::LogLevel::kVerbose, "", (fmt), ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) \
  lensgen::Logger::GetInstance()->EmitLog(lensgen::LogLevel::kInfo, "", (fmt), ##__VA_ARGS__)
#define LOG_WARNING(fmt, ...) \
  lensgen::Logger::GetInstance()->EmitLog(lensgen::LogLevel::kWarning, "", (fmt), ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) \
  lensgen::Logger::GetInstance()->EmitLog(lensgen::LogLevel::kError, "", (fmt), ##__VA_ARGS__)

// Tagged debug output, e.g. LOG_TAG_DEBUG("march", ...)
#define LOG_TAG_DEBUG(tag, fmt, ...) \
  lensgen::Logger::GetInstance()->EmitLog(lensgen::LogLevel::kDebug, (tag), (fmt), ##__VA_ARGS__)

#endif  // UTIL_LOG_H_
