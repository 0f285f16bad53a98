#include "util/log.hpp"

#include <algorithm>
#include <cstdarg>
#include <ctime>
#include <utility>

namespace lensgen {

namespace {

const char* LevelString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "[DEBUG]";
    case LogLevel::kVerbose:
      return "[VERBOSE]";
    case LogLevel::kInfo:
      return "[INFO]";
    case LogLevel::kWarning:
      return "[WARNING]";
    case LogLevel::kError:
      return "[ERROR]";
  }
  return "";
}

}  // namespace


std::string FormatLogMessage(const LogMessage& msg) {
  char stamp[32];
  const auto tt = std::chrono::system_clock::to_time_t(msg.time);
  std::tm local_tm{};
  localtime_r(&tt, &local_tm);
  auto n = std::strftime(stamp, sizeof(stamp), "%T", &local_tm);

  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(msg.time.time_since_epoch()).count() % 1000;
  std::snprintf(stamp + n, sizeof(stamp) - n, ".%03d", static_cast<int>(ms));

  std::string s = stamp;
  s += LevelString(msg.level);
  if (!msg.tag.empty()) {
    s += "<" + msg.tag + ">";
  }
  s += " ";
  s += msg.text;
  return s;
}


void LogStreamDest::Write(const LogMessage& msg) {
  std::fprintf(stream_, "%s\n", FormatLogMessage(msg).c_str());
}


LogDestPtr LogStreamDest::Stdout() {
  static LogDestPtr dest = std::make_shared<LogStreamDest>(stdout);
  return dest;
}


LogDestPtr LogStreamDest::Stderr() {
  static LogDestPtr dest = std::make_shared<LogStreamDest>(stderr);
  return dest;
}


Logger::Logger() {
#ifdef DEBUG
  AddDestination({ LogLevel::kDebug, LogLevel::kVerbose, LogLevel::kInfo }, LogStreamDest::Stdout());
#else
  AddDestination({ LogLevel::kInfo }, LogStreamDest::Stdout());
#endif
  AddDestination({ LogLevel::kWarning, LogLevel::kError }, LogStreamDest::Stderr());
}


void Logger::EmitLog(LogLevel level, const char* tag, const char* fmt, ...) {
  char buf[kMaxMessageLength];
  va_list args;
  va_start(args, fmt);
  std::vsnprintf(buf, kMaxMessageLength, fmt, args);
  va_end(args);

  LogMessage msg{ level, std::chrono::system_clock::now(), tag ? tag : "", buf };
  std::vector<LogDestination*> written;
  for (const auto& r : routes_) {
    if (std::find(r.levels_.begin(), r.levels_.end(), level) == r.levels_.end() ||
        std::find(written.begin(), written.end(), r.dest_.get()) != written.end()) {
      continue;
    }
    r.dest_->Write(msg);
    written.emplace_back(r.dest_.get());
  }
}


void Logger::AddDestination(std::initializer_list<LogLevel> levels, LogDestPtr dest) {
  routes_.emplace_back(Route{ levels, std::move(dest) });
}


Logger* Logger::GetInstance() {
  static Logger logger;
  return &logger;
}

}  // namespace lensgen
