// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT
#pragma once

#include <xcp/Api.h>
#include <fmt/format.h>
#include <atomic>
#include <mutex>
#include <string>
#include <utility>

namespace xcp {

enum class LogLevel { // {{{
  None = 9999,
  Fatal = 7000,
  Error = 6000,
  Warning = 5000,
  Notice = 4000,
  Info = 3000,
  Debug = 2000,
  Trace = 1000,
};

XCP_API LogLevel make_loglevel(const std::string& value);
XCP_API std::string as_string(LogLevel value);
// }}}
class XCP_API LogTarget { // {{{
 public:
  virtual ~LogTarget() {}

  virtual void log(LogLevel level, const std::string& message) = 0;
};
// }}}
class XCP_API ConsoleLogTarget : public LogTarget { // {{{
 public:
  ConsoleLogTarget();

  void log(LogLevel level, const std::string& message) override;

  static ConsoleLogTarget* get();

 private:
  std::string createTimestamp() const;
}; // }}}
class XCP_API Logger { // {{{
 public:
  Logger();
  static Logger* get();

  void error(const std::string& message);
  void warning(const std::string& message);
  void notice(const std::string& message);
  void info(const std::string& message);
  void debug(const std::string& message);
  void trace(const std::string& message);

  static constexpr size_t MaxTargets = 64;

  /**
   * Registers @p target, reusing a slot freed by removeTarget().
   *
   * @throw RuntimeError with Status::IllegalStateError if all MaxTargets
   *        slots are taken.
   */
  void addTarget(LogTarget* target);
  void removeTarget(LogTarget* target);
  void setMinimumLogLevel(LogLevel min_level);
  LogLevel getMinimumLogLevel() { return min_level_.load(); }

  bool isEnabled(LogLevel level) const noexcept { return level >= min_level_.load(); }

 protected:
  void log(LogLevel log_level, const std::string& message);

 protected:
  std::atomic<LogLevel> min_level_;
  std::mutex targets_mutex_;
  std::atomic<size_t> max_listener_index_;
  std::atomic<LogTarget*> listeners_[MaxTargets];
};
// }}}
// {{{ free functions
/**
 * ERROR: User-visible Runtime Errors
 */
template <typename... T>
inline void logError(fmt::format_string<T...> msg, T&&... args) {
  if (Logger::get()->isEnabled(LogLevel::Error))
    Logger::get()->error(fmt::format(msg, std::forward<T>(args)...));
}

/**
 * WARNING: Something unexpected happened that should not have happened
 */
template <typename... T>
inline void logWarning(fmt::format_string<T...> msg, T&&... args) {
  if (Logger::get()->isEnabled(LogLevel::Warning))
    Logger::get()->warning(fmt::format(msg, std::forward<T>(args)...));
}

/**
 * NOTICE: Normal but significant condition.
 */
template <typename... T>
inline void logNotice(fmt::format_string<T...> msg, T&&... args) {
  if (Logger::get()->isEnabled(LogLevel::Notice))
    Logger::get()->notice(fmt::format(msg, std::forward<T>(args)...));
}

/**
 * INFO: Informational messages
 */
template <typename... T>
inline void logInfo(fmt::format_string<T...> msg, T&&... args) {
  if (Logger::get()->isEnabled(LogLevel::Info))
    Logger::get()->info(fmt::format(msg, std::forward<T>(args)...));
}

/**
 * DEBUG: Debug messages
 */
template <typename... T>
inline void logDebug(fmt::format_string<T...> msg, T&&... args) {
  if (Logger::get()->isEnabled(LogLevel::Debug))
    Logger::get()->debug(fmt::format(msg, std::forward<T>(args)...));
}

/**
 * TRACE: Trace messages
 */
template <typename... T>
inline void logTrace(fmt::format_string<T...> msg, T&&... args) {
  if (Logger::get()->isEnabled(LogLevel::Trace))
    Logger::get()->trace(fmt::format(msg, std::forward<T>(args)...));
}
// }}}

} // namespace xcp
