// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <xcp/sysconfig.h>
#include <xcp/defines.h>
#include <xcp/logging.h>
#include <xcp/RuntimeError.h>
#include <fmt/chrono.h>
#include <algorithm>
#include <chrono>
#include <cctype>
#include <cstdio>
#include <ctime>

namespace xcp {

// {{{ LogLevel
std::string as_string(LogLevel value) {
  switch (value) {
    case LogLevel::None:
      return "none";
    case LogLevel::Fatal:
      return "fatal";
    case LogLevel::Error:
      return "error";
    case LogLevel::Warning:
      return "warning";
    case LogLevel::Notice:
      return "notice";
    case LogLevel::Info:
      return "info";
    case LogLevel::Debug:
      return "debug";
    case LogLevel::Trace:
      return "trace";
    default:
      RAISE(InvalidArgumentError, "Illegal LogLevel enum value.");
  }
}

LogLevel make_loglevel(const std::string& str) {
  std::string value = str;
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (value == "none")
    return LogLevel::None;

  if (value == "fatal")
    return LogLevel::Fatal;

  if (value == "error" || value == "err")
    return LogLevel::Error;

  if (value == "warning" || value == "warn")
    return LogLevel::Warning;

  if (value == "notice")
    return LogLevel::Notice;

  if (value == "info")
    return LogLevel::Info;

  if (value == "debug")
    return LogLevel::Debug;

  if (value == "trace")
    return LogLevel::Trace;

  RAISE(InvalidArgumentError, "Illegal LogLevel: " + str);
}
// }}}
// {{{ Logger
Logger* Logger::get() {
  static Logger singleton;
  return &singleton;
}

Logger::Logger() :
    min_level_(LogLevel::Notice),
    max_listener_index_(0) {
  for (size_t i = 0; i != MaxTargets; ++i) {
    listeners_[i] = nullptr;
  }
}

void Logger::error(const std::string& message) {
  log(LogLevel::Error, message);
}

void Logger::warning(const std::string& message) {
  log(LogLevel::Warning, message);
}

void Logger::notice(const std::string& message) {
  log(LogLevel::Notice, message);
}

void Logger::info(const std::string& message) {
  log(LogLevel::Info, message);
}

void Logger::debug(const std::string& message) {
  log(LogLevel::Debug, message);
}

void Logger::trace(const std::string& message) {
  log(LogLevel::Trace, message);
}

void Logger::log(LogLevel log_level, const std::string& message) {
  if (log_level >= min_level_) {
    const size_t max_idx = max_listener_index_.load();
    for (size_t i = 0; i < max_idx; ++i) {
      auto listener = listeners_[i].load();

      if (listener != nullptr) {
        listener->log(log_level, message);
      }
    }
  }
}

void Logger::addTarget(LogTarget* target) {
  std::lock_guard<std::mutex> lock(targets_mutex_);

  const size_t count = max_listener_index_.load();
  size_t freeSlot = count;
  for (size_t i = 0; i != count; ++i) {
    LogTarget* current = listeners_[i].load();
    if (current == target)
      return;
    if (current == nullptr && freeSlot == count)
      freeSlot = i;
  }

  if (freeSlot != count) {
    listeners_[freeSlot] = target;
    return;
  }

  if (count == MaxTargets)
    RAISE(IllegalStateError, "Too many log targets.");

  listeners_[count] = target;
  max_listener_index_ = count + 1;
}

void Logger::removeTarget(LogTarget* target) {
  std::lock_guard<std::mutex> lock(targets_mutex_);

  for (size_t i = 0, e = max_listener_index_.load(); i != e; ++i) {
    if (listeners_[i].load() == target) {
      listeners_[i] = nullptr;
    }
  }
}

void Logger::setMinimumLogLevel(LogLevel min_level) {
  min_level_ = min_level;
}
// }}}
// {{{ ConsoleLogTarget
ConsoleLogTarget::ConsoleLogTarget() {
}

ConsoleLogTarget* ConsoleLogTarget::get() {
  static ConsoleLogTarget singleton;
  return &singleton;
}

void ConsoleLogTarget::log(LogLevel level,
                           const std::string& message) {
  fprintf(stderr,
          "%s[%s] %s\n",
          createTimestamp().c_str(),
          as_string(level).c_str(),
          message.c_str());
  fflush(stderr);
}

std::string ConsoleLogTarget::createTimestamp() const {
  auto now = std::chrono::system_clock::now();
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
      now.time_since_epoch()).count() % 1000000;

  return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:06} ",
                     fmt::localtime(std::chrono::system_clock::to_time_t(now)),
                     micros);
}
// }}}

} // namespace xcp
