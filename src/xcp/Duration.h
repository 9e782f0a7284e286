// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#ifndef _XCP_DURATION_H
#define _XCP_DURATION_H

#include <chrono>
#include <cstdint>
#include <string>

namespace xcp {

class Duration {
 private:
  enum class ZeroType { Zero };

 public:
  constexpr static ZeroType Zero = ZeroType::Zero;

  /**
   * Creates a new Duration of zero microseconds.
   */
  constexpr Duration(ZeroType) : micros_(0) {}

  /**
   * Create a new Duration
   *
   * @param microseconds the duration in microseconds
   */
  constexpr explicit Duration(uint64_t microseconds) : micros_(microseconds) {}

  constexpr bool operator==(const Duration& other) const { return micros_ == other.micros_; }
  constexpr bool operator!=(const Duration& other) const { return micros_ != other.micros_; }
  constexpr bool operator<(const Duration& other) const { return micros_ < other.micros_; }
  constexpr bool operator>(const Duration& other) const { return micros_ > other.micros_; }
  constexpr bool operator<=(const Duration& other) const { return micros_ <= other.micros_; }
  constexpr bool operator>=(const Duration& other) const { return micros_ >= other.micros_; }
  constexpr bool operator!() const { return micros_ == 0; }

  constexpr Duration operator+(const Duration& other) const {
    return Duration(micros_ + other.micros_);
  }

  /**
   * Return the represented duration in microseconds
   */
  constexpr uint64_t microseconds() const noexcept { return micros_; }

  /**
   * Return the represented duration in milliseconds
   */
  constexpr uint64_t milliseconds() const noexcept { return micros_ / 1000; }

  /**
   * Return the represented duration in seconds
   */
  constexpr uint64_t seconds() const noexcept { return micros_ / 1000000; }

  std::chrono::microseconds toChrono() const {
    return std::chrono::microseconds(micros_);
  }

  static constexpr Duration fromSeconds(uint64_t v) { return Duration(v * 1000000); }
  static constexpr Duration fromMilliseconds(uint64_t v) { return Duration(v * 1000); }
  static constexpr Duration fromMicroseconds(uint64_t v) { return Duration(v); }

 protected:
  uint64_t micros_;
};

} // namespace xcp

constexpr xcp::Duration operator "" _microseconds(unsigned long long v) {
  return xcp::Duration::fromMicroseconds(v);
}

constexpr xcp::Duration operator "" _milliseconds(unsigned long long v) {
  return xcp::Duration::fromMilliseconds(v);
}

constexpr xcp::Duration operator "" _seconds(unsigned long long v) {
  return xcp::Duration::fromSeconds(v);
}

#endif
