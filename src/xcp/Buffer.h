// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#pragma once

#include <xcp/Api.h>
#include <cstddef>
#include <cstring>
#include <string>

namespace xcp {

/**
 * Read-only view into a byte region it does not own.
 */
class XCP_API BufferRef {
 public:
  typedef const char* const_iterator;

  BufferRef() noexcept : data_(nullptr), size_(0) {}
  BufferRef(const char* data, size_t size) noexcept : data_(data), size_(size) {}
  BufferRef(const std::string& s) noexcept : data_(s.data()), size_(s.size()) {}
  template <size_t N>
  BufferRef(const char (&s)[N]) noexcept : data_(s), size_(N - 1) {}

  const char* data() const noexcept { return data_; }
  size_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }

  const_iterator begin() const noexcept { return data_; }
  const_iterator end() const noexcept { return data_ + size_; }

  char operator[](size_t i) const { return data_[i]; }

  /**
   * Retrieves a sub region starting at @p offset with up to @p count bytes.
   */
  BufferRef ref(size_t offset, size_t count = npos) const;

  std::string str() const { return std::string(data_, size_); }

  bool operator==(const BufferRef& other) const noexcept;
  bool operator!=(const BufferRef& other) const noexcept { return !(*this == other); }

  static constexpr size_t npos = static_cast<size_t>(-1);

 private:
  const char* data_;
  size_t size_;
};

/**
 * Writable view into a caller owned byte region.
 *
 * Used to lend a reusable work buffer to a copy operation.
 */
class XCP_API MutableBufferRef {
 public:
  MutableBufferRef() noexcept : data_(nullptr), size_(0) {}
  MutableBufferRef(char* data, size_t size) noexcept : data_(data), size_(size) {}
  template <size_t N>
  MutableBufferRef(char (&s)[N]) noexcept : data_(s), size_(N) {}

  char* data() const noexcept { return data_; }
  size_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }

  char& operator[](size_t i) const { return data_[i]; }

  BufferRef ref() const noexcept { return BufferRef(data_, size_); }
  BufferRef ref(size_t offset, size_t count = BufferRef::npos) const {
    return ref().ref(offset, count);
  }

 private:
  char* data_;
  size_t size_;
};

/**
 * Growable, heap allocated byte buffer.
 */
class XCP_API Buffer {
 public:
  typedef char value_type;
  typedef char* iterator;
  typedef const char* const_iterator;

  enum { CHUNK_SIZE = 4096 };

  Buffer();
  explicit Buffer(size_t capacity);
  Buffer(const char* data, size_t size);
  Buffer(const BufferRef& ref);
  Buffer(const Buffer& other);
  Buffer(Buffer&& other) noexcept;
  ~Buffer();

  Buffer& operator=(const Buffer& other);
  Buffer& operator=(Buffer&& other) noexcept;

  char* data() noexcept { return data_; }
  const char* data() const noexcept { return data_; }
  size_t size() const noexcept { return size_; }
  size_t capacity() const noexcept { return capacity_; }
  bool empty() const noexcept { return size_ == 0; }

  iterator begin() noexcept { return data_; }
  iterator end() noexcept { return data_ + size_; }
  const_iterator begin() const noexcept { return data_; }
  const_iterator end() const noexcept { return data_ + size_; }

  char& operator[](size_t i) { return data_[i]; }
  char operator[](size_t i) const { return data_[i]; }

  void reserve(size_t value) {
    if (value > capacity_)
      setCapacity(value);
  }

  void resize(size_t value);
  void clear() noexcept { size_ = 0; }

  void push_back(char value);
  void push_back(const char* data, size_t size);
  void push_back(const BufferRef& ref) { push_back(ref.data(), ref.size()); }
  void push_back(const std::string& s) { push_back(s.data(), s.size()); }
  template <size_t N>
  void push_back(const char (&s)[N]) { push_back(s, N - 1); }

  BufferRef ref() const noexcept { return BufferRef(data_, size_); }
  BufferRef ref(size_t offset, size_t count = BufferRef::npos) const {
    return ref().ref(offset, count);
  }
  operator BufferRef() const noexcept { return ref(); }

  std::string str() const { return std::string(data_, size_); }

  void swap(Buffer& other) noexcept;

 private:
  void setCapacity(size_t value);

 private:
  char* data_;
  size_t size_;
  size_t capacity_;
};

inline bool operator==(const Buffer& a, const Buffer& b) {
  return a.ref() == b.ref();
}

inline bool operator!=(const Buffer& a, const Buffer& b) {
  return !(a == b);
}

} // namespace xcp
