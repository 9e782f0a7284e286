// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <xcp/Buffer.h>
#include <algorithm>
#include <cstdlib>
#include <new>
#include <utility>

namespace xcp {

constexpr size_t BufferRef::npos;

// {{{ BufferRef
BufferRef BufferRef::ref(size_t offset, size_t count) const {
  if (offset >= size_)
    return BufferRef();

  return BufferRef(data_ + offset, std::min(count, size_ - offset));
}

bool BufferRef::operator==(const BufferRef& other) const noexcept {
  if (size_ != other.size_)
    return false;

  return size_ == 0 || std::memcmp(data_, other.data_, size_) == 0;
}
// }}}
// {{{ Buffer
Buffer::Buffer()
    : data_(nullptr),
      size_(0),
      capacity_(0) {
}

Buffer::Buffer(size_t capacity)
    : Buffer() {
  setCapacity(capacity);
}

Buffer::Buffer(const char* data, size_t size)
    : Buffer() {
  push_back(data, size);
}

Buffer::Buffer(const BufferRef& ref)
    : Buffer(ref.data(), ref.size()) {
}

Buffer::Buffer(const Buffer& other)
    : Buffer(other.data(), other.size()) {
}

Buffer::Buffer(Buffer&& other) noexcept
    : data_(other.data_),
      size_(other.size_),
      capacity_(other.capacity_) {
  other.data_ = nullptr;
  other.size_ = 0;
  other.capacity_ = 0;
}

Buffer::~Buffer() {
  std::free(data_);
}

Buffer& Buffer::operator=(const Buffer& other) {
  if (this != &other) {
    clear();
    push_back(other.data(), other.size());
  }
  return *this;
}

Buffer& Buffer::operator=(Buffer&& other) noexcept {
  Buffer tmp(std::move(other));
  swap(tmp);
  return *this;
}

void Buffer::swap(Buffer& other) noexcept {
  std::swap(data_, other.data_);
  std::swap(size_, other.size_);
  std::swap(capacity_, other.capacity_);
}

void Buffer::resize(size_t value) {
  reserve(value);
  size_ = value;
}

void Buffer::push_back(char value) {
  reserve(size_ + 1);
  data_[size_++] = value;
}

void Buffer::push_back(const char* data, size_t size) {
  if (size == 0)
    return;

  reserve(size_ + size);
  std::memcpy(data_ + size_, data, size);
  size_ += size;
}

/**
 * Changes the capacity of the underlying storage.
 *
 * Growing an already allocated buffer rounds up to CHUNK_SIZE,
 * the very first allocation reserves exactly @p value bytes.
 * Shrinking below size() cuts down size() accordingly.
 *
 * @throw std::bad_alloc if the storage could not be reallocated.
 */
void Buffer::setCapacity(size_t value) {
  if (value == 0) {
    std::free(data_);
    data_ = nullptr;
    size_ = 0;
    capacity_ = 0;
    return;
  }

  if (value > capacity_) {
    if (capacity_) {
      value = value - 1;
      value = value + CHUNK_SIZE - (value % CHUNK_SIZE);
    }
  } else if (value < capacity_) {
    if (value < size_) {
      size_ = value;
    }
  } else {
    return;
  }

  if (char* rp = static_cast<value_type*>(std::realloc(data_, value))) {
    data_ = rp;
    capacity_ = value;
  } else {
    throw std::bad_alloc();
  }
}
// }}}

} // namespace xcp
