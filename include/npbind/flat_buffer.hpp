// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>

#include <boost/asio/buffer.hpp>

#include <npbind/export.hpp>

namespace npbind {

/**
 * @brief Growable byte buffer carrying wire-encoded arguments and replies.
 *
 * The interface follows boost::beast::flat_buffer: prepare() hands out a
 * writable area, commit() moves it to the readable area, consume() drops
 * bytes from the front.
 *
 * Memory Layout:
 * +------------------+------------------+------------------+
 * |   [consumed]     |    [readable]    |   [writable]     |
 * +------------------+------------------+------------------+
 * ^                  ^                  ^                  ^
 * buffer_           in_                out_               capacity_
 */
class flat_buffer
{
public:
  using const_buffers_type = boost::asio::const_buffer;
  using mutable_buffers_type = boost::asio::mutable_buffer;

private:
  std::uint8_t* buffer_ = nullptr;
  std::size_t in_ = 0;
  std::size_t out_ = 0;
  std::size_t capacity_ = 0;

  static constexpr std::size_t default_growth_factor = 2;
  static constexpr std::size_t min_allocation = 512;

  void grow(std::size_t n)
  {
    std::size_t const current_size = out_ - in_;
    std::size_t const required = current_size + n;

    std::size_t new_cap = std::max(capacity_ * default_growth_factor, required);
    new_cap = std::max(new_cap, min_allocation);

    std::uint8_t* new_buf = new std::uint8_t[new_cap];
    if (current_size > 0) {
      std::memcpy(new_buf, buffer_ + in_, current_size);
    }
    delete[] buffer_;

    buffer_ = new_buf;
    in_ = 0;
    out_ = current_size;
    capacity_ = new_cap;
  }

public:
  flat_buffer() = default;

  explicit flat_buffer(std::size_t initial_capacity)
      : buffer_(new std::uint8_t[initial_capacity])
      , capacity_(initial_capacity)
  {
  }

  flat_buffer(flat_buffer&& other) noexcept
      : buffer_(other.buffer_)
      , in_(other.in_)
      , out_(other.out_)
      , capacity_(other.capacity_)
  {
    other.buffer_ = nullptr;
    other.in_ = 0;
    other.out_ = 0;
    other.capacity_ = 0;
  }

  flat_buffer& operator=(flat_buffer&& other) noexcept
  {
    if (this != &other) {
      delete[] buffer_;

      buffer_ = other.buffer_;
      in_ = other.in_;
      out_ = other.out_;
      capacity_ = other.capacity_;

      other.buffer_ = nullptr;
      other.in_ = 0;
      other.out_ = 0;
      other.capacity_ = 0;
    }
    return *this;
  }

  // Deep copy, the copy is sized to the readable area
  flat_buffer(const flat_buffer& other)
      : buffer_(other.size() > 0 ? new std::uint8_t[other.size()] : nullptr)
      , in_(0)
      , out_(other.size())
      , capacity_(other.size())
  {
    if (out_ > 0) {
      std::memcpy(buffer_, other.data_ptr(), out_);
    }
  }

  flat_buffer& operator=(const flat_buffer& other)
  {
    if (this != &other) {
      flat_buffer tmp(other);
      *this = std::move(tmp);
    }
    return *this;
  }

  ~flat_buffer() { delete[] buffer_; }

  std::size_t size() const noexcept { return out_ - in_; }

  std::size_t capacity() const noexcept { return capacity_ - in_; }

  const_buffers_type data() const noexcept
  {
    return {buffer_ + in_, out_ - in_};
  }

  mutable_buffers_type data() noexcept { return {buffer_ + in_, out_ - in_}; }

  const_buffers_type cdata() const noexcept { return data(); }

  mutable_buffers_type prepare(std::size_t n)
  {
    if (out_ + n > capacity_) {
      grow(n);
    }
    return {buffer_ + out_, n};
  }

  void commit(std::size_t n) noexcept { out_ = std::min(out_ + n, capacity_); }

  void consume(std::size_t n) noexcept
  {
    in_ = std::min(in_ + n, out_);
    if (in_ == out_) {
      in_ = 0;
      out_ = 0;
    }
  }

  void clear() noexcept
  {
    in_ = 0;
    out_ = 0;
  }

  // Appends raw bytes to the readable area
  void append(const void* src, std::size_t n)
  {
    if (n == 0)
      return;
    auto mb = prepare(n);
    std::memcpy(mb.data(), src, n);
    commit(n);
  }

  std::uint8_t* data_ptr() noexcept { return buffer_ + in_; }

  const std::uint8_t* data_ptr() const noexcept { return buffer_ + in_; }

  static void swap(flat_buffer& a, flat_buffer& b) noexcept
  {
    using std::swap;
    swap(a.buffer_, b.buffer_);
    swap(a.in_, b.in_);
    swap(a.out_, b.out_);
    swap(a.capacity_, b.capacity_);
  }

  static constexpr std::size_t default_initial_size() noexcept { return 512; }
};

} // namespace npbind
