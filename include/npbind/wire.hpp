// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <type_traits>

#include <npbind/error.hpp>
#include <npbind/exception.hpp>
#include <npbind/flat_buffer.hpp>
#include <npbind/handle.hpp>
#include <npbind/value.hpp>

namespace npbind {

enum class MessageId : std::uint32_t {
  FunctionCall = 0,
  Success,
  Exception,
  Error_StaleHandle,
  Error_NoSuchMethod,
  Error_BadInput,
  Error_ResourceExhausted,
  Error_NotInitialized,
};

enum class MessageType : std::uint32_t {
  Request = 0,
  Answer = 1,
};

struct Header {
  std::uint32_t size; // size of the message excluding this field
  MessageId msg_id;
  MessageType msg_type;
  std::uint32_t request_id;
};

static_assert(std::is_standard_layout_v<Header>,
              "npbind::Header must be a standard layout type");

// Upper bound for a single string/bytes value accepted from the wire
static constexpr std::uint32_t max_wire_blob_size = 64 * 1024 * 1024;

/**
 * @brief Writes a message: header, value count, then tagged values.
 *
 * Object values are written as WireRef; mapping objects to references is the
 * job of the caller (see impl::ReferenceBridge).
 */
class WireWriter
{
  flat_buffer& buf_;
  std::size_t header_pos_;
  std::size_t count_pos_ = 0;
  std::uint32_t count_ = 0;
  bool counting_ = false;

  template <typename T> void put(const T& v)
  {
    static_assert(std::is_trivially_copyable_v<T>);
    buf_.append(&v, sizeof(T));
  }

  void put_blob(const void* data, std::size_t n)
  {
    if (n > max_wire_blob_size)
      throw ExceptionBadInput("value too large for the wire");
    put(static_cast<std::uint32_t>(n));
    buf_.append(data, n);
  }

  void tag(ValueType t)
  {
    put(static_cast<std::uint8_t>(t));
    if (counting_)
      ++count_;
  }

public:
  WireWriter(flat_buffer& buf,
             MessageId id,
             MessageType type,
             std::uint32_t request_id = 0)
      : buf_{buf}
      , header_pos_{buf.size()}
  {
    Header h{0, id, type, request_id};
    put(h);
  }

  // Starts the value list. The count is patched by finish().
  void begin_values()
  {
    count_pos_ = buf_.size();
    put(std::uint32_t{0});
    counting_ = true;
  }

  void write_void() { tag(ValueType::Void); }

  void write_bool(bool v)
  {
    tag(ValueType::Bool);
    put(static_cast<std::uint8_t>(v ? 1 : 0));
  }

  void write_int32(std::int32_t v)
  {
    tag(ValueType::Int32);
    put(v);
  }

  void write_int64(std::int64_t v)
  {
    tag(ValueType::Int64);
    put(v);
  }

  void write_float64(double v)
  {
    tag(ValueType::Float64);
    put(v);
  }

  void write_string(std::string_view v)
  {
    tag(ValueType::String);
    put_blob(v.data(), v.size());
  }

  void write_bytes(const Bytes& v)
  {
    tag(ValueType::Bytes);
    put_blob(v.data(), v.size());
  }

  void write_ref(WireRef ref)
  {
    tag(ValueType::Object);
    put(static_cast<std::uint8_t>(ref.kind));
    put(ref.value);
  }

  void write_error(const ForeignError& err)
  {
    tag(ValueType::Error);
    put(static_cast<std::uint8_t>(err.present ? 1 : 0));
    if (err.present) {
      put_blob(err.message.data(), err.message.size());
      put(err.token);
    }
  }

  // Error payload of an Exception or Error_* message, outside the value list
  void write_message(std::string_view msg) { put_blob(msg.data(), msg.size()); }

  void finish() noexcept
  {
    auto base = buf_.data_ptr();
    if (counting_)
      std::memcpy(base + count_pos_, &count_, sizeof(count_));
    std::uint32_t size =
        static_cast<std::uint32_t>(buf_.size() - header_pos_ - 4);
    std::memcpy(base + header_pos_, &size, sizeof(size));
  }
};

/**
 * @brief Bounds-checked reader for messages produced by WireWriter.
 *
 * Every malformed input is reported as ExceptionBadInput. The foreign side is
 * never trusted to produce well-formed messages.
 */
class WireReader
{
  const flat_buffer& buf_;
  std::size_t pos_ = 0;

  void need(std::size_t n) const
  {
    if (buf_.size() - pos_ < n)
      throw ExceptionBadInput("truncated message");
  }

  template <typename T> T get()
  {
    static_assert(std::is_trivially_copyable_v<T>);
    need(sizeof(T));
    T v;
    std::memcpy(&v, buf_.data_ptr() + pos_, sizeof(T));
    pos_ += sizeof(T);
    return v;
  }

  std::string_view get_blob()
  {
    auto n = get<std::uint32_t>();
    if (n > max_wire_blob_size)
      throw ExceptionBadInput("blob exceeds the size limit");
    need(n);
    std::string_view v(reinterpret_cast<const char*>(buf_.data_ptr() + pos_),
                       n);
    pos_ += n;
    return v;
  }

  void expect(ValueType expected)
  {
    auto t = next_type();
    if (t != expected)
      throw ExceptionBadInput("expected " + std::string(to_string(expected)) +
                              ", got " + std::string(to_string(t)));
    ++pos_;
  }

public:
  explicit WireReader(const flat_buffer& buf) noexcept : buf_{buf} {}

  Header read_header()
  {
    auto h = get<Header>();
    if (h.size != buf_.size() - 4)
      throw ExceptionBadInput("header size mismatch");
    return h;
  }

  std::uint32_t read_count()
  {
    auto n = get<std::uint32_t>();
    // every value takes at least its tag byte
    if (n > buf_.size() - pos_)
      throw ExceptionBadInput("value count exceeds message size");
    return n;
  }

  ValueType next_type() const
  {
    need(1);
    auto t = buf_.data_ptr()[pos_];
    if (t > static_cast<std::uint8_t>(ValueType::Error))
      throw ExceptionBadInput("unknown value tag " + std::to_string(t));
    return static_cast<ValueType>(t);
  }

  void read_void() { expect(ValueType::Void); }

  bool read_bool()
  {
    expect(ValueType::Bool);
    auto b = get<std::uint8_t>();
    if (b > 1)
      throw ExceptionBadInput("invalid boolean");
    return b == 1;
  }

  std::int32_t read_int32()
  {
    expect(ValueType::Int32);
    return get<std::int32_t>();
  }

  std::int64_t read_int64()
  {
    expect(ValueType::Int64);
    return get<std::int64_t>();
  }

  double read_float64()
  {
    expect(ValueType::Float64);
    return get<double>();
  }

  std::string read_string()
  {
    expect(ValueType::String);
    return std::string(get_blob());
  }

  Bytes read_bytes()
  {
    expect(ValueType::Bytes);
    auto v = get_blob();
    return Bytes(v.begin(), v.end());
  }

  WireRef read_ref()
  {
    expect(ValueType::Object);
    auto kind = get<std::uint8_t>();
    if (kind > static_cast<std::uint8_t>(RefKind::Foreign))
      throw ExceptionBadInput("unknown reference kind");
    WireRef ref{static_cast<RefKind>(kind), get<handle_t>()};
    if (ref.kind == RefKind::Null && ref.value != null_handle)
      throw ExceptionBadInput("null reference with a non-null value");
    if (ref.kind != RefKind::Null && ref.value == null_handle)
      throw ExceptionBadInput("live reference carrying the null sentinel");
    return ref;
  }

  ForeignError read_error()
  {
    expect(ValueType::Error);
    auto present = get<std::uint8_t>();
    if (present > 1)
      throw ExceptionBadInput("invalid error flag");
    ForeignError err;
    err.present = present == 1;
    if (err.present) {
      err.message = std::string(get_blob());
      err.token = get<std::uint64_t>();
    }
    return err;
  }

  std::string read_message() { return std::string(get_blob()); }

  bool at_end() const noexcept { return pos_ == buf_.size(); }

  std::size_t position() const noexcept { return pos_; }
  void seek(std::size_t pos) noexcept { pos_ = std::min(pos, buf_.size()); }

  // Count of a value list, without throwing
  bool try_read_count(std::uint32_t& n) noexcept
  {
    if (buf_.size() - pos_ < sizeof(n))
      return false;
    std::memcpy(&n, buf_.data_ptr() + pos_, sizeof(n));
    pos_ += sizeof(n);
    return true;
  }

  /**
   * @brief Steps over the next value without decoding it.
   *
   * Used to find references in what is left of a rejected message. Returns
   * false on malformed input, the position is then unspecified. @p ref is
   * set for Object values and left null for everything else.
   */
  bool skip_value(WireRef& ref) noexcept
  {
    ref = WireRef{};
    if (pos_ >= buf_.size())
      return false;

    auto skip = [this](std::size_t n) {
      if (buf_.size() - pos_ < n)
        return false;
      pos_ += n;
      return true;
    };

    auto skip_blob = [&] {
      std::uint32_t n;
      if (!try_read_count(n) || n > max_wire_blob_size)
        return false;
      return skip(n);
    };

    auto t = buf_.data_ptr()[pos_++];
    switch (static_cast<ValueType>(t)) {
    case ValueType::Void:
      return true;
    case ValueType::Bool:
      return skip(1);
    case ValueType::Int32:
      return skip(4);
    case ValueType::Int64:
    case ValueType::Float64:
      return skip(8);
    case ValueType::String:
    case ValueType::Bytes:
      return skip_blob();
    case ValueType::Object: {
      if (buf_.size() - pos_ < 1 + sizeof(handle_t))
        return false;
      auto kind = buf_.data_ptr()[pos_];
      if (kind > static_cast<std::uint8_t>(RefKind::Foreign))
        return false;
      ref.kind = static_cast<RefKind>(kind);
      std::memcpy(&ref.value, buf_.data_ptr() + pos_ + 1, sizeof(handle_t));
      pos_ += 1 + sizeof(handle_t);
      return true;
    }
    case ValueType::Error: {
      if (pos_ >= buf_.size())
        return false;
      auto present = buf_.data_ptr()[pos_++];
      if (present > 1)
        return false;
      return present == 0 || (skip_blob() && skip(sizeof(std::uint64_t)));
    }
    }
    return false;
  }
};

// Answer without values: a failure kind and its message
inline void make_simple_answer(flat_buffer& buf,
                               MessageId id,
                               std::uint32_t request_id,
                               std::string_view message = {})
{
  buf.clear();
  WireWriter w(buf, id, MessageType::Answer, request_id);
  w.write_message(message);
  w.finish();
}

// Returns on Success (the reader is positioned at the value list), throws
// the host-side exception for every failure kind.
inline void handle_standard_reply(WireReader& reader,
                                  const Header& header,
                                  handle_t target)
{
  if (header.msg_type != MessageType::Answer)
    throw ExceptionBadInput("reply is not an answer");

  switch (header.msg_id) {
  case MessageId::Success:
    return;
  case MessageId::Exception:
    throw ForeignException(Error(reader.read_message()));
  case MessageId::Error_StaleHandle:
    throw ExceptionStaleHandle(target);
  case MessageId::Error_NoSuchMethod:
    throw ExceptionNoSuchMethod(reader.read_message());
  case MessageId::Error_BadInput:
    throw ExceptionBadInput(reader.read_message());
  case MessageId::Error_ResourceExhausted:
    throw ExceptionResourceExhausted(reader.read_message());
  case MessageId::Error_NotInitialized:
    throw Exception("foreign runtime is not initialized");
  default:
    throw ExceptionBadInput("unknown reply kind");
  }
}

} // namespace npbind
