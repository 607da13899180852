/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file frame.hpp
 * @brief Gateway <-> node wire codec.
 *
 * Frame wire format (12-byte header, big-endian):
 * +--------+---------+------+----------+----------+------------------+
 * | magic  | version | type | reserved | body_len | body             |
 * | 4 byte | 1 byte  | 1 b  | 2 byte   | 4 byte   | variable         |
 * +--------+---------+------+----------+----------+------------------+
 *
 * Strings are encoded as u16 length + bytes, blobs as u32 length + bytes.
 * A decoded frame is one alternative of ngw::Message.
 */

#ifndef NGW_FRAME_HPP_
#define NGW_FRAME_HPP_

#include "ngw/platform.hpp"
#include "ngw/types.hpp"
#include "ngw/vocabulary.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <variant>
#include <vector>

namespace ngw {

// ============================================================================
// Frame Protocol Constants
// ============================================================================

inline constexpr uint32_t kFrameMagic = 0x4E475746;  ///< "NGWF"
inline constexpr uint8_t kFrameVersion = 1;
inline constexpr uint32_t kFrameHeaderSize = 12;
inline constexpr uint32_t kMaxFrameBody = 1024U * 1024U;

enum class FrameType : uint8_t {
  kPair = 1,
  kPairingResponse = 2,
  kCommand = 3,
  kResponse = 4,
  kHeartbeat = 5,
  kHeartbeatAck = 6,
  kClose = 7,
};

enum class FrameError : uint8_t {
  kBadMagic = 0,
  kBadVersion,
  kUnknownType,
  kTruncated,
  kTooLarge,
  kTrailingBytes,
};

inline const char* ToString(FrameError e) noexcept {
  switch (e) {
    case FrameError::kBadMagic:      return "bad_magic";
    case FrameError::kBadVersion:    return "bad_version";
    case FrameError::kUnknownType:   return "unknown_type";
    case FrameError::kTruncated:     return "truncated";
    case FrameError::kTooLarge:      return "too_large";
    case FrameError::kTrailingBytes: return "trailing_bytes";
  }
  return "unknown";
}

struct FrameHeader {
  uint32_t magic = kFrameMagic;
  uint8_t version = kFrameVersion;
  uint8_t type = 0;
  uint16_t reserved = 0;
  uint32_t body_len = 0;
};

// ============================================================================
// Messages
// ============================================================================

/** How a Pair frame authenticates: one-time code or stored session token. */
enum class PairMode : uint8_t { kCode = 0, kToken = 1 };

struct PairFrame {
  PairMode mode = PairMode::kCode;
  std::string credential;  ///< Pairing code or session token.
  NodeHello hello;
};

struct CommandFrame {
  uint64_t command_id = 0;
  uint32_t timeout_ms = 0;
  std::string payload;
};

struct ResponseFrame {
  uint64_t command_id = 0;
  bool ok = false;
  std::string result;                          ///< ok only.
  NodeError error = NodeError::kCommandFailed;  ///< !ok only.
  std::string message;                         ///< !ok only.
};

struct HeartbeatFrame {
  uint64_t timestamp_us = 0;
};

struct HeartbeatAckFrame {
  uint64_t timestamp_us = 0;
};

struct CloseFrame {
  NodeError reason = NodeError::kConnectionLost;
  std::string reason_text;
};

/// Alternative order matches FrameType - 1.
using Message = std::variant<PairFrame, PairingResponse, CommandFrame,
                             ResponseFrame, HeartbeatFrame, HeartbeatAckFrame,
                             CloseFrame>;

inline FrameType TypeOf(const Message& msg) noexcept {
  return static_cast<FrameType>(msg.index() + 1U);
}

// ============================================================================
// ByteWriter / ByteReader
// ============================================================================

namespace detail {

class ByteWriter {
 public:
  explicit ByteWriter(std::vector<uint8_t>& out) noexcept : out_(out) {}

  void U8(uint8_t v) { out_.push_back(v); }

  void U16(uint16_t v) {
    out_.push_back(static_cast<uint8_t>(v >> 8));
    out_.push_back(static_cast<uint8_t>(v));
  }

  void U32(uint32_t v) {
    for (int32_t shift = 24; shift >= 0; shift -= 8) {
      out_.push_back(static_cast<uint8_t>(v >> shift));
    }
  }

  void U64(uint64_t v) {
    for (int32_t shift = 56; shift >= 0; shift -= 8) {
      out_.push_back(static_cast<uint8_t>(v >> shift));
    }
  }

  /** @return false if the string does not fit a u16 length prefix. */
  bool Str(const std::string& s) {
    if (s.size() > 0xFFFFU) return false;
    U16(static_cast<uint16_t>(s.size()));
    out_.insert(out_.end(), s.begin(), s.end());
    return true;
  }

  bool Blob(const std::string& s) {
    if (s.size() > kMaxFrameBody) return false;
    U32(static_cast<uint32_t>(s.size()));
    out_.insert(out_.end(), s.begin(), s.end());
    return true;
  }

 private:
  std::vector<uint8_t>& out_;
};

class ByteReader {
 public:
  ByteReader(const uint8_t* data, size_t len) noexcept
      : data_(data), len_(len), pos_(0) {}

  bool U8(uint8_t& v) noexcept {
    if (len_ - pos_ < 1) return false;
    v = data_[pos_++];
    return true;
  }

  bool U16(uint16_t& v) noexcept {
    if (len_ - pos_ < 2) return false;
    v = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
    pos_ += 2;
    return true;
  }

  bool U32(uint32_t& v) noexcept {
    if (len_ - pos_ < 4) return false;
    v = 0;
    for (size_t i = 0; i < 4; ++i) v = (v << 8) | data_[pos_ + i];
    pos_ += 4;
    return true;
  }

  bool U64(uint64_t& v) noexcept {
    if (len_ - pos_ < 8) return false;
    v = 0;
    for (size_t i = 0; i < 8; ++i) v = (v << 8) | data_[pos_ + i];
    pos_ += 8;
    return true;
  }

  bool Str(std::string& s) {
    uint16_t n = 0;
    if (!U16(n) || len_ - pos_ < n) return false;
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    s.assign(reinterpret_cast<const char*>(data_ + pos_), n);
    pos_ += n;
    return true;
  }

  bool Blob(std::string& s) {
    uint32_t n = 0;
    if (!U32(n) || len_ - pos_ < n) return false;
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    s.assign(reinterpret_cast<const char*>(data_ + pos_), n);
    pos_ += n;
    return true;
  }

  bool AtEnd() const noexcept { return pos_ == len_; }

 private:
  const uint8_t* data_;
  size_t len_;
  size_t pos_;
};

}  // namespace detail

// ============================================================================
// FrameCodec
// ============================================================================

/**
 * @brief Encodes messages to whole frames and decodes frame headers/bodies.
 */
class FrameCodec {
 public:
  static void EncodeHeader(const FrameHeader& hdr, uint8_t* buf) noexcept {
    buf[0] = static_cast<uint8_t>(hdr.magic >> 24);
    buf[1] = static_cast<uint8_t>(hdr.magic >> 16);
    buf[2] = static_cast<uint8_t>(hdr.magic >> 8);
    buf[3] = static_cast<uint8_t>(hdr.magic);
    buf[4] = hdr.version;
    buf[5] = hdr.type;
    buf[6] = static_cast<uint8_t>(hdr.reserved >> 8);
    buf[7] = static_cast<uint8_t>(hdr.reserved);
    buf[8] = static_cast<uint8_t>(hdr.body_len >> 24);
    buf[9] = static_cast<uint8_t>(hdr.body_len >> 16);
    buf[10] = static_cast<uint8_t>(hdr.body_len >> 8);
    buf[11] = static_cast<uint8_t>(hdr.body_len);
  }

  /**
   * @brief Decode and validate a header.
   * @param buf At least kFrameHeaderSize bytes.
   */
  static expected<FrameHeader, FrameError> DecodeHeader(const uint8_t* buf) noexcept {
    using R = expected<FrameHeader, FrameError>;
    detail::ByteReader r(buf, kFrameHeaderSize);
    FrameHeader hdr;
    static_cast<void>(r.U32(hdr.magic));
    static_cast<void>(r.U8(hdr.version));
    static_cast<void>(r.U8(hdr.type));
    static_cast<void>(r.U16(hdr.reserved));
    static_cast<void>(r.U32(hdr.body_len));
    if (hdr.magic != kFrameMagic) return R::error(FrameError::kBadMagic);
    if (hdr.version != kFrameVersion) return R::error(FrameError::kBadVersion);
    if (hdr.type < static_cast<uint8_t>(FrameType::kPair) ||
        hdr.type > static_cast<uint8_t>(FrameType::kClose)) {
      return R::error(FrameError::kUnknownType);
    }
    if (hdr.body_len > kMaxFrameBody) return R::error(FrameError::kTooLarge);
    return R::success(hdr);
  }

  /** @brief Encode @p msg as one complete frame (header + body). */
  static expected<std::vector<uint8_t>, FrameError> Encode(const Message& msg) {
    using R = expected<std::vector<uint8_t>, FrameError>;
    std::vector<uint8_t> out(kFrameHeaderSize, 0);
    detail::ByteWriter w(out);
    if (!EncodeBody(msg, w)) return R::error(FrameError::kTooLarge);

    const size_t body_len = out.size() - kFrameHeaderSize;
    if (body_len > kMaxFrameBody) return R::error(FrameError::kTooLarge);

    FrameHeader hdr;
    hdr.type = static_cast<uint8_t>(TypeOf(msg));
    hdr.body_len = static_cast<uint32_t>(body_len);
    EncodeHeader(hdr, out.data());
    return R::success(std::move(out));
  }

  /** @brief Decode a body of the given frame type. Must consume it exactly. */
  static expected<Message, FrameError> DecodeBody(FrameType type, const uint8_t* data,
                                                  size_t len) {
    using R = expected<Message, FrameError>;
    detail::ByteReader r(data, len);
    bool ok = false;
    Message msg;

    switch (type) {
      case FrameType::kPair: {
        PairFrame f;
        uint8_t mode = 0;
        uint16_t tag_count = 0;
        ok = r.U8(mode) && mode <= 1 && r.Str(f.credential) &&
             r.Str(f.hello.display_name) && r.Str(f.hello.hostname) &&
             r.Str(f.hello.platform) && r.U16(tag_count);
        for (uint16_t i = 0; ok && i < tag_count; ++i) {
          std::string tag;
          ok = r.Str(tag);
          if (ok) f.hello.capabilities.push_back(std::move(tag));
        }
        f.mode = static_cast<PairMode>(mode);
        msg = std::move(f);
        break;
      }
      case FrameType::kPairingResponse: {
        PairingResponse f;
        uint8_t accepted = 0;
        ok = r.U8(accepted);
        if (ok && accepted != 0) {
          f.accepted = true;
          ok = r.Str(f.node_id) && r.Str(f.session_token);
        } else if (ok) {
          uint8_t reason = 0;
          ok = r.U8(reason) && r.Str(f.reason_text);
          f.reason = NodeErrorFromWire(reason);
        }
        msg = std::move(f);
        break;
      }
      case FrameType::kCommand: {
        CommandFrame f;
        ok = r.U64(f.command_id) && r.U32(f.timeout_ms) && r.Blob(f.payload);
        msg = std::move(f);
        break;
      }
      case FrameType::kResponse: {
        ResponseFrame f;
        uint8_t status = 0;
        ok = r.U64(f.command_id) && r.U8(status);
        if (ok && status != 0) {
          f.ok = true;
          ok = r.Blob(f.result);
        } else if (ok) {
          uint8_t err = 0;
          ok = r.U8(err) && r.Str(f.message);
          f.error = NodeErrorFromWire(err);
        }
        msg = std::move(f);
        break;
      }
      case FrameType::kHeartbeat: {
        HeartbeatFrame f;
        ok = r.U64(f.timestamp_us);
        msg = f;
        break;
      }
      case FrameType::kHeartbeatAck: {
        HeartbeatAckFrame f;
        ok = r.U64(f.timestamp_us);
        msg = f;
        break;
      }
      case FrameType::kClose: {
        CloseFrame f;
        uint8_t reason = 0;
        ok = r.U8(reason) && r.Str(f.reason_text);
        f.reason = NodeErrorFromWire(reason);
        msg = std::move(f);
        break;
      }
      default:
        return R::error(FrameError::kUnknownType);
    }

    if (!ok) return R::error(FrameError::kTruncated);
    if (!r.AtEnd()) return R::error(FrameError::kTrailingBytes);
    return R::success(std::move(msg));
  }

 private:
  static bool EncodeBody(const Message& msg, detail::ByteWriter& w) {
    if (const auto* f = std::get_if<PairFrame>(&msg)) {
      if (f->hello.capabilities.size() > 0xFFFFU) return false;
      w.U8(static_cast<uint8_t>(f->mode));
      bool ok = w.Str(f->credential) && w.Str(f->hello.display_name) &&
                w.Str(f->hello.hostname) && w.Str(f->hello.platform);
      w.U16(static_cast<uint16_t>(f->hello.capabilities.size()));
      for (const auto& tag : f->hello.capabilities) ok = ok && w.Str(tag);
      return ok;
    }
    if (const auto* f = std::get_if<PairingResponse>(&msg)) {
      w.U8(f->accepted ? 1 : 0);
      if (f->accepted) return w.Str(f->node_id) && w.Str(f->session_token);
      w.U8(static_cast<uint8_t>(f->reason));
      return w.Str(f->reason_text);
    }
    if (const auto* f = std::get_if<CommandFrame>(&msg)) {
      w.U64(f->command_id);
      w.U32(f->timeout_ms);
      return w.Blob(f->payload);
    }
    if (const auto* f = std::get_if<ResponseFrame>(&msg)) {
      w.U64(f->command_id);
      w.U8(f->ok ? 1 : 0);
      if (f->ok) return w.Blob(f->result);
      w.U8(static_cast<uint8_t>(f->error));
      return w.Str(f->message);
    }
    if (const auto* f = std::get_if<HeartbeatFrame>(&msg)) {
      w.U64(f->timestamp_us);
      return true;
    }
    if (const auto* f = std::get_if<HeartbeatAckFrame>(&msg)) {
      w.U64(f->timestamp_us);
      return true;
    }
    if (const auto* f = std::get_if<CloseFrame>(&msg)) {
      w.U8(static_cast<uint8_t>(f->reason));
      return w.Str(f->reason_text);
    }
    return false;
  }
};

// ============================================================================
// FrameDecoder
// ============================================================================

/**
 * @brief Incremental decoder fed with arbitrary stream chunks.
 *
 * Once a malformed frame is seen the decoder stays failed; the stream
 * cannot be resynchronised.
 */
class FrameDecoder {
 public:
  void Feed(const uint8_t* data, size_t len) {
    buf_.insert(buf_.end(), data, data + len);
  }

  /**
   * @brief Extract the next complete message.
   * @return true with @p out filled, false if more bytes are needed,
   *         or the FrameError of a malformed frame.
   */
  expected<bool, FrameError> Next(Message& out) {
    using R = expected<bool, FrameError>;
    if (failed_) return R::error(error_);
    if (buf_.size() < kFrameHeaderSize) return R::success(false);

    auto hdr = FrameCodec::DecodeHeader(buf_.data());
    if (!hdr.has_value()) return Fail(hdr.get_error());

    const size_t total = kFrameHeaderSize + hdr.value().body_len;
    if (buf_.size() < total) return R::success(false);

    auto msg = FrameCodec::DecodeBody(static_cast<FrameType>(hdr.value().type),
                                      buf_.data() + kFrameHeaderSize,
                                      hdr.value().body_len);
    if (!msg.has_value()) return Fail(msg.get_error());

    buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(total));
    out = std::move(msg.value());
    return R::success(true);
  }

  size_t Buffered() const noexcept { return buf_.size(); }

  void Reset() noexcept {
    buf_.clear();
    failed_ = false;
  }

 private:
  expected<bool, FrameError> Fail(FrameError e) {
    failed_ = true;
    error_ = e;
    return expected<bool, FrameError>::error(e);
  }

  std::vector<uint8_t> buf_;
  bool failed_ = false;
  FrameError error_ = FrameError::kTruncated;
};

}  // namespace ngw

#endif  // NGW_FRAME_HPP_
