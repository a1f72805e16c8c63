#include "protocol.hpp"

#include <algorithm>
#include <cstring>

namespace {

class ByteWriter {
public:
  explicit ByteWriter(Bytes& out) : out_(out) {}

  void u8(uint8_t v) { out_.push_back(v); }
  void u16(uint16_t v) {
    out_.push_back(static_cast<uint8_t>(v >> 8));
    out_.push_back(static_cast<uint8_t>(v));
  }
  void u32(uint32_t v) {
    for(int shift = 24; shift >= 0; shift -= 8) out_.push_back(static_cast<uint8_t>(v >> shift));
  }
  void i64(int64_t v) {
    auto u = static_cast<uint64_t>(v);
    for(int shift = 56; shift >= 0; shift -= 8) out_.push_back(static_cast<uint8_t>(u >> shift));
  }
  void uid(const Uid& id) { out_.insert(out_.end(), id.begin(), id.end()); }
  void raw(const void* data, std::size_t size) {
    auto p = static_cast<const uint8_t*>(data);
    out_.insert(out_.end(), p, p + size);
  }

private:
  Bytes& out_;
};

class ByteReader {
public:
  ByteReader(const uint8_t* data, std::size_t size) : data_(data), size_(size) {}

  std::size_t remaining() const { return size_ - pos_; }

  bool u8(uint8_t& v) {
    if(remaining() < 1) return false;
    v = data_[pos_++];
    return true;
  }
  bool u16(uint16_t& v) {
    if(remaining() < 2) return false;
    v = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
    pos_ += 2;
    return true;
  }
  bool u32(uint32_t& v) {
    if(remaining() < 4) return false;
    v = 0;
    for(int i = 0; i < 4; ++i) v = (v << 8) | data_[pos_++];
    return true;
  }
  bool i64(int64_t& v) {
    if(remaining() < 8) return false;
    uint64_t u = 0;
    for(int i = 0; i < 8; ++i) u = (u << 8) | data_[pos_++];
    v = static_cast<int64_t>(u);
    return true;
  }
  bool uid(Uid& id) {
    if(remaining() < id.size()) return false;
    std::memcpy(id.data(), data_ + pos_, id.size());
    pos_ += id.size();
    return true;
  }
  bool str(std::string& s, std::size_t len) {
    if(remaining() < len) return false;
    s.assign(reinterpret_cast<const char*>(data_ + pos_), len);
    pos_ += len;
    return true;
  }

private:
  const uint8_t* data_;
  std::size_t size_;
  std::size_t pos_ = 0;
};

void append_checksum(Bytes& out, std::size_t from) {
  auto sum = frame_checksum(out.data() + from, out.size() - from);
  out.insert(out.end(), sum.begin(), sum.end());
}

bool checksum_matches(const uint8_t* data, std::size_t body_size) {
  auto expected = frame_checksum(data, body_size);
  return std::memcmp(expected.data(), data + body_size, kChecksumSize) == 0;
}

} // namespace

const char* to_string(DecodeStatus status) {
  switch(status) {
    case DecodeStatus::Ok: return "ok";
    case DecodeStatus::Truncated: return "truncated";
    case DecodeStatus::BadChecksum: return "bad checksum";
    case DecodeStatus::BadKind: return "bad kind";
    case DecodeStatus::BadTarget: return "bad target";
    case DecodeStatus::TooLarge: return "too large";
    case DecodeStatus::UnknownType: return "unknown datagram type";
    case DecodeStatus::VersionMismatch: return "protocol version mismatch";
  }
  return "unknown";
}

Bytes encode_message_body(const Message& message) {
  Bytes out;
  out.reserve(64 + message.content.size());
  ByteWriter w(out);
  w.uid(message.id);
  w.u8(static_cast<uint8_t>(message.kind));
  w.uid(message.sender_id);
  if(kind_has_target(message.kind)) {
    w.uid(message.target().value_or(Uid{}));
  }
  w.i64(message.timestamp_ms);
  w.u32(static_cast<uint32_t>(message.content.size()));
  w.raw(message.content.data(), message.content.size());
  return out;
}

DecodeStatus decode_message_body(const uint8_t* data, std::size_t size, Message& out) {
  ByteReader r(data, size);
  Message m;
  uint8_t raw_kind = 0;
  if(!r.uid(m.id) || !r.u8(raw_kind)) return DecodeStatus::Truncated;
  if(!is_valid_kind(raw_kind)) return DecodeStatus::BadKind;
  m.kind = static_cast<MessageKind>(raw_kind);
  if(!r.uid(m.sender_id)) return DecodeStatus::Truncated;
  if(kind_has_target(m.kind)) {
    Uid target{};
    if(!r.uid(target)) return DecodeStatus::Truncated;
    if(is_nil(target)) return DecodeStatus::BadTarget;
    if(m.kind == MessageKind::Private) m.recipient_id = target;
    else m.group_id = target;
  }
  uint32_t content_len = 0;
  if(!r.i64(m.timestamp_ms) || !r.u32(content_len)) return DecodeStatus::Truncated;
  if(content_len > kMaxFrameSize) return DecodeStatus::TooLarge;
  if(!r.str(m.content, content_len)) return DecodeStatus::Truncated;
  out = std::move(m);
  return DecodeStatus::Ok;
}

Bytes encode_frame(const Message& message) {
  auto body = encode_message_body(message);
  Bytes out;
  out.reserve(kFrameLengthSize + body.size() + kChecksumSize);
  ByteWriter w(out);
  w.u32(static_cast<uint32_t>(body.size() + kChecksumSize));
  w.raw(body.data(), body.size());
  append_checksum(out, kFrameLengthSize);
  return out;
}

DecodeStatus unwrap_frame_payload(const uint8_t* data, std::size_t size, std::size_t& body_size) {
  if(size > kMaxFrameSize) return DecodeStatus::TooLarge;
  if(size < kChecksumSize) return DecodeStatus::Truncated;
  body_size = size - kChecksumSize;
  if(!checksum_matches(data, body_size)) return DecodeStatus::BadChecksum;
  return DecodeStatus::Ok;
}

Bytes encode_beacon_datagram(const Beacon& beacon) {
  Bytes out;
  ByteWriter w(out);
  w.u8(static_cast<uint8_t>(DatagramType::Beacon));
  w.u8(beacon.protocol_version);
  w.uid(beacon.peer_id);
  auto name_len = std::min<std::size_t>(beacon.display_name.size(), 0xFFFF);
  w.u16(static_cast<uint16_t>(name_len));
  w.raw(beacon.display_name.data(), name_len);
  w.u16(beacon.tcp_port);
  append_checksum(out, 1);
  return out;
}

Bytes encode_message_datagram(const Message& message) {
  auto body = encode_message_body(message);
  Bytes out;
  out.reserve(1 + body.size() + kChecksumSize);
  out.push_back(static_cast<uint8_t>(DatagramType::Message));
  out.insert(out.end(), body.begin(), body.end());
  append_checksum(out, 1);
  return out;
}

DecodeStatus unwrap_datagram(const uint8_t* data, std::size_t size,
                             DatagramType& type,
                             const uint8_t*& body, std::size_t& body_size) {
  if(size < 1 + kChecksumSize) return DecodeStatus::Truncated;
  auto raw_type = data[0];
  if(raw_type != static_cast<uint8_t>(DatagramType::Beacon) &&
     raw_type != static_cast<uint8_t>(DatagramType::Message)) {
    return DecodeStatus::UnknownType;
  }
  body = data + 1;
  body_size = size - 1 - kChecksumSize;
  if(!checksum_matches(body, body_size)) return DecodeStatus::BadChecksum;
  type = static_cast<DatagramType>(raw_type);
  return DecodeStatus::Ok;
}

DecodeStatus decode_beacon_body(const uint8_t* data, std::size_t size, Beacon& out) {
  ByteReader r(data, size);
  Beacon b;
  if(!r.u8(b.protocol_version)) return DecodeStatus::Truncated;
  if(b.protocol_version != kProtocolVersion) {
    out.protocol_version = b.protocol_version;
    return DecodeStatus::VersionMismatch;
  }
  uint16_t name_len = 0;
  if(!r.uid(b.peer_id) || !r.u16(name_len)) return DecodeStatus::Truncated;
  if(!r.str(b.display_name, name_len)) return DecodeStatus::Truncated;
  if(!r.u16(b.tcp_port)) return DecodeStatus::Truncated;
  // anything left belongs to a newer minor revision
  out = std::move(b);
  return DecodeStatus::Ok;
}
