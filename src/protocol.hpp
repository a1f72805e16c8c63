#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "message.hpp"

// protocol.hpp
inline constexpr uint8_t kProtocolVersion = 1;
inline constexpr std::size_t kChecksumSize = 4;
inline constexpr std::size_t kFrameLengthSize = 4;
inline constexpr uint32_t kMaxFrameSize = 1024 * 1024;
inline constexpr std::size_t kMaxDatagramSize = 64 * 1024;

enum class DatagramType : uint8_t {
  Beacon = 0x42,
  Message = 0x4D
};

enum class DecodeStatus {
  Ok,
  Truncated,
  BadChecksum,
  BadKind,
  BadTarget,
  TooLarge,
  UnknownType,
  VersionMismatch
};

const char* to_string(DecodeStatus status);

struct Beacon {
  uint8_t protocol_version = kProtocolVersion;
  PeerId peer_id{};
  std::string display_name;
  uint16_t tcp_port = 0;
};

using Bytes = std::vector<uint8_t>;

// Message body: id, kind, sender, optional target, timestamp, content.
Bytes encode_message_body(const Message& message);
DecodeStatus decode_message_body(const uint8_t* data, std::size_t size, Message& out);

// TCP frame: [u32 length][body][checksum]; length covers body + checksum.
Bytes encode_frame(const Message& message);
// Validates the checksum of a frame payload (everything after the length
// prefix) and reports the body size.
DecodeStatus unwrap_frame_payload(const uint8_t* data, std::size_t size, std::size_t& body_size);

// UDP datagram: [type][body][checksum].
Bytes encode_beacon_datagram(const Beacon& beacon);
Bytes encode_message_datagram(const Message& message);
DecodeStatus unwrap_datagram(const uint8_t* data, std::size_t size,
                             DatagramType& type,
                             const uint8_t*& body, std::size_t& body_size);

// Unknown trailing fields after tcp_port are ignored. A different protocol
// version reports VersionMismatch with out.protocol_version filled in.
DecodeStatus decode_beacon_body(const uint8_t* data, std::size_t size, Beacon& out);
