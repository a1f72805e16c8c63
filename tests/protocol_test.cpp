#include "protocol.hpp"
#include "recording_transport.hpp"
#include "test_runner_utils.hpp"

#include <vector>

using namespace ztalk::test;

namespace {

Message sample_private() {
  Message m;
  m.id = random_uid();
  m.kind = MessageKind::Private;
  m.sender_id = random_uid();
  m.recipient_id = random_uid();
  m.timestamp_ms = 1700000000123;
  m.content = "hello over tcp";
  return m;
}

bool test_frame_round_trip(TestContext&) {
  auto m = sample_private();
  auto frame = encode_frame(m);

  uint32_t length = (uint32_t(frame[0]) << 24) | (uint32_t(frame[1]) << 16) |
                    (uint32_t(frame[2]) << 8) | uint32_t(frame[3]);
  ZTALK_CHECK(length == frame.size() - kFrameLengthSize);

  std::size_t body_size = 0;
  auto status = unwrap_frame_payload(frame.data() + kFrameLengthSize,
                                     frame.size() - kFrameLengthSize, body_size);
  ZTALK_CHECK(status == DecodeStatus::Ok);
  ZTALK_CHECK(body_size == length - kChecksumSize);

  Message decoded;
  ZTALK_CHECK(decode_message_body(frame.data() + kFrameLengthSize, body_size, decoded) == DecodeStatus::Ok);
  ZTALK_CHECK(same_wire_fields(m, decoded));
  ZTALK_CHECK(decoded.recipient_id && *decoded.recipient_id == *m.recipient_id);
  ZTALK_CHECK(!decoded.group_id);
  return true;
}

bool test_corrupted_frame_rejected(TestContext&) {
  auto frame = encode_frame(sample_private());
  frame[kFrameLengthSize + 20] ^= 0x5A;
  std::size_t body_size = 0;
  auto status = unwrap_frame_payload(frame.data() + kFrameLengthSize,
                                     frame.size() - kFrameLengthSize, body_size);
  ZTALK_CHECK(status == DecodeStatus::BadChecksum);

  ZTALK_CHECK(unwrap_frame_payload(frame.data() + kFrameLengthSize, 2, body_size) == DecodeStatus::Truncated);
  ZTALK_CHECK(unwrap_frame_payload(frame.data(), kMaxFrameSize + 1, body_size) == DecodeStatus::TooLarge);
  return true;
}

bool test_truncated_and_bad_bodies(TestContext&) {
  auto body = encode_message_body(sample_private());
  Message out;
  ZTALK_CHECK(decode_message_body(body.data(), body.size() - 3, out) == DecodeStatus::Truncated);
  ZTALK_CHECK(decode_message_body(body.data(), 10, out) == DecodeStatus::Truncated);

  auto bad_kind = body;
  bad_kind[16] = 9;
  ZTALK_CHECK(decode_message_body(bad_kind.data(), bad_kind.size(), out) == DecodeStatus::BadKind);

  auto nil_target = sample_private();
  nil_target.recipient_id = Uid{};
  auto nil_body = encode_message_body(nil_target);
  ZTALK_CHECK(decode_message_body(nil_body.data(), nil_body.size(), out) == DecodeStatus::BadTarget);
  return true;
}

bool test_broadcast_datagram(TestContext&) {
  Message m;
  m.id = random_uid();
  m.kind = MessageKind::Broadcast;
  m.sender_id = random_uid();
  m.timestamp_ms = 42;
  m.content = "to everyone";
  ZTALK_CHECK(m.has_valid_target());

  auto datagram = encode_message_datagram(m);
  ZTALK_CHECK(datagram[0] == static_cast<uint8_t>(DatagramType::Message));
  DatagramType type{};
  const uint8_t* body = nullptr;
  std::size_t body_size = 0;
  ZTALK_CHECK(unwrap_datagram(datagram.data(), datagram.size(), type, body, body_size) == DecodeStatus::Ok);
  ZTALK_CHECK(type == DatagramType::Message);
  Message decoded;
  ZTALK_CHECK(decode_message_body(body, body_size, decoded) == DecodeStatus::Ok);
  ZTALK_CHECK(same_wire_fields(m, decoded));

  datagram[0] = 0x99;
  ZTALK_CHECK(unwrap_datagram(datagram.data(), datagram.size(), type, body, body_size) == DecodeStatus::UnknownType);
  return true;
}

bool test_beacon_trailing_fields_ignored(TestContext&) {
  Beacon b;
  b.peer_id = random_uid();
  b.display_name = "alice-laptop";
  b.tcp_port = 51234;
  auto body = datagram_body(encode_beacon_datagram(b));
  body.push_back(0x01);
  body.push_back(0x02);
  body.push_back(0x03);

  Beacon out;
  ZTALK_CHECK(decode_beacon_body(body.data(), body.size(), out) == DecodeStatus::Ok);
  ZTALK_CHECK(out.peer_id == b.peer_id);
  ZTALK_CHECK(out.display_name == "alice-laptop");
  ZTALK_CHECK(out.tcp_port == 51234);

  body.resize(body.size() - 4);
  ZTALK_CHECK(decode_beacon_body(body.data(), body.size(), out) == DecodeStatus::Truncated);
  return true;
}

bool test_beacon_version_mismatch(TestContext&) {
  Beacon b;
  b.peer_id = random_uid();
  b.display_name = "future";
  b.tcp_port = 1;
  auto body = datagram_body(encode_beacon_datagram(b));
  body[0] = kProtocolVersion + 1;
  Beacon out;
  ZTALK_CHECK(decode_beacon_body(body.data(), body.size(), out) == DecodeStatus::VersionMismatch);
  ZTALK_CHECK(out.protocol_version == kProtocolVersion + 1);
  return true;
}

bool test_uid_hex(TestContext&) {
  auto id = random_uid();
  auto hex = to_hex(id);
  ZTALK_CHECK(hex.size() == 32);
  auto parsed = uid_from_hex(hex);
  ZTALK_CHECK(parsed && *parsed == id);
  ZTALK_CHECK(!uid_from_hex("xyz"));
  ZTALK_CHECK(!uid_from_hex(hex.substr(1)));
  ZTALK_CHECK(is_nil(Uid{}));
  ZTALK_CHECK(!is_nil(id));
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"frame_round_trip", test_frame_round_trip},
    {"corrupted_frame_rejected", test_corrupted_frame_rejected},
    {"truncated_and_bad_bodies", test_truncated_and_bad_bodies},
    {"broadcast_datagram", test_broadcast_datagram},
    {"beacon_trailing_fields_ignored", test_beacon_trailing_fields_ignored},
    {"beacon_version_mismatch", test_beacon_version_mismatch},
    {"uid_hex", test_uid_hex},
  };
  return run_tests("protocol", std::move(tests), argc, argv);
}
