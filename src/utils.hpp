#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

// 16-byte identifier used for peers, messages and groups.
using Uid = std::array<uint8_t, 16>;
using PeerId = Uid;
using MessageId = Uid;
using GroupId = Uid;

struct UidHash {
  std::size_t operator()(const Uid& id) const noexcept;
};

Uid random_uid();
bool is_nil(const Uid& id);
std::string to_hex(const Uid& id);
std::string short_hex(const Uid& id);
std::optional<Uid> uid_from_hex(const std::string& hex);

std::string hex_from_bytes(const uint8_t* data, std::size_t size);
std::vector<unsigned char> sha256_bytes(const uint8_t* data, std::size_t size);

// First four bytes of SHA-256 over the payload, used as frame checksum.
std::array<uint8_t, 4> frame_checksum(const uint8_t* data, std::size_t size);

int64_t epoch_millis_now();
