#include "utils.hpp"
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <cstring>
#include <iomanip>
#include <random>
#include <sstream>

std::size_t UidHash::operator()(const Uid& id) const noexcept {
  uint64_t value = 0;
  std::memcpy(&value, id.data(), sizeof(value));
  return static_cast<std::size_t>(value);
}

Uid random_uid(){
  Uid id{};
  if(RAND_bytes(id.data(), static_cast<int>(id.size())) != 1){
    // unseeded CSPRNG
    std::random_device rd;
    for(auto& b : id) b = static_cast<uint8_t>(rd());
  }
  return id;
}

bool is_nil(const Uid& id){
  for(auto b : id) if(b != 0) return false;
  return true;
}

std::string hex_from_bytes(const uint8_t* data, std::size_t size){
  std::ostringstream oss;
  for(std::size_t i = 0; i < size; ++i)
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  return oss.str();
}

std::string to_hex(const Uid& id){
  return hex_from_bytes(id.data(), id.size());
}

std::string short_hex(const Uid& id){
  return hex_from_bytes(id.data(), 4);
}

std::optional<Uid> uid_from_hex(const std::string& hex){
  if(hex.size() != 32) return std::nullopt;
  auto nibble = [](char c) -> int {
    if(c >= '0' && c <= '9') return c - '0';
    if(c >= 'a' && c <= 'f') return c - 'a' + 10;
    if(c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };
  Uid id{};
  for(std::size_t i = 0; i < id.size(); ++i){
    int hi = nibble(hex[2 * i]);
    int lo = nibble(hex[2 * i + 1]);
    if(hi < 0 || lo < 0) return std::nullopt;
    id[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return id;
}

std::vector<unsigned char> sha256_bytes(const uint8_t* data, std::size_t size){
  std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
  SHA256(data, size, out.data());
  return out;
}

std::array<uint8_t, 4> frame_checksum(const uint8_t* data, std::size_t size){
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(data, size, digest);
  return {digest[0], digest[1], digest[2], digest[3]};
}

int64_t epoch_millis_now(){
  return std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
}
