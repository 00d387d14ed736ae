// SHA-256 implementation (FIPS 180-4).

#include "core/sha256.h"

namespace symforge {

namespace {

constexpr std::array<uint32_t, 8> kInitialState = {
    0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au,
    0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u};

constexpr std::array<uint32_t, 64> kRoundConstants = {
    0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu, 0x59f111f1u,
    0x923f82a4u, 0xab1c5ed5u, 0xd807aa98u, 0x12835b01u, 0x243185beu, 0x550c7dc3u,
    0x72be5d74u, 0x80deb1feu, 0x9bdc06a7u, 0xc19bf174u, 0xe49b69c1u, 0xefbe4786u,
    0x0fc19dc6u, 0x240ca1ccu, 0x2de92c6fu, 0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau,
    0x983e5152u, 0xa831c66du, 0xb00327c8u, 0xbf597fc7u, 0xc6e00bf3u, 0xd5a79147u,
    0x06ca6351u, 0x14292967u, 0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu, 0x53380d13u,
    0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u, 0xa2bfe8a1u, 0xa81a664bu,
    0xc24b8b70u, 0xc76c51a3u, 0xd192e819u, 0xd6990624u, 0xf40e3585u, 0x106aa070u,
    0x19a4c116u, 0x1e376c08u, 0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au,
    0x5b9cca4fu, 0x682e6ff3u, 0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u,
    0x90befffau, 0xa4506cebu, 0xbef9a3f7u, 0xc67178f2u};

inline uint32_t rotr(uint32_t value, unsigned bits) {
  return (value >> bits) | (value << (32u - bits));
}

}  // namespace

Sha256::Sha256() : state_(kInitialState), buffer_{} {}

void Sha256::update(const uint8_t* data, size_t length) {
  if (data == nullptr || length == 0) return;
  total_bytes_ += length;

  while (length > 0) {
    size_t to_copy = buffer_.size() - buffer_used_;
    if (to_copy > length) to_copy = length;
    for (size_t idx = 0; idx < to_copy; ++idx) {
      buffer_[buffer_used_ + idx] = data[idx];
    }
    buffer_used_ += to_copy;
    data += to_copy;
    length -= to_copy;

    if (buffer_used_ == buffer_.size()) {
      processBlock(buffer_.data());
      buffer_used_ = 0;
    }
  }
}

Sha256Digest Sha256::finish() {
  uint64_t bit_length = total_bytes_ * 8u;

  buffer_[buffer_used_++] = 0x80u;
  if (buffer_used_ > 56) {
    while (buffer_used_ < 64) buffer_[buffer_used_++] = 0;
    processBlock(buffer_.data());
    buffer_used_ = 0;
  }
  while (buffer_used_ < 56) buffer_[buffer_used_++] = 0;

  // Message length in bits, big-endian.
  for (int idx = 0; idx < 8; ++idx) {
    buffer_[63 - idx] = static_cast<uint8_t>(bit_length & 0xFFu);
    bit_length >>= 8;
  }
  processBlock(buffer_.data());
  buffer_used_ = 0;

  Sha256Digest digest{};
  for (size_t idx = 0; idx < state_.size(); ++idx) {
    digest[idx * 4 + 0] = static_cast<uint8_t>(state_[idx] >> 24);
    digest[idx * 4 + 1] = static_cast<uint8_t>(state_[idx] >> 16);
    digest[idx * 4 + 2] = static_cast<uint8_t>(state_[idx] >> 8);
    digest[idx * 4 + 3] = static_cast<uint8_t>(state_[idx]);
  }
  return digest;
}

void Sha256::processBlock(const uint8_t* block) {
  uint32_t words[64];
  for (int idx = 0; idx < 16; ++idx) {
    words[idx] = (static_cast<uint32_t>(block[idx * 4]) << 24) |
                 (static_cast<uint32_t>(block[idx * 4 + 1]) << 16) |
                 (static_cast<uint32_t>(block[idx * 4 + 2]) << 8) |
                 static_cast<uint32_t>(block[idx * 4 + 3]);
  }
  for (int idx = 16; idx < 64; ++idx) {
    uint32_t s0 = rotr(words[idx - 15], 7) ^ rotr(words[idx - 15], 18) ^ (words[idx - 15] >> 3);
    uint32_t s1 = rotr(words[idx - 2], 17) ^ rotr(words[idx - 2], 19) ^ (words[idx - 2] >> 10);
    words[idx] = words[idx - 16] + s0 + words[idx - 7] + s1;
  }

  uint32_t a = state_[0];
  uint32_t b = state_[1];
  uint32_t c = state_[2];
  uint32_t d = state_[3];
  uint32_t e = state_[4];
  uint32_t f = state_[5];
  uint32_t g = state_[6];
  uint32_t h = state_[7];

  for (int idx = 0; idx < 64; ++idx) {
    uint32_t s1 = rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25);
    uint32_t ch = (e & f) ^ ((~e) & g);
    uint32_t temp1 = h + s1 + ch + kRoundConstants[static_cast<size_t>(idx)] + words[idx];
    uint32_t s0 = rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22);
    uint32_t maj = (a & b) ^ (a & c) ^ (b & c);
    uint32_t temp2 = s0 + maj;
    h = g;
    g = f;
    f = e;
    e = d + temp1;
    d = c;
    c = b;
    b = a;
    a = temp1 + temp2;
  }

  state_[0] += a;
  state_[1] += b;
  state_[2] += c;
  state_[3] += d;
  state_[4] += e;
  state_[5] += f;
  state_[6] += g;
  state_[7] += h;
}

std::string digestToHex(const Sha256Digest& digest) {
  static constexpr char kHexDigits[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(digest.size() * 2);
  for (uint8_t byte : digest) {
    hex += kHexDigits[byte >> 4];
    hex += kHexDigits[byte & 0x0Fu];
  }
  return hex;
}

std::string sha256Hex(const uint8_t* data, size_t length) {
  Sha256 hasher;
  hasher.update(data, length);
  return digestToHex(hasher.finish());
}

}  // namespace symforge
