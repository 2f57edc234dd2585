#include "domain/uuid.hpp"
#include "domain/errors.hpp"

#include <chrono>
#include <mutex>
#include <random>

namespace ledger {

namespace {

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

const char kHexDigits[] = "0123456789abcdef";

// State shared by all generateV7() callers in the process.
struct V7State {
  std::mutex mutex;
  std::mt19937_64 rng{std::random_device{}()};
  std::uint64_t last_ms = 0;
  std::uint16_t counter = 0;  // 12-bit rand_a, used as a sequence within one millisecond
};

V7State& v7State() {
  static V7State state;
  return state;
}

}  // namespace

Uuid::Uuid() : bytes_{} {}

Uuid::Uuid(const Bytes& bytes) : bytes_(bytes) {}

Uuid Uuid::generateV7() {
  auto& state = v7State();
  std::lock_guard<std::mutex> lock(state.mutex);

  auto now_ms = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());

  if (now_ms > state.last_ms) {
    state.last_ms = now_ms;
    // Start low in the 12-bit space so a burst in one millisecond rarely overflows.
    state.counter = static_cast<std::uint16_t>(state.rng() & 0x3FF);
  } else {
    // Same millisecond or the clock went backwards: keep the last timestamp and count up.
    ++state.counter;
    if (state.counter > 0xFFF) {
      ++state.last_ms;
      state.counter = 0;
    }
  }

  std::uint64_t rand_b = state.rng();

  Bytes b{};
  std::uint64_t ms = state.last_ms;
  for (int i = 5; i >= 0; --i) {
    b[i] = static_cast<std::uint8_t>(ms & 0xFF);
    ms >>= 8;
  }
  b[6] = static_cast<std::uint8_t>(0x70 | ((state.counter >> 8) & 0x0F));
  b[7] = static_cast<std::uint8_t>(state.counter & 0xFF);
  for (int i = 8; i < 16; ++i) {
    b[i] = static_cast<std::uint8_t>(rand_b & 0xFF);
    rand_b >>= 8;
  }
  b[8] = static_cast<std::uint8_t>(0x80 | (b[8] & 0x3F));  // RFC 9562 variant

  return Uuid(b);
}

Uuid Uuid::parse(const std::string& text) {
  if (text.size() != 36 || text[8] != '-' || text[13] != '-' || text[18] != '-' ||
      text[23] != '-') {
    throw LedgerError(ErrorCode::InvalidArgument, "malformed uuid: '" + text + "'");
  }
  std::string hex;
  hex.reserve(32);
  for (char c : text) {
    if (c != '-') hex.push_back(c);
  }
  return fromHex(hex);
}

Uuid Uuid::fromHex(const std::string& hex) {
  if (hex.size() != 32) {
    throw LedgerError(ErrorCode::InvalidArgument, "uuid hex must be 32 digits: '" + hex + "'");
  }
  Bytes b{};
  for (size_t i = 0; i < 16; ++i) {
    int hi = hexValue(hex[2 * i]);
    int lo = hexValue(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      throw LedgerError(ErrorCode::InvalidArgument, "invalid hex digit in uuid: '" + hex + "'");
    }
    b[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return Uuid(b);
}

std::string Uuid::toString() const {
  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < bytes_.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(kHexDigits[bytes_[i] >> 4]);
    out.push_back(kHexDigits[bytes_[i] & 0x0F]);
  }
  return out;
}

std::string Uuid::toHex() const {
  std::string out;
  out.reserve(32);
  for (auto b : bytes_) {
    out.push_back(kHexDigits[b >> 4]);
    out.push_back(kHexDigits[b & 0x0F]);
  }
  return out;
}

bool Uuid::isNil() const {
  for (auto b : bytes_) {
    if (b != 0) return false;
  }
  return true;
}

}  // namespace ledger
