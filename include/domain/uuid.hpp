#ifndef UUID_HPP_
#define UUID_HPP_

#include <array>
#include <cstdint>
#include <functional>
#include <string>

namespace ledger {

/**
 * 128-bit identifier used for accounts and journal entries.
 * Ordering compares the raw bytes, which for UUIDv7 values is creation order.
 */
class Uuid {
 public:
  using Bytes = std::array<std::uint8_t, 16>;

  Uuid();
  explicit Uuid(const Bytes& bytes);

  /**
   * Generates a time-ordered UUIDv7. Values generated by one process are strictly increasing.
   */
  static Uuid generateV7();

  /**
   * Parses the canonical 8-4-4-4-12 form (either case). Throws InvalidArgument on bad input.
   */
  static Uuid parse(const std::string& text);

  /**
   * Parses 32 hex digits without dashes, the form used by the database layer.
   */
  static Uuid fromHex(const std::string& hex);

  // Canonical lowercase 8-4-4-4-12 form.
  std::string toString() const;
  std::string toHex() const;

  const Bytes& bytes() const { return bytes_; }
  bool isNil() const;
  int version() const { return bytes_[6] >> 4; }

  bool operator==(const Uuid& other) const { return bytes_ == other.bytes_; }
  bool operator!=(const Uuid& other) const { return bytes_ != other.bytes_; }
  bool operator<(const Uuid& other) const { return bytes_ < other.bytes_; }
  bool operator>(const Uuid& other) const { return other.bytes_ < bytes_; }

 private:
  Bytes bytes_;
};

}  // namespace ledger

namespace std {

template <>
struct hash<ledger::Uuid> {
  size_t operator()(const ledger::Uuid& id) const noexcept {
    // FNV-1a over the raw bytes
    size_t h = 14695981039346656037ULL;
    for (auto b : id.bytes()) {
      h ^= b;
      h *= 1099511628211ULL;
    }
    return h;
  }
};

}  // namespace std

#endif  // UUID_HPP_
