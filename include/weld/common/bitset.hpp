#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace weld::common {

// Fixed-width set of entry-point bits. Two modules land in the same chunk iff
// their bitsets compare equal, so equality and hashing only look at the bits.
class BitSet {
 public:
  BitSet() = default;
  explicit BitSet(uint32_t bit_count) : bytes_((bit_count + 7) / 8, 0) {
  }

  void SetBit(uint32_t bit) {
    bytes_[bit / 8] |= static_cast<uint8_t>(1U << (bit % 8));
  }

  [[nodiscard]] auto HasBit(uint32_t bit) const -> bool {
    return (bytes_[bit / 8] & (1U << (bit % 8))) != 0;
  }

  void Union(const BitSet& other) {
    for (size_t i = 0; i < bytes_.size() && i < other.bytes_.size(); ++i) {
      bytes_[i] |= other.bytes_[i];
    }
  }

  [[nodiscard]] auto IsEmpty() const -> bool {
    for (uint8_t byte : bytes_) {
      if (byte != 0) {
        return false;
      }
    }
    return true;
  }

  [[nodiscard]] auto BitCount() const -> uint32_t {
    return static_cast<uint32_t>(bytes_.size() * 8);
  }

  // Bits rendered lowest first, e.g. "1010" for entries 0 and 2. Only used by
  // dumps and diagnostics.
  [[nodiscard]] auto ToString(uint32_t width) const -> std::string {
    std::string out;
    out.reserve(width);
    for (uint32_t bit = 0; bit < width; ++bit) {
      out += HasBit(bit) ? '1' : '0';
    }
    return out;
  }

  auto operator==(const BitSet&) const -> bool = default;

  template <typename H>
  friend auto AbslHashValue(H h, const BitSet& bits) -> H {
    return H::combine(std::move(h), bits.bytes_);
  }

 private:
  std::vector<uint8_t> bytes_;
};

}  // namespace weld::common
