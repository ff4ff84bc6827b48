#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace dhall {

  // Unbounded non-negative integer for numeric literals.
  // Base 1e9 limbs, little-endian, no trailing zero limbs (zero == empty).
  class BigNat {
  public:
    BigNat() = default;
    explicit BigNat(uint64_t v);

    bool is_zero() const {
      return limbs_.empty();
    }

    // Parse decimal: [0-9]+
    // Returns false on empty input or any non-digit byte.
    static bool parse_dec(std::string_view text, BigNat &out);

    // -1, 0, 1
    int compare(const BigNat &rhs) const;

    std::string to_string() const;

    bool fits_u64() const;
    // Only meaningful when fits_u64().
    uint64_t to_u64() const;

    friend bool operator==(const BigNat &a, const BigNat &b) {
      return a.limbs_ == b.limbs_;
    }
    friend bool operator!=(const BigNat &a, const BigNat &b) {
      return !(a == b);
    }
    friend bool operator<(const BigNat &a, const BigNat &b) {
      return a.compare(b) < 0;
    }

  private:
    void normalize();
    void mul_add(uint32_t mul, uint32_t add);

    std::vector<uint32_t> limbs_;
  };

} // namespace dhall
