#include "big_nat.hpp"
#include <algorithm>

namespace dhall {

  static constexpr uint32_t kBase = 1000000000u; // 1e9

  BigNat::BigNat(uint64_t v) {
    while (v != 0) {
      limbs_.push_back((uint32_t)(v % kBase));
      v /= kBase;
    }
  }

  void BigNat::normalize() {
    while (!limbs_.empty() && limbs_.back() == 0)
      limbs_.pop_back();
  }

  void BigNat::mul_add(uint32_t mul, uint32_t add) {
    uint64_t carry = add;
    for (auto &limb : limbs_) {
      uint64_t x = (uint64_t)limb * mul + carry;
      limb       = (uint32_t)(x % kBase);
      carry      = x / kBase;
    }
    if (carry)
      limbs_.push_back((uint32_t)carry);
  }

  bool BigNat::parse_dec(std::string_view text, BigNat &out) {
    out = BigNat{};
    if (text.empty())
      return false;

    // consume 9 digits at a time; the last chunk may be shorter
    std::size_t i = 0;
    while (i < text.size()) {
      std::size_t n = std::min<std::size_t>(9, text.size() - i);
      uint32_t chunk = 0;
      uint32_t scale = 1;
      for (std::size_t k = 0; k < n; ++k) {
        char c = text[i + k];
        if (c < '0' || c > '9') {
          out = BigNat{};
          return false;
        }
        chunk = chunk * 10 + (uint32_t)(c - '0');
        scale *= 10;
      }
      out.mul_add(scale, chunk);
      i += n;
    }
    out.normalize();
    return true;
  }

  int BigNat::compare(const BigNat &rhs) const {
    if (limbs_.size() != rhs.limbs_.size())
      return limbs_.size() < rhs.limbs_.size() ? -1 : 1;
    for (std::size_t i = limbs_.size(); i-- > 0;) {
      if (limbs_[i] != rhs.limbs_[i])
        return limbs_[i] < rhs.limbs_[i] ? -1 : 1;
    }
    return 0;
  }

  std::string BigNat::to_string() const {
    if (is_zero())
      return "0";

    // most significant limb unpadded, the rest zero-padded to 9 digits
    std::string s = std::to_string(limbs_.back());
    for (std::size_t i = limbs_.size() - 1; i-- > 0;) {
      std::string part = std::to_string(limbs_[i]);
      s.append(9 - part.size(), '0');
      s += part;
    }
    return s;
  }

  bool BigNat::fits_u64() const {
    static const BigNat kMax(UINT64_MAX);
    return compare(kMax) <= 0;
  }

  uint64_t BigNat::to_u64() const {
    uint64_t v = 0;
    for (std::size_t i = limbs_.size(); i-- > 0;)
      v = v * kBase + limbs_[i];
    return v;
  }

} // namespace dhall
