#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>

#include "core/error.hpp"

namespace mr::core {

/// Unsigned 128-bit quantity as two 64-bit words.
struct U128 {
  std::uint64_t hi = 0;
  std::uint64_t lo = 0;

  auto operator<=>(const U128&) const = default;
};

/// Fixed-width 256-bit unsigned integer. Limbs are stored most significant
/// first so the defaulted comparison is numeric ordering.
class WideInteger {
public:
  static constexpr std::size_t kBits = 256;
  static constexpr std::size_t kLimbs = 4;

  WideInteger() = default;

  static auto from_u64(std::uint64_t value) -> WideInteger;
  /// `high` becomes bits 255..128, `low` bits 127..0.
  static auto from_halves(U128 high, U128 low) -> WideInteger;

  auto high() const -> U128;
  auto low() const -> U128;

  auto is_zero() const -> bool;
  /// Bit `index` counted from the least significant bit; false past 255.
  auto bit(std::size_t index) const -> bool;

  /// "0x" followed by minimal lowercase hex digits ("0x0" for zero).
  auto to_hex() const -> std::string;
  auto to_decimal() const -> std::string;
  auto to_bytes_be() const -> std::array<std::uint8_t, 32>;

  auto operator<=>(const WideInteger&) const = default;

private:
  std::array<std::uint64_t, kLimbs> limbs_{};
};

/// Parse a hex numeral with an optional 0x/0X marker into 128 bits.
/// Leading zeros are accepted; the value itself must fit in 128 bits.
/// Fails with ErrorCode::InvalidHexFormat on empty input, any non-hex
/// character, or overflow.
auto parse_hex_u128(std::string_view text) -> Expected<U128>;

/// Build `high * 2^128 + low` from two hex halves. Either half failing to
/// parse fails the whole composition.
auto compose_wide_integer(std::string_view low_hex, std::string_view high_hex)
    -> Expected<WideInteger>;

}  // namespace mr::core

template <>
struct std::formatter<mr::core::WideInteger> : std::formatter<std::string> {
  auto format(const mr::core::WideInteger& v, std::format_context& ctx) const {
    return formatter<std::string>::format(v.to_hex(), ctx);
  }
};
