#include "core/wide_integer.hpp"

#include <algorithm>
#include <vector>

#include "common/logging/log.hpp"

namespace mr::core {

namespace {

constexpr std::size_t kMaxHalfDigits = 32;

auto hex_digit_value(char c) -> int {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

auto strip_hex_marker(std::string_view text) -> std::string_view {
  if (text.starts_with("0x") || text.starts_with("0X")) {
    text.remove_prefix(2);
  }
  return text;
}

}  // namespace

auto WideInteger::from_u64(std::uint64_t value) -> WideInteger {
  WideInteger out;
  out.limbs_[3] = value;
  return out;
}

auto WideInteger::from_halves(U128 high, U128 low) -> WideInteger {
  WideInteger out;
  out.limbs_ = {high.hi, high.lo, low.hi, low.lo};
  return out;
}

auto WideInteger::high() const -> U128 {
  return U128{limbs_[0], limbs_[1]};
}

auto WideInteger::low() const -> U128 {
  return U128{limbs_[2], limbs_[3]};
}

auto WideInteger::is_zero() const -> bool {
  return std::ranges::all_of(limbs_, [](std::uint64_t limb) { return limb == 0; });
}

auto WideInteger::bit(std::size_t index) const -> bool {
  if (index >= kBits) {
    return false;
  }
  const auto limb = limbs_[kLimbs - 1 - index / 64];
  return ((limb >> (index % 64)) & 1U) != 0;
}

auto WideInteger::to_hex() const -> std::string {
  std::size_t first = 0;
  while (first < kLimbs && limbs_[first] == 0) {
    ++first;
  }
  if (first == kLimbs) {
    return "0x0";
  }
  std::string out = std::format("0x{:x}", limbs_[first]);
  for (std::size_t i = first + 1; i < kLimbs; ++i) {
    out += std::format("{:016x}", limbs_[i]);
  }
  return out;
}

auto WideInteger::to_decimal() const -> std::string {
  if (is_zero()) {
    return "0";
  }

  // Long division by 10^9 over 32-bit words, most significant first.
  std::array<std::uint32_t, kLimbs * 2> words{};
  for (std::size_t i = 0; i < kLimbs; ++i) {
    words[i * 2] = static_cast<std::uint32_t>(limbs_[i] >> 32);
    words[i * 2 + 1] = static_cast<std::uint32_t>(limbs_[i]);
  }

  constexpr std::uint64_t kChunk = 1000000000ULL;
  std::vector<std::uint32_t> chunks;
  auto nonzero = [&words] {
    return std::ranges::any_of(words, [](std::uint32_t w) { return w != 0; });
  };
  while (nonzero()) {
    std::uint64_t rem = 0;
    for (auto& word : words) {
      const std::uint64_t cur = (rem << 32) | word;
      word = static_cast<std::uint32_t>(cur / kChunk);
      rem = cur % kChunk;
    }
    chunks.push_back(static_cast<std::uint32_t>(rem));
  }

  std::string out = std::format("{}", chunks.back());
  for (auto it = chunks.rbegin() + 1; it != chunks.rend(); ++it) {
    out += std::format("{:09}", *it);
  }
  return out;
}

auto WideInteger::to_bytes_be() const -> std::array<std::uint8_t, 32> {
  std::array<std::uint8_t, 32> out{};
  for (std::size_t i = 0; i < kLimbs; ++i) {
    for (std::size_t b = 0; b < 8; ++b) {
      out[i * 8 + b] = static_cast<std::uint8_t>(limbs_[i] >> (56 - b * 8));
    }
  }
  return out;
}

auto parse_hex_u128(std::string_view text) -> Expected<U128> {
  const auto digits = strip_hex_marker(text);
  if (digits.empty()) {
    return tl::unexpected(make_error(
        ErrorCode::InvalidHexFormat, std::format("no hex digits in '{}'", text)));
  }

  U128 value;
  std::size_t significant = 0;
  for (std::size_t i = 0; i < digits.size(); ++i) {
    const int nibble = hex_digit_value(digits[i]);
    if (nibble < 0) {
      return tl::unexpected(make_error(
          ErrorCode::InvalidHexFormat,
          std::format("invalid hex character at offset {} in '{}'", i, text)));
    }
    if (significant == 0 && nibble == 0) {
      continue;
    }
    if (++significant > kMaxHalfDigits) {
      return tl::unexpected(make_error(
          ErrorCode::InvalidHexFormat,
          std::format("value '{}' is wider than 128 bits", text)));
    }
    value.hi = (value.hi << 4) | (value.lo >> 60);
    value.lo = (value.lo << 4) | static_cast<std::uint64_t>(nibble);
  }
  return value;
}

auto compose_wide_integer(std::string_view low_hex, std::string_view high_hex)
    -> Expected<WideInteger> {
  auto low = parse_hex_u128(low_hex);
  if (!low) {
    log::warn("rejected low half: {}", low.error().message);
    return tl::unexpected(make_error(low.error().code, "low half: " + low.error().message));
  }
  auto high = parse_hex_u128(high_hex);
  if (!high) {
    log::warn("rejected high half: {}", high.error().message);
    return tl::unexpected(make_error(high.error().code, "high half: " + high.error().message));
  }
  return WideInteger::from_halves(*high, *low);
}

}  // namespace mr::core
