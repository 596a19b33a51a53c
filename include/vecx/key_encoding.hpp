// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <type_traits>

#include "fixed_array.hpp"

namespace vecx {

/**
 * @brief Encoding of fixed_array contents into sortable byte keys.
 *
 * Every element is transformed into a big-endian byte string where
 * lexicographic byte comparison produces the same ordering as the element
 * type's comparison operator. Concatenating the element encodings gives a key
 * for the whole array whose byte order is the lexicographic order of
 * fixed_array.
 *
 * The element transformation is a bijection on bit patterns. encode_key
 * first canonicalizes -0.0 to +0.0, so two arrays have the same key iff their
 * elements compare equal, or are NaNs with identical bit patterns:
 * - -0.0 and +0.0 produce the same key
 * - a NaN matches a NaN with the same bit pattern, and nothing else
 *
 * Example:
 * @code
 * auto key = encode_key(fixed_array<float, 2>{1.0f, -2.0f});
 * // key.size() == 8
 * @endcode
 */

// Concept for element types the key encoding supports
template <typename T>
concept KeyEncodable =
    NumericScalar<T> &&
    (sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4 || sizeof(T) == 8) &&
    (std::is_integral_v<T> || std::numeric_limits<T>::is_iec559);

namespace detail {

template <std::size_t Size>
struct unsigned_bits;

template <>
struct unsigned_bits<1> {
  using type = std::uint8_t;
};
template <>
struct unsigned_bits<2> {
  using type = std::uint16_t;
};
template <>
struct unsigned_bits<4> {
  using type = std::uint32_t;
};
template <>
struct unsigned_bits<8> {
  using type = std::uint64_t;
};

template <typename T>
using bits_t = typename unsigned_bits<sizeof(T)>::type;

template <typename T>
constexpr bits_t<T> sign_bit() {
  return static_cast<bits_t<T>>(bits_t<T>{1} << (sizeof(T) * 8 - 1));
}

}  // namespace detail

// Byte key for a whole fixed_array
template <KeyEncodable T, std::size_t N>
using content_key = std::array<std::byte, N * sizeof(T)>;

// ============================================================================
// Element Encoding
// ============================================================================

/**
 * @brief Encode one element to a sortable byte array.
 *
 * - Unsigned integers: big-endian bytes, unchanged
 * - Signed integers: sign bit flipped, so negatives sort first
 * - Floating point: negative values flip every bit, non-negative values flip
 *   only the sign bit
 *
 * @param value The element to encode
 * @return Big-endian byte array representation
 */
template <KeyEncodable T>
constexpr std::array<std::byte, sizeof(T)> encode_element(T value) {
  using Bits = detail::bits_t<T>;
  constexpr Bits kSignBit = detail::sign_bit<T>();

  Bits bits = std::bit_cast<Bits>(value);
  if constexpr (std::is_floating_point_v<T>) {
    bits ^= (bits & kSignBit) ? static_cast<Bits>(~Bits{0}) : kSignBit;
  } else if constexpr (std::is_signed_v<T>) {
    bits ^= kSignBit;
  }

  std::array<std::byte, sizeof(T)> result{};
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    result[i] =
        static_cast<std::byte>((bits >> ((sizeof(T) - 1 - i) * 8)) & 0xFF);
  }
  return result;
}

/**
 * @brief Decode a byte array produced by encode_element.
 */
template <KeyEncodable T>
constexpr T decode_element(const std::array<std::byte, sizeof(T)>& encoded) {
  using Bits = detail::bits_t<T>;
  constexpr Bits kSignBit = detail::sign_bit<T>();

  Bits bits = 0;
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    bits = static_cast<Bits>(
        (static_cast<std::uint64_t>(bits) << 8) |
        std::to_integer<std::uint64_t>(encoded[i]));
  }

  // Undo the transformation
  if constexpr (std::is_floating_point_v<T>) {
    bits ^= (bits & kSignBit) ? kSignBit : static_cast<Bits>(~Bits{0});
  } else if constexpr (std::is_signed_v<T>) {
    bits ^= kSignBit;
  }
  return std::bit_cast<T>(bits);
}

// ============================================================================
// Array Encoding
// ============================================================================

/**
 * @brief Encode a fixed_array to its content key.
 *
 * Negative zero is encoded as positive zero, so equal arrays always share a
 * key. Byte-lexicographic order of keys matches the lexicographic order of
 * the arrays for all non-NaN contents.
 */
template <KeyEncodable T, std::size_t N>
constexpr content_key<T, N> encode_key(const fixed_array<T, N>& array) {
  content_key<T, N> key{};
  for (std::size_t i = 0; i < N; ++i) {
    T value = array[i];
    if constexpr (std::is_floating_point_v<T>) {
      if (value == T{0}) {
        value = T{0};
      }
    }
    const auto element = encode_element(value);
    for (std::size_t b = 0; b < sizeof(T); ++b) {
      key[i * sizeof(T) + b] = element[b];
    }
  }
  return key;
}

/**
 * @brief Decode a content key back to the fixed_array it was built from.
 * Zeros decode as +0.0.
 */
template <KeyEncodable T, std::size_t N>
constexpr fixed_array<T, N> decode_key(const content_key<T, N>& key) {
  std::array<T, N> elements{};
  for (std::size_t i = 0; i < N; ++i) {
    std::array<std::byte, sizeof(T)> element{};
    for (std::size_t b = 0; b < sizeof(T); ++b) {
      element[b] = key[i * sizeof(T) + b];
    }
    elements[i] = decode_element<T>(element);
  }
  return fixed_array<T, N>(elements);
}

}  // namespace vecx
