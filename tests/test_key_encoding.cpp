// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <algorithm>
#include <bit>
#include <catch2/catch_template_test_macros.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <cstdint>
#include <limits>
#include <vecx/key_encoding.hpp>
#include <vector>

using namespace vecx;

static_assert(KeyEncodable<std::uint8_t> && KeyEncodable<std::int64_t>);
static_assert(KeyEncodable<float> && KeyEncodable<double>);
static_assert(std::tuple_size_v<content_key<std::uint16_t, 3>> == 6);
static_assert(encode_element(std::uint32_t{0x01020304})[0] == std::byte{0x01});
static_assert(encode_element(std::int8_t{-128})[0] == std::byte{0x00});
static_assert(encode_element(std::int8_t{0})[0] == std::byte{0x80});

// ============================================================================
// Element Encoding Tests
// ============================================================================

TEMPLATE_TEST_CASE("encode_element round-trip for integers",
                   "[key_encoding]", std::int8_t, std::uint8_t, std::int16_t,
                   std::uint16_t, std::int32_t, std::uint32_t, std::int64_t,
                   std::uint64_t) {
  using limits = std::numeric_limits<TestType>;
  std::vector<TestType> test_values = {
      limits::min(), static_cast<TestType>(limits::min() + 1),
      TestType{0},   TestType{1},
      TestType{42},  static_cast<TestType>(limits::max() - 1),
      limits::max(),
  };

  for (TestType value : test_values) {
    REQUIRE(decode_element<TestType>(encode_element(value)) == value);
  }
}

TEMPLATE_TEST_CASE("encode_element preserves integer ordering",
                   "[key_encoding]", std::int8_t, std::int16_t, std::int32_t,
                   std::int64_t) {
  using limits = std::numeric_limits<TestType>;
  std::vector<TestType> sorted_values = {
      limits::min(), static_cast<TestType>(limits::min() / 2), TestType{0},
      TestType{1},   static_cast<TestType>(limits::max() / 2), limits::max(),
  };

  for (std::size_t i = 1; i < sorted_values.size(); ++i) {
    REQUIRE(encode_element(sorted_values[i - 1]) <
            encode_element(sorted_values[i]));
  }
}

TEMPLATE_TEST_CASE("encode_element preserves floating point ordering",
                   "[key_encoding]", float, double) {
  using limits = std::numeric_limits<TestType>;
  std::vector<TestType> sorted_values = {
      -limits::infinity(), limits::lowest(),   TestType{-1000},
      TestType{-1},        -limits::min(),     -limits::denorm_min(),
      TestType{-0.0},      TestType{0.0},      limits::denorm_min(),
      limits::min(),       TestType{1},        TestType{1000},
      limits::max(),       limits::infinity(),
  };

  for (std::size_t i = 1; i < sorted_values.size(); ++i) {
    REQUIRE(encode_element(sorted_values[i - 1]) <
            encode_element(sorted_values[i]));
  }
}

TEMPLATE_TEST_CASE("encode_element round-trip is bit exact for floats",
                   "[key_encoding]", float, double) {
  using limits = std::numeric_limits<TestType>;
  std::vector<TestType> test_values = {
      -limits::infinity(), limits::lowest(), TestType{-1.5}, TestType{-0.0},
      TestType{0.0},       limits::min(),    TestType{3.25}, limits::max(),
      limits::infinity(),  limits::quiet_NaN(),
  };

  for (TestType value : test_values) {
    TestType decoded = decode_element<TestType>(encode_element(value));
    // Compare bit patterns so -0.0 and NaN are checked exactly
    REQUIRE(std::bit_cast<detail::bits_t<TestType>>(decoded) ==
            std::bit_cast<detail::bits_t<TestType>>(value));
  }
}

TEST_CASE("encode_element distinguishes bit patterns", "[key_encoding]") {
  SECTION("Signed zeros encode differently") {
    REQUIRE(encode_element(0.0) != encode_element(-0.0));
    REQUIRE(encode_element(0.0f) != encode_element(-0.0f));
  }

  SECTION("Identical NaNs encode identically") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    REQUIRE(encode_element(nan) == encode_element(nan));
  }

  SECTION("NaNs with different payloads encode differently") {
    const double quiet = std::numeric_limits<double>::quiet_NaN();
    const double payload = std::bit_cast<double>(
        std::bit_cast<std::uint64_t>(quiet) | std::uint64_t{1});
    REQUIRE(std::isnan(payload));
    REQUIRE(encode_element(quiet) != encode_element(payload));
  }
}

// ============================================================================
// Array Encoding Tests
// ============================================================================

TEST_CASE("encode_key concatenates element encodings", "[key_encoding]") {
  fixed_array<std::int16_t, 2> a{-1, 258};
  auto key = encode_key(a);

  REQUIRE(key.size() == 4);
  // -1 with the sign bit flipped is 0x7FFF
  REQUIRE(key[0] == std::byte{0x7F});
  REQUIRE(key[1] == std::byte{0xFF});
  // 258 with the sign bit flipped is 0x8102
  REQUIRE(key[2] == std::byte{0x81});
  REQUIRE(key[3] == std::byte{0x02});

  REQUIRE(decode_key<std::int16_t, 2>(key) == a);
}

TEST_CASE("encode_key ordering matches fixed_array ordering",
          "[key_encoding]") {
  using vec3 = fixed_array<std::int32_t, 3>;
  std::vector<vec3> values = {
      {1, 2, 3}, {1, 2, 2},   {4, 5, 6}, {-7, 100, 0},
      {0, 0, 0}, {1, -2, 99}, {1, 2, 3}, {-7, -100, 5},
  };

  std::vector<vec3> by_array = values;
  std::sort(by_array.begin(), by_array.end());

  std::vector<vec3> by_key = values;
  std::sort(by_key.begin(), by_key.end(), [](const vec3& x, const vec3& y) {
    return encode_key(x) < encode_key(y);
  });

  REQUIRE(by_array == by_key);
  for (const auto& x : values) {
    for (const auto& y : values) {
      REQUIRE((x == y) == (encode_key(x) == encode_key(y)));
    }
  }
}

TEST_CASE("decode_key restores floating point arrays", "[key_encoding]") {
  fixed_array<float, 3> a{-0.0f, 1.5f, -std::numeric_limits<float>::infinity()};
  auto decoded = decode_key<float, 3>(encode_key(a));

  REQUIRE(encode_key(decoded) == encode_key(a));
  REQUIRE(decoded[0] == 0.0f);
  REQUIRE_FALSE(std::signbit(decoded[0]));
  REQUIRE(decoded[1] == 1.5f);
  REQUIRE(std::isinf(decoded[2]));
}

TEST_CASE("encode_key treats signed zeros as equal", "[key_encoding]") {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  fixed_array<double, 2> positive{0.0, 1.0};
  fixed_array<double, 2> negative{-0.0, 1.0};

  REQUIRE(positive == negative);
  REQUIRE(encode_key(positive) == encode_key(negative));
  REQUIRE(encode_key(fixed_array<float, 1>{-0.0f}) ==
          encode_key(fixed_array<float, 1>{0.0f}));

  // Zero still sorts between the negative and positive values
  REQUIRE(encode_key(fixed_array<double, 2>{-1e-300, 1.0}) <
          encode_key(negative));
  REQUIRE(encode_key(negative) <
          encode_key(fixed_array<double, 2>{1e-300, 1.0}));

  // NaN keys still follow the bit pattern
  REQUIRE(encode_key(fixed_array<double, 1>{nan}) ==
          encode_key(fixed_array<double, 1>{nan}));
}
