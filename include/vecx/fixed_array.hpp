// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <array>
#include <cassert>
#include <compare>
#include <concepts>
#include <cstddef>
#include <ostream>
#include <ranges>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace vecx {

// Concept for element types with plain numeric semantics.
// bool and the character types are arithmetic but are not numbers.
template <typename T>
concept NumericScalar =
    std::is_arithmetic_v<T> && !std::is_const_v<T> && !std::is_volatile_v<T> &&
    !std::is_same_v<T, bool> && !std::is_same_v<T, char> &&
    !std::is_same_v<T, wchar_t> && !std::is_same_v<T, char8_t> &&
    !std::is_same_v<T, char16_t> && !std::is_same_v<T, char32_t>;

/**
 * A fixed-length array of N numeric elements with value semantics.
 *
 * Arithmetic operators combine two arrays position by position, or an array
 * and a scalar that is broadcast to every position. Comparison is
 * lexicographic: position 0 decides first, and later positions are only
 * consulted while all earlier ones are equal.
 *
 * Integer arithmetic is checked. Signed results that do not fit in T throw
 * std::overflow_error (this covers `+ - *`, negation and `min / -1`), and
 * unsigned results wrap modulo 2^bits. A zero divisor throws
 * std::domain_error.
 * Floating point arithmetic follows IEEE 754 and never throws; `%` on floating
 * point elements is std::fmod.
 *
 * Elements can be read but not written through accessors. The only way to
 * change a fixed_array is to assign a new one or to use a compound assignment
 * operator, which replaces every element with the combined result.
 *
 * @tparam T The element type (integral or floating point)
 * @tparam N The number of elements
 */
template <NumericScalar T, std::size_t N>
class fixed_array {
 public:
  using value_type = T;
  using size_type = std::size_t;
  using storage_type = std::array<T, N>;
  using const_iterator = typename storage_type::const_iterator;
  using iterator = const_iterator;
  using ordering = std::compare_three_way_result_t<T>;

  /**
   * Default constructor - all elements are zero.
   */
  constexpr fixed_array() : elements_{} {}

  /**
   * Constructs from exactly N elements.
   */
  constexpr explicit fixed_array(const storage_type& elements)
      : elements_(elements) {}

  /**
   * Constructs from N element values: fixed_array<int, 3>{1, 2, 3}.
   * Each value is converted to T with static_cast. Explicit for N == 1 so a
   * lone scalar never converts to an array silently.
   */
  template <typename... Args>
    requires(sizeof...(Args) == N && N > 0 &&
             (std::is_arithmetic_v<std::remove_cvref_t<Args>> && ...))
  constexpr explicit(N == 1) fixed_array(Args... values)
      : elements_{static_cast<T>(values)...} {}

  /**
   * Returns an array with every position set to scalar.
   */
  static constexpr fixed_array broadcast(T scalar);

  /**
   * Constructs from a built-in array literal. Equivalent to the storage
   * constructor.
   */
  template <std::size_t M>
    requires(M == N)
  static constexpr fixed_array from_array(const T (&elements)[M]);

  /**
   * Constructs from a range whose length is only known at runtime.
   *
   * @param range Sized range of values convertible to T
   * @return The array holding the converted range elements in order
   * @throws std::length_error if the range does not hold exactly N elements
   */
  template <std::ranges::sized_range R>
    requires std::convertible_to<std::ranges::range_value_t<R>, T>
  static fixed_array from_range(R&& range);

  /**
   * Bounds-checked element read.
   *
   * @throws std::out_of_range if i >= N
   */
  constexpr const T& at(size_type i) const;

  /**
   * Unchecked element read. Precondition: i < N.
   */
  constexpr const T& operator[](size_type i) const {
    assert(i < N && "fixed_array index out of bounds");
    return elements_[i];
  }

  /**
   * Compile-time element read, also used by structured bindings.
   */
  template <std::size_t I>
  constexpr const T& get() const {
    static_assert(I < N, "fixed_array index out of bounds");
    return elements_[I];
  }

  [[nodiscard]] static constexpr size_type size() { return N; }
  [[nodiscard]] static constexpr bool empty() { return N == 0; }

  constexpr const T* data() const { return elements_.data(); }
  constexpr const storage_type& elements() const { return elements_; }

  constexpr const_iterator begin() const { return elements_.begin(); }
  constexpr const_iterator end() const { return elements_.end(); }

  /**
   * Converts every element to U with static_cast.
   * Float to integer conversion truncates toward zero; the value must be
   * representable in U.
   */
  template <NumericScalar U>
  constexpr fixed_array<U, N> cast() const;

  // Compound assignment, elementwise with another array
  fixed_array& operator+=(const fixed_array& rhs);
  fixed_array& operator-=(const fixed_array& rhs);
  fixed_array& operator*=(const fixed_array& rhs);
  fixed_array& operator/=(const fixed_array& rhs);
  fixed_array& operator%=(const fixed_array& rhs);

  // Compound assignment with a scalar broadcast to every position
  fixed_array& operator+=(T rhs);
  fixed_array& operator-=(T rhs);
  fixed_array& operator*=(T rhs);
  fixed_array& operator/=(T rhs);
  fixed_array& operator%=(T rhs);

  fixed_array operator+() const { return *this; }

  /**
   * Elementwise negation. Unsigned elements wrap.
   *
   * @throws std::overflow_error if a signed integer element is its minimum
   */
  fixed_array operator-() const;

  friend fixed_array operator+(fixed_array lhs, const fixed_array& rhs) {
    lhs += rhs;
    return lhs;
  }
  friend fixed_array operator-(fixed_array lhs, const fixed_array& rhs) {
    lhs -= rhs;
    return lhs;
  }
  friend fixed_array operator*(fixed_array lhs, const fixed_array& rhs) {
    lhs *= rhs;
    return lhs;
  }
  friend fixed_array operator/(fixed_array lhs, const fixed_array& rhs) {
    lhs /= rhs;
    return lhs;
  }
  friend fixed_array operator%(fixed_array lhs, const fixed_array& rhs) {
    lhs %= rhs;
    return lhs;
  }

  friend fixed_array operator+(fixed_array lhs, T rhs) {
    lhs += rhs;
    return lhs;
  }
  friend fixed_array operator-(fixed_array lhs, T rhs) {
    lhs -= rhs;
    return lhs;
  }
  friend fixed_array operator*(fixed_array lhs, T rhs) {
    lhs *= rhs;
    return lhs;
  }
  friend fixed_array operator/(fixed_array lhs, T rhs) {
    lhs /= rhs;
    return lhs;
  }
  friend fixed_array operator%(fixed_array lhs, T rhs) {
    lhs %= rhs;
    return lhs;
  }

  // Scalar on the left: the scalar is broadcast, then combined
  friend fixed_array operator+(T lhs, const fixed_array& rhs) {
    return broadcast(lhs) + rhs;
  }
  friend fixed_array operator-(T lhs, const fixed_array& rhs) {
    return broadcast(lhs) - rhs;
  }
  friend fixed_array operator*(T lhs, const fixed_array& rhs) {
    return broadcast(lhs) * rhs;
  }
  friend fixed_array operator/(T lhs, const fixed_array& rhs) {
    return broadcast(lhs) / rhs;
  }
  friend fixed_array operator%(T lhs, const fixed_array& rhs) {
    return broadcast(lhs) % rhs;
  }

  /**
   * True iff every position compares equal under T's operator==.
   * For floating point this means -0.0 == +0.0 and NaN != NaN.
   */
  friend constexpr bool operator==(const fixed_array& lhs,
                                   const fixed_array& rhs) {
    for (size_type i = 0; i < N; ++i) {
      if (!(lhs.elements_[i] == rhs.elements_[i])) {
        return false;
      }
    }
    return true;
  }

  /**
   * Lexicographic three-way comparison. The first position whose elements
   * differ decides; a NaN at that position yields unordered.
   */
  friend constexpr ordering operator<=>(const fixed_array& lhs,
                                        const fixed_array& rhs) {
    for (size_type i = 0; i < N; ++i) {
      ordering cmp = lhs.elements_[i] <=> rhs.elements_[i];
      if (cmp != 0) {
        return cmp;
      }
    }
    return ordering::equivalent;
  }

 private:
  template <typename Op>
  void apply(const fixed_array& rhs, Op op);

  template <typename Op>
  void apply_integer(const fixed_array& rhs, Op op,
                     std::string_view operation);

  // Throws if any dividend/divisor pair would trap in integer division
  static void check_division(const storage_type& dividends,
                             const storage_type& divisors);

  storage_type elements_;
};

/**
 * Writes the array as "[a, b, c]". 8-bit elements are written as numbers.
 */
template <NumericScalar T, std::size_t N>
std::ostream& operator<<(std::ostream& os, const fixed_array<T, N>& array);

}  // namespace vecx

template <vecx::NumericScalar T, std::size_t N>
struct std::tuple_size<vecx::fixed_array<T, N>>
    : std::integral_constant<std::size_t, N> {};

template <std::size_t I, vecx::NumericScalar T, std::size_t N>
struct std::tuple_element<I, vecx::fixed_array<T, N>> {
  using type = const T;
};

// Include implementation
#include "fixed_array.ipp"
