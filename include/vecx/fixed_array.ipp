// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

// fixed_array.ipp - Implementation details for fixed_array
// This file is included at the end of fixed_array.hpp
// DO NOT include this file directly

#include <cmath>
#include <format>
#include <limits>
#include <stdexcept>
#include <string_view>

namespace vecx {

// ============================================================================
// Construction
// ============================================================================

template <NumericScalar T, std::size_t N>
constexpr fixed_array<T, N> fixed_array<T, N>::broadcast(T scalar) {
  storage_type elements;
  elements.fill(scalar);
  return fixed_array(elements);
}

template <NumericScalar T, std::size_t N>
template <std::size_t M>
  requires(M == N)
constexpr fixed_array<T, N> fixed_array<T, N>::from_array(
    const T (&elements)[M]) {
  storage_type storage{};
  for (size_type i = 0; i < N; ++i) {
    storage[i] = elements[i];
  }
  return fixed_array(storage);
}

/**
 * Constructs from a range whose length is only known at runtime.
 * Complexity: O(N)
 *
 * @throws std::length_error if the range does not hold exactly N elements
 */
template <NumericScalar T, std::size_t N>
template <std::ranges::sized_range R>
  requires std::convertible_to<std::ranges::range_value_t<R>, T>
fixed_array<T, N> fixed_array<T, N>::from_range(R&& range) {
  const auto length = static_cast<size_type>(std::ranges::size(range));
  if (length != N) {
    throw std::length_error(std::format(
        "fixed_array: expected {} elements, range holds {}", N, length));
  }

  storage_type storage{};
  size_type i = 0;
  for (auto&& value : range) {
    storage[i++] = static_cast<T>(value);
  }
  return fixed_array(storage);
}

// ============================================================================
// Element access and conversion
// ============================================================================

template <NumericScalar T, std::size_t N>
constexpr const T& fixed_array<T, N>::at(size_type i) const {
  if (i >= N) {
    throw std::out_of_range(
        std::format("fixed_array: index {} out of range for size {}", i, N));
  }
  return elements_[i];
}

template <NumericScalar T, std::size_t N>
template <NumericScalar U>
constexpr fixed_array<U, N> fixed_array<T, N>::cast() const {
  std::array<U, N> converted{};
  for (size_type i = 0; i < N; ++i) {
    converted[i] = static_cast<U>(elements_[i]);
  }
  return fixed_array<U, N>(converted);
}

// ============================================================================
// Arithmetic
// ============================================================================

/**
 * Replaces every element with op(element, rhs element).
 * Small integer types promote to int, so the result is converted back to T.
 */
template <NumericScalar T, std::size_t N>
template <typename Op>
void fixed_array<T, N>::apply(const fixed_array& rhs, Op op) {
  for (size_type i = 0; i < N; ++i) {
    elements_[i] = static_cast<T>(op(elements_[i], rhs.elements_[i]));
  }
}

/**
 * Integer add, subtract and multiply. op(a, b, &out) stores the result
 * wrapped to T and returns true if the exact result does not fit in T.
 * Every position is computed before anything is written.
 *
 * @throws std::overflow_error if a signed result is out of range
 */
template <NumericScalar T, std::size_t N>
template <typename Op>
void fixed_array<T, N>::apply_integer(const fixed_array& rhs, Op op,
                                      std::string_view operation) {
  storage_type result{};
  for (size_type i = 0; i < N; ++i) {
    if (op(elements_[i], rhs.elements_[i], &result[i]) &&
        std::is_signed_v<T>) {
      throw std::overflow_error(std::format(
          "fixed_array: signed {} overflow at index {}", operation, i));
    }
  }
  elements_ = result;
}

/**
 * Validates an integer division before anything is written, so a throwing
 * compound assignment leaves the array unchanged.
 *
 * @throws std::domain_error on a zero divisor
 * @throws std::overflow_error on signed minimum divided by -1
 */
template <NumericScalar T, std::size_t N>
void fixed_array<T, N>::check_division(const storage_type& dividends,
                                       const storage_type& divisors) {
  for (size_type i = 0; i < N; ++i) {
    if (divisors[i] == T{0}) {
      throw std::domain_error(
          std::format("fixed_array: integer division by zero at index {}", i));
    }
    if constexpr (std::is_signed_v<T>) {
      if (dividends[i] == std::numeric_limits<T>::min() &&
          divisors[i] == T{-1}) {
        throw std::overflow_error(std::format(
            "fixed_array: signed division overflow at index {}", i));
      }
    }
  }
}

template <NumericScalar T, std::size_t N>
fixed_array<T, N>& fixed_array<T, N>::operator+=(const fixed_array& rhs) {
  if constexpr (std::is_integral_v<T>) {
    apply_integer(
        rhs,
        [](T a, T b, T* out) { return __builtin_add_overflow(a, b, out); },
        "addition");
  } else {
    apply(rhs, [](T a, T b) { return a + b; });
  }
  return *this;
}

template <NumericScalar T, std::size_t N>
fixed_array<T, N>& fixed_array<T, N>::operator-=(const fixed_array& rhs) {
  if constexpr (std::is_integral_v<T>) {
    apply_integer(
        rhs,
        [](T a, T b, T* out) { return __builtin_sub_overflow(a, b, out); },
        "subtraction");
  } else {
    apply(rhs, [](T a, T b) { return a - b; });
  }
  return *this;
}

template <NumericScalar T, std::size_t N>
fixed_array<T, N>& fixed_array<T, N>::operator*=(const fixed_array& rhs) {
  if constexpr (std::is_integral_v<T>) {
    apply_integer(
        rhs,
        [](T a, T b, T* out) { return __builtin_mul_overflow(a, b, out); },
        "multiplication");
  } else {
    apply(rhs, [](T a, T b) { return a * b; });
  }
  return *this;
}

template <NumericScalar T, std::size_t N>
fixed_array<T, N>& fixed_array<T, N>::operator/=(const fixed_array& rhs) {
  if constexpr (std::is_integral_v<T>) {
    check_division(elements_, rhs.elements_);
  }
  apply(rhs, [](T a, T b) { return a / b; });
  return *this;
}

template <NumericScalar T, std::size_t N>
fixed_array<T, N>& fixed_array<T, N>::operator%=(const fixed_array& rhs) {
  if constexpr (std::is_integral_v<T>) {
    check_division(elements_, rhs.elements_);
    apply(rhs, [](T a, T b) { return a % b; });
  } else {
    apply(rhs, [](T a, T b) { return std::fmod(a, b); });
  }
  return *this;
}

template <NumericScalar T, std::size_t N>
fixed_array<T, N>& fixed_array<T, N>::operator+=(T rhs) {
  return *this += broadcast(rhs);
}

template <NumericScalar T, std::size_t N>
fixed_array<T, N>& fixed_array<T, N>::operator-=(T rhs) {
  return *this -= broadcast(rhs);
}

template <NumericScalar T, std::size_t N>
fixed_array<T, N>& fixed_array<T, N>::operator*=(T rhs) {
  return *this *= broadcast(rhs);
}

template <NumericScalar T, std::size_t N>
fixed_array<T, N>& fixed_array<T, N>::operator/=(T rhs) {
  return *this /= broadcast(rhs);
}

template <NumericScalar T, std::size_t N>
fixed_array<T, N>& fixed_array<T, N>::operator%=(T rhs) {
  return *this %= broadcast(rhs);
}

template <NumericScalar T, std::size_t N>
fixed_array<T, N> fixed_array<T, N>::operator-() const {
  if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
    for (size_type i = 0; i < N; ++i) {
      if (elements_[i] == std::numeric_limits<T>::min()) {
        throw std::overflow_error(std::format(
            "fixed_array: negation overflow at index {}", i));
      }
    }
  }
  fixed_array result;
  for (size_type i = 0; i < N; ++i) {
    result.elements_[i] = static_cast<T>(-elements_[i]);
  }
  return result;
}

// ============================================================================
// Formatting
// ============================================================================

template <NumericScalar T, std::size_t N>
std::ostream& operator<<(std::ostream& os, const fixed_array<T, N>& array) {
  os << '[';
  for (std::size_t i = 0; i < N; ++i) {
    if (i > 0) {
      os << ", ";
    }
    if constexpr (sizeof(T) == 1) {
      os << static_cast<int>(array[i]);
    } else {
      os << array[i];
    }
  }
  return os << ']';
}

}  // namespace vecx
