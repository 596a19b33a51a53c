// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <absl/container/btree_map.h>
#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <ranges>
#include <string_view>
#include <type_traits>
#include <vector>

#include "fixed_array.hpp"
#include "key_encoding.hpp"

namespace vecx {

// Enum to control the lookup table used for deduplication
enum class LookupMode {
  Hash,    // ankerl::unordered_dense::map, O(1) expected per element
  Ordered  // absl::btree_map, O(log u) per element
};

/**
 * Hash for content keys. The bytes are hashed with unordered_dense's wyhash,
 * which already avalanches, so the map skips its own mixing step.
 */
struct content_key_hash {
  using is_avalanching = void;

  template <std::size_t Size>
  std::uint64_t operator()(const std::array<std::byte, Size>& key) const
      noexcept {
    return ankerl::unordered_dense::hash<std::string_view>{}(std::string_view(
        reinterpret_cast<const char*>(key.data()), key.size()));
  }
};

/**
 * A sequence of fixed_array values stored as a palette of unique values plus
 * one index per element ("palette + indices" compression).
 *
 * Unique values are kept in order of first appearance. Element i of the
 * original sequence is values()[indices()[i]]. Uniqueness is decided on the
 * content key (see key_encoding.hpp): two values share an entry iff they
 * compare equal, so -0.0 reuses the entry of +0.0 (the first one seen is
 * kept). A NaN reuses the entry of an earlier NaN with the same bit pattern.
 *
 * Example:
 * @code
 * std::vector<fixed_array<std::uint8_t, 3>> colors = {
 *     {255, 0, 0}, {0, 255, 0}, {255, 0, 0}};
 * auto indexed = unique_indexer<std::uint8_t, 3>::from_sequence(colors);
 * // indexed.values()  == {{255, 0, 0}, {0, 255, 0}}
 * // indexed.indices() == {0, 1, 0}
 * @endcode
 *
 * Not thread-safe: concurrent insert() calls need external locking.
 *
 * @tparam T The element type of the indexed arrays
 * @tparam N The length of the indexed arrays
 * @tparam LookupModeT The lookup table used while indexing
 */
template <KeyEncodable T, std::size_t N,
          LookupMode LookupModeT = LookupMode::Hash>
class unique_indexer {
 public:
  using value_type = fixed_array<T, N>;
  using key_type = content_key<T, N>;
  using index_type = std::size_t;
  using size_type = std::size_t;

  class const_iterator;
  using iterator = const_iterator;

  /**
   * Default constructor - an empty sequence with an empty palette.
   */
  unique_indexer() = default;

  /**
   * Adopts an existing palette and index sequence.
   * Complexity: O(u + n) for Hash, O(u log u + n) for Ordered
   *
   * @param values Unique values, in palette order
   * @param indices One palette position per element
   * @throws std::invalid_argument if values holds two entries with the same
   *         content key, or if an index is not a valid palette position
   */
  unique_indexer(std::vector<value_type> values,
                 std::vector<index_type> indices);

  /**
   * Indexes a sequence in a single pass.
   * Complexity: O(n) expected for Hash, O(n log u) for Ordered
   *
   * @param sequence Range of fixed_array values, possibly with repeats
   * @return The palette of unique values and one index per element
   */
  template <std::ranges::input_range R>
    requires std::convertible_to<std::ranges::range_reference_t<R>,
                                 const value_type&>
  static unique_indexer from_sequence(R&& sequence) {
    unique_indexer result;
    if constexpr (std::ranges::sized_range<R>) {
      result.reserve(static_cast<size_type>(std::ranges::size(sequence)));
    }
    for (const value_type& value : sequence) {
      result.insert(value);
    }
    return result;
  }

  static unique_indexer from_sequence(std::initializer_list<value_type> init) {
    return from_sequence(std::views::all(init));
  }

  /**
   * Appends one element.
   *
   * @param value The element to append
   * @return true if value was not in the palette and has been added to it
   */
  bool insert(const value_type& value);

  /**
   * Returns the palette position of value, if present.
   */
  std::optional<index_type> index_of(const value_type& value) const;

  /**
   * Returns element i of the indexed sequence. Precondition: i < size().
   */
  const value_type& operator[](size_type i) const {
    return values_[indices_[i]];
  }

  /**
   * Returns element i of the indexed sequence.
   *
   * @throws std::out_of_range if i >= size()
   */
  const value_type& at(size_type i) const;

  // Unique values in order of first appearance
  const std::vector<value_type>& values() const { return values_; }
  // Palette position of every element
  const std::vector<index_type>& indices() const { return indices_; }

  // Number of elements in the indexed sequence
  [[nodiscard]] size_type size() const { return indices_.size(); }
  [[nodiscard]] size_type unique_count() const { return values_.size(); }
  [[nodiscard]] bool empty() const { return indices_.empty(); }

  /**
   * Reconstructs the full sequence.
   * Complexity: O(n)
   */
  std::vector<value_type> to_vector() const;

  /**
   * Reserves room for n more elements, all of which may be unique.
   */
  void reserve(size_type n);

  /**
   * Removes every element and palette entry.
   */
  void clear();

  const_iterator begin() const { return const_iterator(this, 0); }
  const_iterator end() const { return const_iterator(this, indices_.size()); }

  /**
   * Forward iterator over the indexed sequence.
   * Each dereference looks up the palette entry of the current index.
   */
  class const_iterator {
   public:
    using iterator_category = std::forward_iterator_tag;
    using difference_type = std::ptrdiff_t;
    using value_type = unique_indexer::value_type;
    using pointer = const value_type*;
    using reference = const value_type&;

    const_iterator() : indexer_(nullptr), position_(0) {}

    reference operator*() const { return (*indexer_)[position_]; }
    pointer operator->() const { return &(*indexer_)[position_]; }

    const_iterator& operator++() {
      ++position_;
      return *this;
    }

    const_iterator operator++(int) {
      const_iterator tmp = *this;
      ++(*this);
      return tmp;
    }

    bool operator==(const const_iterator& other) const {
      return indexer_ == other.indexer_ && position_ == other.position_;
    }

   private:
    const_iterator(const unique_indexer* indexer, size_type position)
        : indexer_(indexer), position_(position) {}

    const unique_indexer* indexer_;
    size_type position_;

    friend class unique_indexer;
  };

 private:
  using lookup_type = std::conditional_t<
      LookupModeT == LookupMode::Hash,
      ankerl::unordered_dense::map<key_type, index_type, content_key_hash>,
      absl::btree_map<key_type, index_type>>;

  std::vector<value_type> values_;
  std::vector<index_type> indices_;
  lookup_type lookup_;
};

}  // namespace vecx

// Include implementation
#include "unique_indexer.ipp"
