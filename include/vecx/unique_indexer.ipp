// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

// unique_indexer.ipp - Implementation details for unique_indexer
// This file is included at the end of unique_indexer.hpp
// DO NOT include this file directly

#include <format>
#include <stdexcept>
#include <utility>

namespace vecx {

// ============================================================================
// Construction
// ============================================================================

template <KeyEncodable T, std::size_t N, LookupMode LookupModeT>
unique_indexer<T, N, LookupModeT>::unique_indexer(
    std::vector<value_type> values, std::vector<index_type> indices)
    : values_(std::move(values)), indices_(std::move(indices)) {
  if constexpr (LookupModeT == LookupMode::Hash) {
    lookup_.reserve(values_.size());
  }

  for (index_type position = 0; position < values_.size(); ++position) {
    auto [it, inserted] =
        lookup_.try_emplace(encode_key(values_[position]), position);
    if (!inserted) {
      throw std::invalid_argument(std::format(
          "unique_indexer: palette entry {} duplicates entry {}", position,
          it->second));
    }
  }

  for (size_type i = 0; i < indices_.size(); ++i) {
    if (indices_[i] >= values_.size()) {
      throw std::invalid_argument(std::format(
          "unique_indexer: index {} at position {} exceeds palette size {}",
          indices_[i], i, values_.size()));
    }
  }
}

// ============================================================================
// Modifiers
// ============================================================================

/**
 * Appends one element.
 * A value whose content key is already known reuses the recorded palette
 * position; otherwise it becomes the next palette entry.
 * If an allocation throws, the indexer is left as it was before the call.
 * Complexity: O(1) expected for Hash, O(log u) for Ordered
 */
template <KeyEncodable T, std::size_t N, LookupMode LookupModeT>
bool unique_indexer<T, N, LookupModeT>::insert(const value_type& value) {
  const index_type next = values_.size();
  auto [it, inserted] = lookup_.try_emplace(encode_key(value), next);
  if (!inserted) {
    indices_.push_back(it->second);
    return false;
  }

  // The key is already recorded: roll it back if the palette cannot grow
  try {
    values_.push_back(value);
    indices_.push_back(next);
  } catch (...) {
    if (values_.size() > next) {
      values_.pop_back();
    }
    lookup_.erase(it);
    throw;
  }
  return true;
}

/**
 * Reserves room for n more input elements. The palette and the lookup table
 * are sized for the worst case of n unique values.
 */
template <KeyEncodable T, std::size_t N, LookupMode LookupModeT>
void unique_indexer<T, N, LookupModeT>::reserve(size_type n) {
  indices_.reserve(indices_.size() + n);
  values_.reserve(values_.size() + n);
  if constexpr (LookupModeT == LookupMode::Hash) {
    lookup_.reserve(lookup_.size() + n);
  }
}

template <KeyEncodable T, std::size_t N, LookupMode LookupModeT>
void unique_indexer<T, N, LookupModeT>::clear() {
  values_.clear();
  indices_.clear();
  lookup_.clear();
}

// ============================================================================
// Lookup
// ============================================================================

template <KeyEncodable T, std::size_t N, LookupMode LookupModeT>
std::optional<typename unique_indexer<T, N, LookupModeT>::index_type>
unique_indexer<T, N, LookupModeT>::index_of(const value_type& value) const {
  auto it = lookup_.find(encode_key(value));
  if (it == lookup_.end()) {
    return std::nullopt;
  }
  return it->second;
}

template <KeyEncodable T, std::size_t N, LookupMode LookupModeT>
const typename unique_indexer<T, N, LookupModeT>::value_type&
unique_indexer<T, N, LookupModeT>::at(size_type i) const {
  if (i >= indices_.size()) {
    throw std::out_of_range(std::format(
        "unique_indexer: index {} out of range for size {}", i,
        indices_.size()));
  }
  return values_[indices_[i]];
}

template <KeyEncodable T, std::size_t N, LookupMode LookupModeT>
std::vector<typename unique_indexer<T, N, LookupModeT>::value_type>
unique_indexer<T, N, LookupModeT>::to_vector() const {
  std::vector<value_type> result;
  result.reserve(indices_.size());
  for (index_type index : indices_) {
    result.push_back(values_[index]);
  }
  return result;
}

}  // namespace vecx
