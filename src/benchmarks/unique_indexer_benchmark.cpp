// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <benchmark/benchmark.h>

#include <cstdint>
#include <map>
#include <random>
#include <unordered_map>
#include <vector>
#include <vecx/unique_indexer.hpp>

using namespace vecx;

using rgb = fixed_array<std::uint8_t, 3>;
using point = fixed_array<float, 3>;

// Generate an input sequence drawing from a fixed palette of random colors
std::vector<rgb> GenerateColors(std::size_t count, std::size_t palette_size) {
  std::mt19937 rng(42);
  std::uniform_int_distribution<int> channel(0, 255);
  std::vector<rgb> palette;
  palette.reserve(palette_size);
  for (std::size_t i = 0; i < palette_size; ++i) {
    palette.push_back({channel(rng), channel(rng), channel(rng)});
  }

  std::uniform_int_distribution<std::size_t> pick(0, palette_size - 1);
  std::vector<rgb> colors;
  colors.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    colors.push_back(palette[pick(rng)]);
  }
  return colors;
}

// Vertex-like input: a grid of points where every point repeats 6 times
std::vector<point> GeneratePoints(std::size_t count) {
  std::vector<point> points;
  points.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    const std::size_t cell = i / 6;
    points.push_back({static_cast<float>(cell % 97) * 0.5f,
                      static_cast<float>(cell / 97) * 0.25f, 1.0f});
  }
  return points;
}

template <LookupMode Mode>
static void BM_UniqueIndexer_Colors(benchmark::State& state) {
  auto colors = GenerateColors(static_cast<std::size_t>(state.range(0)),
                               static_cast<std::size_t>(state.range(1)));
  for (auto _ : state) {
    auto indexed = unique_indexer<std::uint8_t, 3, Mode>::from_sequence(colors);
    benchmark::DoNotOptimize(indexed.indices().data());
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

template <LookupMode Mode>
static void BM_UniqueIndexer_Points(benchmark::State& state) {
  auto points = GeneratePoints(static_cast<std::size_t>(state.range(0)));
  for (auto _ : state) {
    auto indexed = unique_indexer<float, 3, Mode>::from_sequence(points);
    benchmark::DoNotOptimize(indexed.indices().data());
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

// Baseline: the same single-pass algorithm over a standard library map
template <typename Map>
static void BM_StdMapBaseline_Colors(benchmark::State& state) {
  auto colors = GenerateColors(static_cast<std::size_t>(state.range(0)),
                               static_cast<std::size_t>(state.range(1)));
  for (auto _ : state) {
    Map lookup;
    std::vector<rgb> values;
    std::vector<std::size_t> indices;
    indices.reserve(colors.size());
    for (const auto& color : colors) {
      auto [it, inserted] = lookup.try_emplace(encode_key(color), values.size());
      if (inserted) {
        values.push_back(color);
      }
      indices.push_back(it->second);
    }
    benchmark::DoNotOptimize(indices.data());
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

using color_key = content_key<std::uint8_t, 3>;
using color_std_map = std::map<color_key, std::size_t>;
using color_std_unordered_map =
    std::unordered_map<color_key, std::size_t, content_key_hash>;

BENCHMARK(BM_UniqueIndexer_Colors<LookupMode::Hash>)
    ->ArgsProduct({{1 << 10, 1 << 16, 1 << 20}, {16, 256, 4096}});
BENCHMARK(BM_UniqueIndexer_Colors<LookupMode::Ordered>)
    ->ArgsProduct({{1 << 10, 1 << 16, 1 << 20}, {16, 256, 4096}});
BENCHMARK(BM_StdMapBaseline_Colors<color_std_map>)
    ->ArgsProduct({{1 << 10, 1 << 16, 1 << 20}, {16, 256, 4096}});
BENCHMARK(BM_StdMapBaseline_Colors<color_std_unordered_map>)
    ->ArgsProduct({{1 << 10, 1 << 16, 1 << 20}, {16, 256, 4096}});

BENCHMARK(BM_UniqueIndexer_Points<LookupMode::Hash>)->Range(1 << 10, 1 << 20);
BENCHMARK(BM_UniqueIndexer_Points<LookupMode::Ordered>)
    ->Range(1 << 10, 1 << 20);

BENCHMARK_MAIN();
