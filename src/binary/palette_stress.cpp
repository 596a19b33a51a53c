// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <chrono>
#include <cstdint>
#include <iostream>
#include <lyra/lyra.hpp>
#include <map>
#include <print>
#include <random>
#include <sstream>
#include <string>
#include <vector>
#include <vecx/unique_indexer.hpp>

using rgba = vecx::fixed_array<std::uint8_t, 4>;

int main(int argc, char** argv) {
  bool show_help = false;
  uint64_t seed = static_cast<uint64_t>(
      std::chrono::system_clock::now().time_since_epoch().count());
  size_t target_iterations = 100;
  size_t min_elements = 1000;
  size_t max_elements = 200000;
  size_t palette_size = 256;

  // Define command line interface
  auto cli =
      lyra::cli() | lyra::help(show_help) |
      lyra::opt(seed, "seed")["-d"]["--seed"](
          "Random seed (defaults to time since epoch)") |
      lyra::opt(target_iterations,
                "iterations")["-i"]["--iterations"]("Iterations to run") |
      lyra::opt(min_elements, "min_elements")["--min-elements"](
          "Minimum length of the generated sequences") |
      lyra::opt(max_elements, "max_elements")["--max-elements"](
          "Maximum length of the generated sequences") |
      lyra::opt(palette_size, "palette_size")["-p"]["--palette-size"](
          "Number of distinct colors to draw from");

  // Parse command line
  auto result = cli.parse({argc, argv});
  if (!result) {
    std::cerr << "Error in command line: " << result.message() << std::endl;
    return 1;
  }

  // Show help if requested
  if (show_help) {
    std::cout << cli << std::endl;
    return 0;
  }

  if (min_elements > max_elements || palette_size == 0) {
    std::cerr << "Invalid sizes: need min-elements <= max-elements and a "
                 "non-empty palette"
              << std::endl;
    return 1;
  }

  std::uniform_int_distribution<size_t> length_dist(min_elements, max_elements);
  std::uniform_int_distribution<int> channel(0, 255);

  for (size_t iter = 0; iter < target_iterations; ++iter) {
    std::mt19937 rng(iter + seed);

    std::vector<rgba> palette;
    for (size_t i = 0; i < palette_size; ++i) {
      palette.push_back(
          {channel(rng), channel(rng), channel(rng), channel(rng)});
    }

    size_t length = length_dist(rng);
    std::uniform_int_distribution<size_t> pick(0, palette.size() - 1);
    std::vector<rgba> input;
    input.reserve(length);
    for (size_t i = 0; i < length; ++i) {
      input.push_back(palette[pick(rng)]);
    }

    std::cout << "Iteration " << iter << " using " << length
              << " elements, seed " << iter + seed << std::endl;

    auto hashed = vecx::unique_indexer<std::uint8_t, 4>::from_sequence(input);
    auto ordered =
        vecx::unique_indexer<std::uint8_t, 4,
                             vecx::LookupMode::Ordered>::from_sequence(input);

    auto fail = [&](size_t position, const std::string& what) -> int {
      std::cerr << "Iteration " << iter << ", position " << position << ": "
                << what << std::endl;
      return 1;
    };

    if (hashed.values() != ordered.values() ||
        hashed.indices() != ordered.indices()) {
      return fail(0, "hash and ordered lookup disagree");
    }

    // Reference first-appearance positions, computed independently
    std::map<rgba, size_t> first_seen;
    for (size_t i = 0; i < input.size(); ++i) {
      auto it = first_seen.try_emplace(input[i], first_seen.size()).first;
      size_t index = hashed.indices()[i];
      if (index >= hashed.unique_count()) {
        return fail(i, "index exceeds palette size");
      }
      if (hashed.values()[index] != input[i]) {
        std::ostringstream os;
        os << "reconstructed " << hashed.values()[index] << " != input "
           << input[i];
        return fail(i, os.str());
      }
      if (index != it->second) {
        return fail(i, "palette is not in first-appearance order");
      }
    }

    if (first_seen.size() != hashed.unique_count()) {
      return fail(input.size(), "palette holds duplicate values");
    }
  }

  std::println("{} iterations passed", target_iterations);
  return 0;
}
