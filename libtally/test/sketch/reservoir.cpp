//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/sketch/reservoir.hpp"

#include "tally/test/test.hpp"

#include <algorithm>
#include <vector>

using namespace tally;

TEST("reservoir keeps everything below capacity") {
  auto sampler = reservoir_sampler<int>{10};
  for (auto i = 0; i < 5; ++i) {
    sampler.add(i);
  }
  CHECK_EQUAL(sampler.seen(), 5u);
  auto sample = sampler.sample();
  CHECK_EQUAL(sample.size(), 5u);
  CHECK((std::vector<int>(sample.begin(), sample.end())
         == std::vector<int>{0, 1, 2, 3, 4}));
}

TEST("reservoir is bounded and seeded") {
  auto a = reservoir_sampler<int>{100, 3};
  auto b = reservoir_sampler<int>{100, 3};
  for (auto i = 0; i < 10'000; ++i) {
    a.add(i);
    b.add(i);
  }
  auto xs = a.sample();
  auto ys = b.sample();
  CHECK_EQUAL(xs.size(), 100u);
  CHECK_EQUAL(a.seen(), 10'000u);
  CHECK(std::equal(xs.begin(), xs.end(), ys.begin(), ys.end()));
  // A uniform sample of 0..9999 does not stay in the first thousand.
  auto late = std::count_if(xs.begin(), xs.end(), [](int x) {
    return x >= 1'000;
  });
  CHECK_GREATER(late, std::ptrdiff_t{50});
}
