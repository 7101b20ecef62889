#pragma once

#include <rill/rill.h>

#include <boost/ut.hpp>

#include <ranges>
#include <tuple>
#include <vector>

using namespace boost::ut;

using rill::batch;
using rill::computed;
using rill::effect;
using rill::insertion_order_set;
using rill::scope;
using rill::signal;
using rill::untracked;

auto to_vector(auto &&rng) {
  using T = std::ranges::range_value_t<decltype(rng)>;

  auto r = std::vector<T>{};
  for (auto &&x : rng)
    r.push_back(x);

  return r;
}

#define CONCAT2(a, b) a##b
#define CONCAT(a, b) CONCAT2(a, b)
#define _ CONCAT(placeholder_, __LINE__)
