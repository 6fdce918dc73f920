#pragma once

#include <algorithm>
#include <cstddef>
#include <exception>
#include <future>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace hindsight_core {

template <typename R> struct MaxResult {
  std::optional<R> best;
  std::size_t best_index{0};
  std::size_t evaluated{0};
  std::vector<std::string> errors; // one entry per candidate that threw
};

namespace detail {

// Larger key wins; on equal keys the lower candidate index wins, so the
// outcome does not depend on how the range was split.
template <typename R, typename Key>
void merge_max(MaxResult<R> &into, MaxResult<R> &&part, Key &key) {
  into.evaluated += part.evaluated;
  into.errors.insert(into.errors.end(),
                     std::make_move_iterator(part.errors.begin()),
                     std::make_move_iterator(part.errors.end()));
  if (!part.best)
    return;
  if (!into.best || key(*part.best) > key(*into.best) ||
      (!(key(*into.best) > key(*part.best)) &&
       part.best_index < into.best_index)) {
    into.best = std::move(part.best);
    into.best_index = part.best_index;
  }
}

} // namespace detail

// Evaluates eval(0) .. eval(count - 1) and keeps the one with the largest
// key(result). Candidates are produced on demand inside the workers. A
// candidate that throws is recorded in errors and does not stop the others.
template <typename Eval, typename Key>
auto max_by_key(std::size_t count, Eval eval, Key key, int n_threads = 1)
    -> MaxResult<std::decay_t<decltype(eval(std::size_t{}))>> {
  using R = std::decay_t<decltype(eval(std::size_t{}))>;

  auto scan = [&](std::size_t begin, std::size_t end) {
    MaxResult<R> part;
    for (std::size_t i = begin; i < end; ++i) {
      try {
        R r = eval(i);
        ++part.evaluated;
        if (!part.best || key(r) > key(*part.best)) {
          part.best = std::move(r);
          part.best_index = i;
        }
      } catch (const std::exception &e) {
        part.errors.push_back(fmt::format("candidate {}: {}", i, e.what()));
      }
    }
    return part;
  };

  const std::size_t workers = std::min<std::size_t>(
      count, static_cast<std::size_t>(std::max(1, n_threads)));
  if (workers <= 1)
    return scan(0, count);

  const std::size_t chunk = (count + workers - 1) / workers;
  std::vector<std::future<MaxResult<R>>> parts;
  parts.reserve(workers);
  for (std::size_t begin = 0; begin < count; begin += chunk) {
    const std::size_t end = std::min(count, begin + chunk);
    parts.push_back(std::async(std::launch::async, scan, begin, end));
  }

  MaxResult<R> out;
  for (auto &f : parts) {
    detail::merge_max(out, f.get(), key);
  }
  return out;
}

} // namespace hindsight_core
