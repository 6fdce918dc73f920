#include "hindsight_core/search.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "hindsight_core/reduce.hpp"

namespace hindsight_core {

namespace {

struct Evaluated {
  Squad squad;
  SeasonResult season;
};

int total_of(const Evaluated &e) { return e.season.total_points; }

} // namespace

std::vector<double> default_weight_grid() {
  std::vector<double> grid;
  for (int i = 1; i <= 19; ++i)
    grid.push_back(0.05 * i);
  return grid;
}

std::array<std::int64_t, 3> nth_bench_order(std::array<std::int64_t, 3> ids,
                                            std::size_t i) {
  if (i >= 6) {
    throw std::out_of_range(fmt::format("Bench order index {} of 6", i));
  }
  std::sort(ids.begin(), ids.end());
  // Factorial number system: digits 2!, 1!
  std::array<std::int64_t, 3> out{};
  std::vector<std::int64_t> pool(ids.begin(), ids.end());
  const std::size_t first = i / 2;
  out[0] = pool[first];
  pool.erase(pool.begin() + static_cast<std::ptrdiff_t>(first));
  const std::size_t second = i % 2;
  out[1] = pool[second];
  pool.erase(pool.begin() + static_cast<std::ptrdiff_t>(second));
  out[2] = pool[0];
  return out;
}

SearchOrchestrator::SearchOrchestrator(const PlayerRegistry &registry,
                                       int last_completed_gameweek,
                                       SearchConfig cfg)
    : registry_(&registry), optimizer_(registry),
      simulator_(registry, last_completed_gameweek), cfg_(std::move(cfg)) {
  if (cfg_.n_threads < 1) {
    throw std::invalid_argument("SearchOrchestrator: n_threads must be >= 1");
  }
}

std::optional<SolveResult>
SearchOrchestrator::solve_at(double weight, WeightOutcome &outcome,
                             std::atomic<bool> *stop) const {
  outcome.weight = weight;
  OptimizerConfig ocfg = cfg_.optimizer;
  ocfg.bench_weight = weight;
  SolveResult solved;
  try {
    solved = optimizer_.solve(ocfg, stop);
  } catch (const std::exception &e) {
    outcome.error = e.what();
    return std::nullopt;
  }
  outcome.status = solved.status;
  if (solved.status != SolveStatus::Optimal) {
    outcome.error = fmt::format("solver finished {}",
                                solve_status_name(solved.status));
    return std::nullopt;
  }
  return solved;
}

WeightOutcome SearchOrchestrator::baseline(double weight,
                                           std::atomic<bool> *stop) const {
  WeightOutcome outcome;
  const std::optional<SolveResult> solved = solve_at(weight, outcome, stop);
  if (!solved)
    return outcome;
  outcome.squad = solved->squad;
  outcome.best_season = simulator_.run(*outcome.squad);
  outcome.best_total_points = outcome.best_season.total_points;
  outcome.orders_evaluated = 1;
  return outcome;
}

WeightOutcome SearchOrchestrator::evaluate_weight(
    double weight, std::atomic<bool> *stop) const {
  WeightOutcome outcome;
  const std::optional<SolveResult> solved = solve_at(weight, outcome, stop);
  if (!solved)
    return outcome;
  const Squad &base = *solved->squad;

  auto best = max_by_key(
      6,
      [&](std::size_t i) {
        Evaluated e;
        e.squad = base.with_bench_order(nth_bench_order(base.bench_outfield, i));
        e.season = simulator_.run(e.squad);
        return e;
      },
      total_of, cfg_.n_threads);

  outcome.orders_evaluated = best.evaluated;
  if (!best.best) {
    outcome.error = fmt::format("no bench order could be scored: {}",
                                fmt::join(best.errors, "; "));
    return outcome;
  }
  outcome.squad = std::move(best.best->squad);
  outcome.best_season = std::move(best.best->season);
  outcome.best_total_points = outcome.best_season.total_points;

  if (cfg_.verbose) {
    std::cout << fmt::format("[Search] weight {:.2f}: {} points, bench [{}]",
                             weight, outcome.best_total_points,
                             fmt::join(outcome.squad->bench(), ", "))
              << std::endl;
  }
  return outcome;
}

std::vector<WeightOutcome>
SearchOrchestrator::best_bench_orders(std::atomic<bool> *stop) const {
  std::vector<WeightOutcome> out;
  out.reserve(cfg_.weights.size());
  for (const double w : cfg_.weights) {
    if (cfg_.verbose) {
      std::cout << fmt::format("[Search] processing weight {:.2f}", w)
                << std::endl;
    }
    out.push_back(evaluate_weight(w, stop));
    if (cfg_.verbose && !out.back().squad) {
      std::cout << fmt::format("[Search] weight {:.2f} skipped: {}", w,
                               out.back().error)
                << std::endl;
    }
  }
  return out;
}

CaptaincyOutcome SearchOrchestrator::best_captaincy(const Squad &squad) const {
  const std::size_t n = squad.lineup.size();
  if (n < 2) {
    throw std::invalid_argument(
        "SearchOrchestrator: captaincy needs at least two starters");
  }
  const std::size_t pairs = n * (n - 1);

  auto best = max_by_key(
      pairs,
      [&](std::size_t k) {
        const std::size_t c = k / (n - 1);
        std::size_t v = k % (n - 1);
        if (v >= c)
          ++v;
        Evaluated e;
        e.squad = squad.with_captaincy(squad.lineup[c], squad.lineup[v]);
        e.season = simulator_.run(e.squad);
        return e;
      },
      total_of, cfg_.n_threads);

  CaptaincyOutcome out;
  out.pairs_evaluated = best.evaluated;
  out.errors = std::move(best.errors);
  if (!best.best) {
    throw std::runtime_error(
        fmt::format("SearchOrchestrator: no captaincy pair could be scored: {}",
                    fmt::join(out.errors, "; ")));
  }
  out.captain = best.best->squad.captain;
  out.vice_captain = best.best->squad.vice_captain;
  out.season = std::move(best.best->season);
  out.total_points = out.season.total_points;
  return out;
}

SearchResult SearchOrchestrator::run(std::atomic<bool> *stop) const {
  return finish(best_bench_orders(stop));
}

SearchResult
SearchOrchestrator::finish(std::vector<WeightOutcome> per_weight) const {
  SearchResult result;
  result.per_weight = std::move(per_weight);
  const auto &outcomes = result.per_weight;

  // Weights without a squad rank below every scored one
  auto best = max_by_key(
      outcomes.size(), [](std::size_t i) { return i; },
      [&](std::size_t i) {
        return std::make_pair(outcomes[i].squad.has_value(),
                              outcomes[i].best_total_points);
      });
  if (!best.best || !outcomes[*best.best].squad) {
    if (cfg_.verbose)
      std::cout << "[Search] no weight produced a squad" << std::endl;
    return result;
  }
  const WeightOutcome &chosen = outcomes[*best.best];
  result.weight = chosen.weight;
  result.phase1_total_points = chosen.best_total_points;

  CaptaincyOutcome cap;
  try {
    cap = best_captaincy(*chosen.squad);
  } catch (const std::exception &e) {
    result.error = e.what();
    if (cfg_.verbose) {
      std::cout << fmt::format("[Search] captaincy failed for weight {:.2f}: {}",
                               result.weight, result.error)
                << std::endl;
    }
    return result;
  }

  result.found = true;
  result.squad = chosen.squad->with_captaincy(cap.captain, cap.vice_captain);
  result.total_points = cap.total_points;
  result.season = cap.season;

  if (cfg_.verbose) {
    const Player &c = registry_->get(cap.captain);
    const Player &v = registry_->get(cap.vice_captain);
    std::cout << fmt::format("[Search] best weight {:.2f}: {} points before "
                             "captaincy, {} with captain {} and vice {}",
                             result.weight, result.phase1_total_points,
                             result.total_points, c.name, v.name)
              << std::endl;
  }
  return result;
}

} // namespace hindsight_core
