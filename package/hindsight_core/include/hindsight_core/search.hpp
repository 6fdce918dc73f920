#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "hindsight_core/optimizer.hpp"
#include "hindsight_core/player.hpp"
#include "hindsight_core/season.hpp"
#include "hindsight_core/squad.hpp"

namespace hindsight_core {

// 0.05, 0.10, ..., 0.95
std::vector<double> default_weight_grid();

struct SearchConfig {
  std::vector<double> weights = default_weight_grid();
  // bench_weight is replaced by each grid weight in turn
  OptimizerConfig optimizer{};
  int n_threads{1}; // candidate evaluation fan-out
  bool verbose{false};
};

// Phase 1 result for one bench weight
struct WeightOutcome {
  double weight{0.0};
  SolveStatus status{SolveStatus::Interrupted};
  std::string error;          // why no squad was produced, if any
  std::optional<Squad> squad; // bench_outfield holds the best order
  int best_total_points{0};
  SeasonResult best_season;
  std::size_t orders_evaluated{0};
};

// Phase 2 result
struct CaptaincyOutcome {
  std::int64_t captain{0};
  std::int64_t vice_captain{0};
  int total_points{0};
  SeasonResult season;
  std::size_t pairs_evaluated{0};
  std::vector<std::string> errors;
};

struct SearchResult {
  std::vector<WeightOutcome> per_weight;
  bool found{false}; // false when no weight produced a squad
  double weight{0.0};
  Squad squad; // best bench order and captaincy applied
  int phase1_total_points{0};
  int total_points{0};
  SeasonResult season;
  std::string error; // set when Phase 2 failed; per_weight is still filled
};

// The i-th (0-based, lexicographic) ordering of three bench ids.
std::array<std::int64_t, 3>
nth_bench_order(std::array<std::int64_t, 3> ids, std::size_t i);

class SearchOrchestrator {
public:
  SearchOrchestrator(const PlayerRegistry &registry,
                     int last_completed_gameweek, SearchConfig cfg = {});

  // Single solve at one weight, scored with the optimizer's own bench order
  // and captaincy.
  WeightOutcome baseline(double weight = 0.15,
                         std::atomic<bool> *stop = nullptr) const;

  // Phase 1 for one weight: every ordering of the outfield bench.
  WeightOutcome evaluate_weight(double weight,
                                std::atomic<bool> *stop = nullptr) const;

  // Phase 1 over the whole grid, in grid order.
  std::vector<WeightOutcome> best_bench_orders(
      std::atomic<bool> *stop = nullptr) const;

  // Phase 2: every ordered (captain, vice) pair of distinct starters.
  CaptaincyOutcome best_captaincy(const Squad &squad) const;

  SearchResult run(std::atomic<bool> *stop = nullptr) const;

  // Picks the best of the given Phase 1 outcomes and runs Phase 2 on it.
  SearchResult finish(std::vector<WeightOutcome> per_weight) const;

  const SeasonSimulator &simulator() const { return simulator_; }
  const SearchConfig &config() const { return cfg_; }

private:
  std::optional<SolveResult> solve_at(double weight, WeightOutcome &outcome,
                                      std::atomic<bool> *stop) const;

  const PlayerRegistry *registry_{nullptr};
  SquadOptimizer optimizer_;
  SeasonSimulator simulator_;
  SearchConfig cfg_;
};

} // namespace hindsight_core
