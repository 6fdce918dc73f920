#pragma once

#include <atomic>
#include <optional>

#include "hindsight_core/player.hpp"
#include "hindsight_core/squad.hpp"

namespace hindsight_core {

struct OptimizerConfig {
  // Discount on bench and vice-captain points, in (0, 1]
  double bench_weight{0.15};
  double max_time_seconds{0.0}; // 0 = no limit
  int num_workers{0};           // 0 = solver default
  int random_seed{0};
  SquadRules rules{};
};

enum class SolveStatus { Optimal, Feasible, Infeasible, Interrupted };

const char *solve_status_name(SolveStatus status);

struct SolveResult {
  SolveStatus status{SolveStatus::Interrupted};
  std::optional<Squad> squad; // present for Optimal and Feasible
  double objective{0.0};      // in points, bench terms already weighted
  double wall_time{0.0};
};

// Season-long squad selection as a 0/1 program over every registry player.
// Lineup ids come back ordered GK, DEF, MID, FWD and the outfield bench in
// registry order.
class SquadOptimizer {
public:
  explicit SquadOptimizer(const PlayerRegistry &registry)
      : registry_(&registry) {}

  // Setting *stop to true from another thread ends the search early.
  SolveResult solve(const OptimizerConfig &cfg,
                    std::atomic<bool> *stop = nullptr) const;

private:
  const PlayerRegistry *registry_{nullptr};
};

} // namespace hindsight_core
