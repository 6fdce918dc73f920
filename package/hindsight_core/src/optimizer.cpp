#include "hindsight_core/optimizer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include <fmt/format.h>

#include "ortools/sat/cp_model.h"
#include "ortools/sat/cp_model.pb.h"
#include "ortools/sat/cp_model_solver.h"
#include "ortools/sat/model.h"
#include "ortools/sat/sat_parameters.pb.h"
#include "ortools/util/time_limit.h"

namespace sat = operations_research::sat;

namespace hindsight_core {

namespace {

// Objective coefficients are integral; bench weights on a 0.001 grid are exact.
constexpr std::int64_t kObjectiveScale = 1000;

} // namespace

const char *solve_status_name(SolveStatus status) {
  switch (status) {
  case SolveStatus::Optimal:
    return "optimal";
  case SolveStatus::Feasible:
    return "feasible";
  case SolveStatus::Infeasible:
    return "infeasible";
  case SolveStatus::Interrupted:
    return "interrupted";
  }
  return "unknown";
}

SolveResult SquadOptimizer::solve(const OptimizerConfig &cfg,
                                  std::atomic<bool> *stop) const {
  if (!(cfg.bench_weight > 0.0 && cfg.bench_weight <= 1.0)) {
    throw std::invalid_argument(fmt::format(
        "SquadOptimizer: bench weight {} outside (0, 1]", cfg.bench_weight));
  }
  const SquadRules &rules = cfg.rules;
  const auto &players = registry_->players();
  const int n = static_cast<int>(players.size());

  const std::int64_t bench_coef =
      std::llround(cfg.bench_weight * static_cast<double>(kObjectiveScale));

  sat::CpModelBuilder model;

  // Variable vectors are aligned with registry rows; row_ids maps back to
  // player ids.
  std::vector<std::int64_t> row_ids(n);
  std::vector<sat::BoolVar> lineup(n), bench(n), captain(n), vice(n);
  for (int i = 0; i < n; ++i) {
    row_ids[i] = players[i].id;
    lineup[i] = model.NewBoolVar();
    bench[i] = model.NewBoolVar();
    captain[i] = model.NewBoolVar();
    vice[i] = model.NewBoolVar();
  }

  sat::LinearExpr objective;
  sat::LinearExpr cost_sum, lineup_sum, bench_sum, captain_sum, vice_sum;
  std::vector<sat::LinearExpr> pos_lineup(kNumPositions);
  std::vector<sat::LinearExpr> pos_squad(kNumPositions);
  std::unordered_map<std::string, sat::LinearExpr> club_squad;

  for (int i = 0; i < n; ++i) {
    const Player &p = players[i];
    const std::int64_t pts = registry_->season_points(p.id);
    objective += lineup[i] * (pts * kObjectiveScale);
    objective += captain[i] * (pts * kObjectiveScale);
    objective += vice[i] * (pts * bench_coef);
    objective += bench[i] * (pts * bench_coef);

    cost_sum += lineup[i] * p.cost;
    cost_sum += bench[i] * p.cost;
    lineup_sum += lineup[i];
    bench_sum += bench[i];
    captain_sum += captain[i];
    vice_sum += vice[i];

    const int pos = static_cast<int>(p.position);
    pos_lineup[pos] += lineup[i];
    pos_squad[pos] += lineup[i];
    pos_squad[pos] += bench[i];
    club_squad[p.club] += lineup[i];
    club_squad[p.club] += bench[i];

    // A player fills at most one squad slot and armbands go to starters
    model.AddLessOrEqual(sat::LinearExpr(lineup[i]) + bench[i], 1);
    model.AddImplication(captain[i], lineup[i]);
    model.AddImplication(vice[i], lineup[i]);
    model.AddLessOrEqual(sat::LinearExpr(captain[i]) + vice[i], 1);
  }

  model.AddLessOrEqual(cost_sum, rules.budget);
  model.AddEquality(lineup_sum, rules.lineup_size);
  model.AddEquality(bench_sum, rules.bench_size);
  model.AddEquality(captain_sum, 1);
  model.AddEquality(vice_sum, 1);
  for (int pos = 0; pos < kNumPositions; ++pos) {
    model.AddGreaterOrEqual(pos_lineup[pos], rules.lineup_min[pos]);
    model.AddLessOrEqual(pos_lineup[pos], rules.lineup_max[pos]);
    model.AddEquality(pos_squad[pos], rules.squad_count[pos]);
  }
  for (const auto &kv : club_squad) {
    model.AddLessOrEqual(kv.second, rules.max_per_club);
  }

  model.Maximize(objective);

  // Solve
  sat::Model cp_model;
  sat::SatParameters parameters;
  if (cfg.max_time_seconds > 0.0)
    parameters.set_max_time_in_seconds(cfg.max_time_seconds);
  if (cfg.num_workers > 0)
    parameters.set_num_workers(cfg.num_workers);
  parameters.set_random_seed(cfg.random_seed);
  cp_model.Add(sat::NewSatParameters(parameters));
  if (stop != nullptr) {
    cp_model.GetOrCreate<operations_research::TimeLimit>()
        ->RegisterExternalBooleanAsLimit(stop);
  }

  const sat::CpSolverResponse response =
      sat::SolveCpModel(model.Build(), &cp_model);

  SolveResult result;
  result.wall_time = response.wall_time();
  switch (response.status()) {
  case sat::CpSolverStatus::OPTIMAL:
    result.status = SolveStatus::Optimal;
    break;
  case sat::CpSolverStatus::FEASIBLE:
    result.status = SolveStatus::Feasible;
    break;
  case sat::CpSolverStatus::INFEASIBLE:
    result.status = SolveStatus::Infeasible;
    return result;
  case sat::CpSolverStatus::MODEL_INVALID:
    throw std::runtime_error("SquadOptimizer: solver rejected the model");
  default:
    result.status = SolveStatus::Interrupted;
    return result;
  }
  result.objective =
      response.objective_value() / static_cast<double>(kObjectiveScale);

  // Extract squad
  Squad squad;
  std::vector<int> lineup_rows;
  std::vector<std::int64_t> bench_outfield;
  for (int i = 0; i < n; ++i) {
    if (sat::SolutionBooleanValue(response, lineup[i])) {
      lineup_rows.push_back(i);
    } else if (sat::SolutionBooleanValue(response, bench[i])) {
      if (players[i].position == Position::GK)
        squad.bench_goalkeeper = row_ids[i];
      else
        bench_outfield.push_back(row_ids[i]);
    }
    if (sat::SolutionBooleanValue(response, captain[i]))
      squad.captain = row_ids[i];
    if (sat::SolutionBooleanValue(response, vice[i]))
      squad.vice_captain = row_ids[i];
  }
  std::stable_sort(lineup_rows.begin(), lineup_rows.end(), [&](int a, int b) {
    return players[a].position < players[b].position;
  });
  for (const int i : lineup_rows)
    squad.lineup.push_back(row_ids[i]);
  if (bench_outfield.size() != squad.bench_outfield.size()) {
    throw std::runtime_error(fmt::format(
        "SquadOptimizer: solution has {} outfield bench players",
        bench_outfield.size()));
  }
  std::copy(bench_outfield.begin(), bench_outfield.end(),
            squad.bench_outfield.begin());
  result.squad = squad;
  return result;
}

} // namespace hindsight_core
