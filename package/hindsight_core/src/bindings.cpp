#include "hindsight_core/gameweek.hpp"
#include "hindsight_core/optimizer.hpp"
#include "hindsight_core/player.hpp"
#include "hindsight_core/report.hpp"
#include "hindsight_core/search.hpp"
#include "hindsight_core/season.hpp"
#include "hindsight_core/squad.hpp"
#include <atomic>

#include <fmt/format.h>
#include <nanobind/nanobind.h>
#include <nanobind/eigen/dense.h>
#include <nanobind/stl/array.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

namespace nb = nanobind;
namespace hc = hindsight_core;

namespace {

// Cancellation handle for long solves. Set it from another Python thread
// while a call holding it runs with the GIL released.
struct StopToken {
  std::atomic<bool> flag{false};
};

std::atomic<bool> *flag_of(StopToken *token) {
  return token != nullptr ? &token->flag : nullptr;
}

} // namespace

// The NB_MODULE macro defines the entry point for the Python module.
NB_MODULE(hindsight_core, m) {
  m.doc() = "Hindsight squad selection and season replay core.";

  nb::enum_<hc::Position>(m, "Position")
      .value("GK", hc::Position::GK)
      .value("DEF", hc::Position::DEF)
      .value("MID", hc::Position::MID)
      .value("FWD", hc::Position::FWD);
  nb::class_<StopToken>(m, "StopToken")
      .def(nb::init<>())
      .def("set", [](StopToken &t) { t.flag = true; })
      .def("clear", [](StopToken &t) { t.flag = false; })
      .def("is_set", [](const StopToken &t) { return t.flag.load(); });

  m.def("position_from_code", &hc::position_from_code, nb::arg("code"));
  m.def("position_from_string", &hc::position_from_string, nb::arg("name"));

  // Player
  nb::class_<hc::Player>(m, "Player")
      .def(nb::init<>())
      .def(nb::init<std::int64_t, std::string, hc::Position, std::string, int,
                    Eigen::VectorXi, Eigen::VectorXi>(),
           nb::arg("id"), nb::arg("name"), nb::arg("position"),
           nb::arg("club"), nb::arg("cost"), nb::arg("points"),
           nb::arg("minutes"))
      .def_rw("id", &hc::Player::id)
      .def_rw("name", &hc::Player::name)
      .def_rw("position", &hc::Player::position)
      .def_rw("club", &hc::Player::club)
      .def_rw("cost", &hc::Player::cost)
      .def_rw("points", &hc::Player::points)
      .def_rw("minutes", &hc::Player::minutes)
      .def("__repr__", [](const hc::Player &p) {
        return fmt::format("Player(id={}, name={}, position={}, club={}, "
                           "cost={})",
                           p.id, p.name, hc::position_name(p.position), p.club,
                           p.cost);
      });

  // PlayerRegistry
  nb::class_<hc::PlayerRegistry>(m, "PlayerRegistry")
      .def(nb::init<int, int>(), nb::arg("n_gameweeks"),
           nb::arg("last_completed_gameweek"))
      .def("add_player", &hc::PlayerRegistry::add_player)
      .def("size", &hc::PlayerRegistry::size)
      .def("n_gameweeks", &hc::PlayerRegistry::n_gameweeks)
      .def("last_completed_gameweek",
           &hc::PlayerRegistry::last_completed_gameweek)
      .def("clamp_gameweek", &hc::PlayerRegistry::clamp_gameweek)
      .def("has_id", &hc::PlayerRegistry::has_id)
      .def("get", &hc::PlayerRegistry::get, nb::rv_policy::copy)
      .def("season_points", &hc::PlayerRegistry::season_points)
      .def("players", &hc::PlayerRegistry::players, nb::rv_policy::copy)
      .def("__repr__", [](const hc::PlayerRegistry &r) {
        return fmt::format("PlayerRegistry(size={}, last_completed={})",
                           r.size(), r.last_completed_gameweek());
      });

  // Squad
  nb::class_<hc::SquadRules>(m, "SquadRules")
      .def(nb::init<>())
      .def_rw("lineup_size", &hc::SquadRules::lineup_size)
      .def_rw("bench_size", &hc::SquadRules::bench_size)
      .def_rw("budget", &hc::SquadRules::budget)
      .def_rw("max_per_club", &hc::SquadRules::max_per_club)
      .def_rw("squad_count", &hc::SquadRules::squad_count)
      .def_rw("lineup_min", &hc::SquadRules::lineup_min)
      .def_rw("lineup_max", &hc::SquadRules::lineup_max);

  nb::class_<hc::Squad>(m, "Squad")
      .def(nb::init<>())
      .def_rw("lineup", &hc::Squad::lineup)
      .def_rw("bench_goalkeeper", &hc::Squad::bench_goalkeeper)
      .def_rw("bench_outfield", &hc::Squad::bench_outfield)
      .def_rw("captain", &hc::Squad::captain)
      .def_rw("vice_captain", &hc::Squad::vice_captain)
      .def("bench", &hc::Squad::bench)
      .def("members", &hc::Squad::members)
      .def("with_captaincy", &hc::Squad::with_captaincy)
      .def("with_bench_order", &hc::Squad::with_bench_order);

  m.def("validate_squad", &hc::validate_squad, nb::arg("squad"),
        nb::arg("registry"), nb::arg("rules") = hc::SquadRules{});
  m.def("squad_cost", &hc::squad_cost);

  // Optimizer
  nb::enum_<hc::SolveStatus>(m, "SolveStatus")
      .value("Optimal", hc::SolveStatus::Optimal)
      .value("Feasible", hc::SolveStatus::Feasible)
      .value("Infeasible", hc::SolveStatus::Infeasible)
      .value("Interrupted", hc::SolveStatus::Interrupted);

  nb::class_<hc::OptimizerConfig>(m, "OptimizerConfig")
      .def(nb::init<>())
      .def_rw("bench_weight", &hc::OptimizerConfig::bench_weight)
      .def_rw("max_time_seconds", &hc::OptimizerConfig::max_time_seconds)
      .def_rw("num_workers", &hc::OptimizerConfig::num_workers)
      .def_rw("random_seed", &hc::OptimizerConfig::random_seed)
      .def_rw("rules", &hc::OptimizerConfig::rules);

  nb::class_<hc::SolveResult>(m, "SolveResult")
      .def_ro("status", &hc::SolveResult::status)
      .def_ro("squad", &hc::SolveResult::squad)
      .def_ro("objective", &hc::SolveResult::objective)
      .def_ro("wall_time", &hc::SolveResult::wall_time);

  nb::class_<hc::SquadOptimizer>(m, "SquadOptimizer")
      .def(nb::init<const hc::PlayerRegistry &>(), nb::keep_alive<1, 2>())
      .def(
          "solve",
          [](const hc::SquadOptimizer &o, const hc::OptimizerConfig &cfg,
             StopToken *stop) { return o.solve(cfg, flag_of(stop)); },
          nb::arg("config"), nb::arg("stop") = nb::none(),
          nb::call_guard<nb::gil_scoped_release>());

  // Gameweek and season replay
  nb::class_<hc::Substitution>(m, "Substitution")
      .def_ro("out", &hc::Substitution::out)
      .def_ro("sub_in", &hc::Substitution::in)
      .def("__repr__", [](const hc::Substitution &s) {
        return fmt::format("Substitution(out={}, in={})", s.out, s.in);
      });

  nb::class_<hc::GameweekResult>(m, "GameweekResult")
      .def_ro("gameweek", &hc::GameweekResult::gameweek)
      .def_ro("points", &hc::GameweekResult::points)
      .def_ro("subs_made", &hc::GameweekResult::subs_made)
      .def_ro("did_captain_play", &hc::GameweekResult::did_captain_play)
      .def_ro("vice_play_in_captains_place",
              &hc::GameweekResult::vice_play_in_captains_place)
      .def("__repr__", [](const hc::GameweekResult &r) {
        return fmt::format("GameweekResult(gameweek={}, points={}, subs={})",
                           r.gameweek, r.points, r.subs_made.size());
      });

  nb::class_<hc::GameweekScorer>(m, "GameweekScorer")
      .def(nb::init<const hc::PlayerRegistry &, int>(),
           nb::keep_alive<1, 2>())
      .def("score", &hc::GameweekScorer::score, nb::arg("squad"),
           nb::arg("gameweek"));

  nb::class_<hc::SeasonResult>(m, "SeasonResult")
      .def_ro("gameweeks", &hc::SeasonResult::gameweeks)
      .def_ro("total_points", &hc::SeasonResult::total_points);

  nb::class_<hc::SeasonSimulator>(m, "SeasonSimulator")
      .def(nb::init<const hc::PlayerRegistry &, int>(),
           nb::keep_alive<1, 2>())
      .def("run", nb::overload_cast<const hc::Squad &>(
                      &hc::SeasonSimulator::run, nb::const_))
      .def("run_range",
           nb::overload_cast<const hc::Squad &, int, int>(
               &hc::SeasonSimulator::run, nb::const_),
           nb::arg("squad"), nb::arg("first_gameweek"),
           nb::arg("last_gameweek"));

  // Search
  nb::class_<hc::SearchConfig>(m, "SearchConfig")
      .def(nb::init<>())
      .def_rw("weights", &hc::SearchConfig::weights)
      .def_rw("optimizer", &hc::SearchConfig::optimizer)
      .def_rw("n_threads", &hc::SearchConfig::n_threads)
      .def_rw("verbose", &hc::SearchConfig::verbose);

  nb::class_<hc::WeightOutcome>(m, "WeightOutcome")
      .def_ro("weight", &hc::WeightOutcome::weight)
      .def_ro("status", &hc::WeightOutcome::status)
      .def_ro("error", &hc::WeightOutcome::error)
      .def_ro("squad", &hc::WeightOutcome::squad)
      .def_ro("best_total_points", &hc::WeightOutcome::best_total_points)
      .def_ro("best_season", &hc::WeightOutcome::best_season)
      .def_ro("orders_evaluated", &hc::WeightOutcome::orders_evaluated);

  nb::class_<hc::CaptaincyOutcome>(m, "CaptaincyOutcome")
      .def_ro("captain", &hc::CaptaincyOutcome::captain)
      .def_ro("vice_captain", &hc::CaptaincyOutcome::vice_captain)
      .def_ro("total_points", &hc::CaptaincyOutcome::total_points)
      .def_ro("season", &hc::CaptaincyOutcome::season)
      .def_ro("pairs_evaluated", &hc::CaptaincyOutcome::pairs_evaluated)
      .def_ro("errors", &hc::CaptaincyOutcome::errors);

  nb::class_<hc::SearchResult>(m, "SearchResult")
      .def_ro("per_weight", &hc::SearchResult::per_weight)
      .def_ro("found", &hc::SearchResult::found)
      .def_ro("weight", &hc::SearchResult::weight)
      .def_ro("squad", &hc::SearchResult::squad)
      .def_ro("phase1_total_points", &hc::SearchResult::phase1_total_points)
      .def_ro("total_points", &hc::SearchResult::total_points)
      .def_ro("season", &hc::SearchResult::season)
      .def_ro("error", &hc::SearchResult::error);

  nb::class_<hc::SearchOrchestrator>(m, "SearchOrchestrator")
      .def(nb::init<const hc::PlayerRegistry &, int, hc::SearchConfig>(),
           nb::arg("registry"), nb::arg("last_completed_gameweek"),
           nb::arg("config") = hc::SearchConfig{}, nb::keep_alive<1, 2>())
      .def(
          "baseline",
          [](const hc::SearchOrchestrator &s, double weight, StopToken *stop) {
            return s.baseline(weight, flag_of(stop));
          },
          nb::arg("weight") = 0.15, nb::arg("stop") = nb::none(),
          nb::call_guard<nb::gil_scoped_release>())
      .def(
          "evaluate_weight",
          [](const hc::SearchOrchestrator &s, double weight, StopToken *stop) {
            return s.evaluate_weight(weight, flag_of(stop));
          },
          nb::arg("weight"), nb::arg("stop") = nb::none(),
          nb::call_guard<nb::gil_scoped_release>())
      .def("best_captaincy", &hc::SearchOrchestrator::best_captaincy,
           nb::call_guard<nb::gil_scoped_release>())
      .def("finish", &hc::SearchOrchestrator::finish, nb::arg("per_weight"),
           nb::call_guard<nb::gil_scoped_release>())
      .def(
          "run",
          [](const hc::SearchOrchestrator &s, StopToken *stop) {
            return s.run(flag_of(stop));
          },
          nb::arg("stop") = nb::none(),
          nb::call_guard<nb::gil_scoped_release>());

  // Report
  nb::class_<hc::SquadRow>(m, "SquadRow")
      .def_ro("id", &hc::SquadRow::id)
      .def_ro("name", &hc::SquadRow::name)
      .def_ro("position", &hc::SquadRow::position)
      .def_ro("club", &hc::SquadRow::club)
      .def_ro("cost", &hc::SquadRow::cost)
      .def_ro("season_points", &hc::SquadRow::season_points)
      .def_ro("in_lineup", &hc::SquadRow::in_lineup)
      .def_ro("on_bench", &hc::SquadRow::on_bench)
      .def_ro("is_captain", &hc::SquadRow::is_captain)
      .def_ro("is_vice_captain", &hc::SquadRow::is_vice_captain);

  m.def("squad_table", &hc::squad_table);
  m.def("order_by_position", &hc::order_by_position);
  m.def("format_cost", &hc::format_cost);
  m.def("format_lineup", &hc::format_lineup);
  m.def("default_weight_grid", &hc::default_weight_grid);
}
