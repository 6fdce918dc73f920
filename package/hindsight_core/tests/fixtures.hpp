#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "hindsight_core/player.hpp"
#include "hindsight_core/squad.hpp"

namespace fixtures {

using hindsight_core::Player;
using hindsight_core::PlayerRegistry;
using hindsight_core::Position;
using hindsight_core::Squad;

struct PlayerSpec {
  std::int64_t id{0};
  Position position{Position::GK};
  std::string club;
  int cost{50};
  std::vector<int> points;
  std::vector<int> minutes;

  void set(int gameweek, int pts, int mins) {
    points[gameweek - 1] = pts;
    minutes[gameweek - 1] = mins;
  }
};

inline Eigen::VectorXi to_vector(const std::vector<int> &v) {
  Eigen::VectorXi out(static_cast<int>(v.size()));
  for (std::size_t i = 0; i < v.size(); ++i)
    out[static_cast<int>(i)] = v[i];
  return out;
}

inline PlayerRegistry build_registry(const std::vector<PlayerSpec> &specs,
                                     int n_gameweeks, int last_completed) {
  PlayerRegistry reg(n_gameweeks, last_completed);
  for (const auto &s : specs) {
    reg.add_player(Player(s.id, "P" + std::to_string(s.id), s.position,
                          s.club, s.cost, to_vector(s.points),
                          to_vector(s.minutes)));
  }
  return reg;
}

// Fifteen players for the hand-built squad below. Lineup is 3-4-3:
//   GK 1 | DEF 2 3 4 | MID 5 6 7 8 | FWD 9 10 11
//   bench: GK 12, then MID 13, DEF 14, DEF 15
// Everyone plays 90 minutes and scores their own id in every gameweek.
inline std::vector<PlayerSpec> squad_specs(int n_gameweeks = 1) {
  const Position pos[15] = {
      Position::GK,  Position::DEF, Position::DEF, Position::DEF,
      Position::MID, Position::MID, Position::MID, Position::MID,
      Position::FWD, Position::FWD, Position::FWD, Position::GK,
      Position::MID, Position::DEF, Position::DEF};
  std::vector<PlayerSpec> specs;
  for (int i = 0; i < 15; ++i) {
    PlayerSpec s;
    s.id = i + 1;
    s.position = pos[i];
    s.club = "club" + std::to_string(i % 5);
    s.cost = 60;
    s.points.assign(static_cast<std::size_t>(n_gameweeks), i + 1);
    s.minutes.assign(static_cast<std::size_t>(n_gameweeks), 90);
    specs.push_back(s);
  }
  return specs;
}

inline Squad fixed_squad() {
  Squad s;
  s.lineup = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11};
  s.bench_goalkeeper = 12;
  s.bench_outfield = {13, 14, 15};
  s.captain = 9;
  s.vice_captain = 5;
  return s;
}

// Small random universe: 3 GK, 6 DEF, 6 MID, 5 FWD. Costs stay low enough
// that any legal squad fits the default budget. A player who did not feature
// scores 0 that gameweek.
inline std::vector<PlayerSpec> random_universe(unsigned seed, int n_gameweeks,
                                               int max_cost = 66) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> pts(-1, 12);
  std::uniform_int_distribution<int> cost(40, max_cost);
  std::bernoulli_distribution plays(0.7);

  const int counts[4] = {3, 6, 6, 5};
  std::vector<PlayerSpec> specs;
  std::int64_t next_id = 100;
  for (int p = 0; p < 4; ++p) {
    for (int k = 0; k < counts[p]; ++k) {
      PlayerSpec s;
      s.id = next_id++;
      s.position = static_cast<Position>(p);
      s.club = "club" + std::to_string(specs.size() % 7);
      s.cost = cost(rng);
      for (int gw = 0; gw < n_gameweeks; ++gw) {
        const bool featured = plays(rng);
        s.minutes.push_back(featured ? 90 : 0);
        s.points.push_back(featured ? pts(rng) : 0);
      }
      specs.push_back(s);
    }
  }
  return specs;
}

} // namespace fixtures
