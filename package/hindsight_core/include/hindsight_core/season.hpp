#pragma once

#include <vector>

#include "hindsight_core/gameweek.hpp"
#include "hindsight_core/player.hpp"
#include "hindsight_core/squad.hpp"

namespace hindsight_core {

struct SeasonResult {
  std::vector<GameweekResult> gameweeks; // ascending gameweek order
  int total_points{0};
};

class SeasonSimulator {
public:
  SeasonSimulator(const PlayerRegistry &registry, int last_completed_gameweek)
      : scorer_(registry, last_completed_gameweek) {}

  // Gameweeks [1, last_completed_gameweek]
  SeasonResult run(const Squad &squad) const {
    return run(squad, 1, scorer_.last_completed_gameweek());
  }

  // Any range; gameweeks past the completed one contribute zero
  SeasonResult run(const Squad &squad, int first_gameweek,
                   int last_gameweek) const;

  int last_completed_gameweek() const {
    return scorer_.last_completed_gameweek();
  }

private:
  GameweekScorer scorer_;
};

} // namespace hindsight_core
