#pragma once

#include <cstdint>
#include <vector>

#include "hindsight_core/player.hpp"
#include "hindsight_core/squad.hpp"

namespace hindsight_core {

struct Substitution {
  std::int64_t out{0};
  std::int64_t in{0};

  bool operator==(const Substitution &o) const {
    return out == o.out && in == o.in;
  }
};

struct GameweekResult {
  int gameweek{0};
  int points{0};
  std::vector<Substitution> subs_made; // in the order they were applied
  bool did_captain_play{false};
  bool vice_play_in_captains_place{false};

  bool operator==(const GameweekResult &o) const {
    return gameweek == o.gameweek && points == o.points &&
           subs_made == o.subs_made && did_captain_play == o.did_captain_play &&
           vice_play_in_captains_place == o.vice_play_in_captains_place;
  }
};

// Outfield starters at or below these counts are replaced like-for-like.
// Counts exclude the player being replaced, so fwd{0} only protects a lone
// forward.
struct SubstitutionFloors {
  int def{3};
  int mid{2};
  int fwd{0};
};

// Scores one gameweek for a fixed squad, applying automatic substitutions
// and the captain/vice-captain fallback. Gameweeks after
// last_completed_gameweek score zero.
class GameweekScorer {
public:
  GameweekScorer(const PlayerRegistry &registry, int last_completed_gameweek,
                 SubstitutionFloors floors = {});

  GameweekResult score(const Squad &squad, int gameweek) const;

  int last_completed_gameweek() const { return last_completed_; }

private:
  const PlayerRegistry *registry_{nullptr};
  int last_completed_{0};
  SubstitutionFloors floors_{};
};

} // namespace hindsight_core
