#include "hindsight_core/gameweek.hpp"

#include <array>
#include <stdexcept>

#include <fmt/format.h>

namespace hindsight_core {

GameweekScorer::GameweekScorer(const PlayerRegistry &registry,
                               int last_completed_gameweek,
                               SubstitutionFloors floors)
    : registry_(&registry), last_completed_(last_completed_gameweek),
      floors_(floors) {
  if (last_completed_ < 0 || last_completed_ > registry.n_gameweeks()) {
    throw std::invalid_argument(fmt::format(
        "GameweekScorer: last completed gameweek {} outside [0, {}]",
        last_completed_, registry.n_gameweeks()));
  }
}

GameweekResult GameweekScorer::score(const Squad &squad, int gameweek) const {
  if (gameweek < 1) {
    throw std::invalid_argument(
        fmt::format("GameweekScorer: invalid gameweek {}", gameweek));
  }
  GameweekResult res;
  res.gameweek = gameweek;
  // Not played yet
  if (gameweek > last_completed_)
    return res;

  // Starters who featured, per position; substitutes are added as they come on
  std::array<int, kNumPositions> surviving{0, 0, 0, 0};
  std::vector<const Player *> not_played;
  for (const auto id : squad.lineup) {
    const Player &p = registry_->get(id);
    if (p.featured(gameweek)) {
      res.points += p.points_in(gameweek);
      ++surviving[static_cast<int>(p.position)];
    } else {
      not_played.push_back(&p);
    }
  }

  // The lineup pass already counted the armband holder once
  const Player &captain = registry_->get(squad.captain);
  const Player &vice = registry_->get(squad.vice_captain);
  if (captain.featured(gameweek)) {
    res.points += captain.points_in(gameweek);
    res.did_captain_play = true;
  } else if (vice.featured(gameweek)) {
    res.points += vice.points_in(gameweek);
    res.vice_play_in_captains_place = true;
  }

  bool keeper_available = true;
  std::array<bool, 3> consumed{false, false, false};

  auto floor_for = [&](Position pos) {
    switch (pos) {
    case Position::DEF:
      return floors_.def;
    case Position::MID:
      return floors_.mid;
    default:
      return floors_.fwd;
    }
  };

  // First unused bench player who featured, optionally restricted to a position
  auto take_bench = [&](Position pos, bool any_position) -> const Player * {
    for (std::size_t k = 0; k < squad.bench_outfield.size(); ++k) {
      if (consumed[k])
        continue;
      const Player &b = registry_->get(squad.bench_outfield[k]);
      if (!b.featured(gameweek))
        continue;
      if (!any_position && b.position != pos)
        continue;
      consumed[k] = true;
      return &b;
    }
    return nullptr;
  };

  for (const Player *p : not_played) {
    if (p->position == Position::GK) {
      if (!keeper_available)
        continue;
      keeper_available = false;
      const Player &keeper = registry_->get(squad.bench_goalkeeper);
      if (keeper.featured(gameweek))
        res.points += keeper.points_in(gameweek);
      res.subs_made.push_back({p->id, keeper.id});
      continue;
    }

    const int pos = static_cast<int>(p->position);
    const bool like_for_like = surviving[pos] <= floor_for(p->position);
    const Player *sub = take_bench(p->position, !like_for_like);
    if (sub == nullptr)
      continue; // bench exhausted for this player, scores 0
    ++surviving[static_cast<int>(sub->position)];
    res.points += sub->points_in(gameweek);
    res.subs_made.push_back({p->id, sub->id});
  }
  return res;
}

} // namespace hindsight_core
