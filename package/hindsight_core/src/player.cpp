#include "hindsight_core/player.hpp"

#include <fmt/format.h>

namespace hindsight_core {

Position position_from_code(int code) {
  switch (code) {
  case 1:
    return Position::GK;
  case 2:
    return Position::DEF;
  case 3:
    return Position::MID;
  case 4:
    return Position::FWD;
  default:
    throw std::invalid_argument(
        fmt::format("Unknown position code {}", code));
  }
}

Position position_from_string(const std::string &name) {
  if (name == "GK" || name == "GKP")
    return Position::GK;
  if (name == "DEF")
    return Position::DEF;
  if (name == "MID")
    return Position::MID;
  if (name == "FWD")
    return Position::FWD;
  throw std::invalid_argument(fmt::format("Unknown position '{}'", name));
}

std::string position_name(Position pos) {
  switch (pos) {
  case Position::GK:
    return "GK";
  case Position::DEF:
    return "DEF";
  case Position::MID:
    return "MID";
  case Position::FWD:
    return "FWD";
  }
  return "?";
}

PlayerRegistry::PlayerRegistry(int n_gameweeks, int last_completed_gameweek)
    : n_gameweeks_(n_gameweeks), last_completed_(last_completed_gameweek) {
  if (n_gameweeks_ < 0) {
    throw std::invalid_argument("PlayerRegistry: negative gameweek count");
  }
  if (last_completed_ < 0 || last_completed_ > n_gameweeks_) {
    throw std::invalid_argument(fmt::format(
        "PlayerRegistry: last completed gameweek {} outside [0, {}]",
        last_completed_, n_gameweeks_));
  }
}

void PlayerRegistry::add_player(const Player &p) {
  if (has_id(p.id)) {
    throw std::invalid_argument(
        fmt::format("PlayerRegistry: duplicate player id {}", p.id));
  }
  if (p.cost < 0) {
    throw std::invalid_argument(
        fmt::format("PlayerRegistry: player {} has negative cost", p.id));
  }
  if (p.points.size() != n_gameweeks_ || p.minutes.size() != n_gameweeks_) {
    throw std::invalid_argument(fmt::format(
        "PlayerRegistry: player {} needs {} gameweeks of points and minutes, "
        "got {} and {}",
        p.id, n_gameweeks_, p.points.size(), p.minutes.size()));
  }
  if (n_gameweeks_ > 0 && p.minutes.minCoeff() < 0) {
    throw std::invalid_argument(
        fmt::format("PlayerRegistry: player {} has negative minutes", p.id));
  }
  const std::size_t idx = players_.size();
  players_.push_back(p);
  id_index_[p.id] = idx;
}

int PlayerRegistry::season_points(const std::int64_t &id) const {
  const Player &p = get(id);
  if (last_completed_ == 0)
    return 0;
  return p.points.head(last_completed_).sum();
}

} // namespace hindsight_core
