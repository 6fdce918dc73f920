#include "hindsight_core/season.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace hindsight_core {

SeasonResult SeasonSimulator::run(const Squad &squad, int first_gameweek,
                                  int last_gameweek) const {
  if (first_gameweek < 1 || last_gameweek < first_gameweek - 1) {
    throw std::invalid_argument(fmt::format(
        "SeasonSimulator: invalid range [{}, {}]", first_gameweek,
        last_gameweek));
  }
  SeasonResult season;
  season.gameweeks.reserve(
      static_cast<std::size_t>(last_gameweek - first_gameweek + 1));
  for (int gw = first_gameweek; gw <= last_gameweek; ++gw) {
    GameweekResult r = scorer_.score(squad, gw);
    season.total_points += r.points;
    season.gameweeks.push_back(std::move(r));
  }
  return season;
}

} // namespace hindsight_core
