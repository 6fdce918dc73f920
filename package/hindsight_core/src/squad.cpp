#include "hindsight_core/squad.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace hindsight_core {

std::vector<std::int64_t> Squad::members() const {
  std::vector<std::int64_t> out = lineup;
  const std::vector<std::int64_t> b = bench();
  out.insert(out.end(), b.begin(), b.end());
  return out;
}

std::vector<std::string> validate_squad(const Squad &squad,
                                        const PlayerRegistry &registry,
                                        const SquadRules &rules) {
  std::vector<std::string> errors;

  if (static_cast<int>(squad.lineup.size()) != rules.lineup_size) {
    errors.push_back(fmt::format("lineup has {} players, expected {}",
                                 squad.lineup.size(), rules.lineup_size));
  }

  const std::vector<std::int64_t> members = squad.members();
  std::unordered_set<std::int64_t> seen;
  for (const auto id : members) {
    if (!seen.insert(id).second) {
      errors.push_back(fmt::format("player {} appears more than once", id));
    }
  }
  for (const auto id : members) {
    if (!registry.has_id(id)) {
      // Nothing else can be checked without the records
      errors.push_back(fmt::format("player {} is not in the registry", id));
      return errors;
    }
  }

  std::array<int, kNumPositions> lineup_count{0, 0, 0, 0};
  std::array<int, kNumPositions> squad_count{0, 0, 0, 0};
  std::unordered_map<std::string, int> per_club;
  int cost = 0;
  for (const auto id : squad.lineup) {
    ++lineup_count[static_cast<int>(registry.get(id).position)];
  }
  for (const auto id : members) {
    const Player &p = registry.get(id);
    ++squad_count[static_cast<int>(p.position)];
    ++per_club[p.club];
    cost += p.cost;
  }

  for (int pos = 0; pos < kNumPositions; ++pos) {
    const std::string name = position_name(static_cast<Position>(pos));
    if (lineup_count[pos] < rules.lineup_min[pos] ||
        lineup_count[pos] > rules.lineup_max[pos]) {
      errors.push_back(fmt::format("lineup has {} {}, allowed [{}, {}]",
                                   lineup_count[pos], name,
                                   rules.lineup_min[pos],
                                   rules.lineup_max[pos]));
    }
    if (squad_count[pos] != rules.squad_count[pos]) {
      errors.push_back(fmt::format("squad has {} {}, expected {}",
                                   squad_count[pos], name,
                                   rules.squad_count[pos]));
    }
  }

  if (registry.get(squad.bench_goalkeeper).position != Position::GK) {
    errors.push_back("bench goalkeeper slot holds an outfield player");
  }
  for (const auto id : squad.bench_outfield) {
    if (registry.get(id).position == Position::GK) {
      errors.push_back(
          fmt::format("goalkeeper {} is in an outfield bench slot", id));
    }
  }

  if (cost > rules.budget) {
    errors.push_back(
        fmt::format("squad costs {} over a budget of {}", cost, rules.budget));
  }
  for (const auto &kv : per_club) {
    if (kv.second > rules.max_per_club) {
      errors.push_back(fmt::format("{} players from {}, max {}", kv.second,
                                   kv.first, rules.max_per_club));
    }
  }

  const auto in_lineup = [&](std::int64_t id) {
    return std::find(squad.lineup.begin(), squad.lineup.end(), id) !=
           squad.lineup.end();
  };
  if (!in_lineup(squad.captain)) {
    errors.push_back("captain is not in the lineup");
  }
  if (!in_lineup(squad.vice_captain)) {
    errors.push_back("vice-captain is not in the lineup");
  }
  if (squad.captain == squad.vice_captain) {
    errors.push_back("captain and vice-captain are the same player");
  }
  return errors;
}

void require_valid_squad(const Squad &squad, const PlayerRegistry &registry,
                         const SquadRules &rules) {
  const std::vector<std::string> errors =
      validate_squad(squad, registry, rules);
  if (!errors.empty()) {
    throw std::invalid_argument(
        fmt::format("Invalid squad: {}", fmt::join(errors, "; ")));
  }
}

int squad_cost(const Squad &squad, const PlayerRegistry &registry) {
  int total = 0;
  for (const auto id : squad.members())
    total += registry.get(id).cost;
  return total;
}

} // namespace hindsight_core
