#include "hindsight_core/report.hpp"

#include <algorithm>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace hindsight_core {

Squad order_by_position(const Squad &squad, const PlayerRegistry &registry) {
  Squad out = squad;
  std::stable_sort(out.lineup.begin(), out.lineup.end(),
                   [&](std::int64_t a, std::int64_t b) {
                     return registry.get(a).position < registry.get(b).position;
                   });
  return out;
}

std::vector<SquadRow> squad_table(const Squad &squad,
                                  const PlayerRegistry &registry) {
  const Squad ordered = order_by_position(squad, registry);
  std::vector<SquadRow> rows;
  rows.reserve(ordered.lineup.size() + 4);

  auto make_row = [&](std::int64_t id, bool in_lineup) {
    const Player &p = registry.get(id);
    SquadRow r;
    r.id = p.id;
    r.name = p.name;
    r.position = p.position;
    r.club = p.club;
    r.cost = p.cost;
    r.season_points = registry.season_points(id);
    r.in_lineup = in_lineup;
    r.on_bench = !in_lineup;
    r.is_captain = id == ordered.captain;
    r.is_vice_captain = id == ordered.vice_captain;
    return r;
  };

  for (const auto id : ordered.lineup)
    rows.push_back(make_row(id, true));
  for (const auto id : ordered.bench())
    rows.push_back(make_row(id, false));
  return rows;
}

std::string format_cost(int tenths) {
  const char *sign = tenths < 0 ? "-" : "";
  const int v = tenths < 0 ? -tenths : tenths;
  return fmt::format("{}£{}.{}m", sign, v / 10, v % 10);
}

std::string format_lineup(const Squad &squad, const PlayerRegistry &registry) {
  std::vector<std::vector<std::string>> by_pos(kNumPositions);
  for (const auto id : squad.lineup) {
    const Player &p = registry.get(id);
    by_pos[static_cast<int>(p.position)].push_back(p.name);
  }
  std::vector<std::string> bench;
  for (const auto id : squad.bench())
    bench.push_back(registry.get(id).name);

  std::string out;
  out += fmt::format("Starting goalkeeper: {}\n", fmt::join(by_pos[0], ", "));
  out += fmt::format("Starting defenders: {}\n", fmt::join(by_pos[1], ", "));
  out += fmt::format("Starting midfielders: {}\n", fmt::join(by_pos[2], ", "));
  out += fmt::format("Starting forwards: {}\n", fmt::join(by_pos[3], ", "));
  out += fmt::format("Bench: {}\n", fmt::join(bench, ", "));
  out += fmt::format("Captain: {} | Vice captain: {}\n",
                     registry.get(squad.captain).name,
                     registry.get(squad.vice_captain).name);
  out += fmt::format("Budget spent: {}\n",
                     format_cost(squad_cost(squad, registry)));
  return out;
}

} // namespace hindsight_core
