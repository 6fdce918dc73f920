#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "hindsight_core/player.hpp"
#include "hindsight_core/squad.hpp"

namespace hindsight_core {

// One exported row per squad member
struct SquadRow {
  std::int64_t id{0};
  std::string name;
  Position position{Position::GK};
  std::string club;
  int cost{0};
  int season_points{0};
  bool in_lineup{false};
  bool on_bench{false};
  bool is_captain{false};
  bool is_vice_captain{false};
};

// Same squad with the lineup ordered GK, DEF, MID, FWD (stable).
Squad order_by_position(const Squad &squad, const PlayerRegistry &registry);

// Lineup by position, then bench goalkeeper, then outfield bench in order.
std::vector<SquadRow> squad_table(const Squad &squad,
                                  const PlayerRegistry &registry);

// 995 -> "£99.5m"
std::string format_cost(int tenths);

std::string format_lineup(const Squad &squad, const PlayerRegistry &registry);

} // namespace hindsight_core
