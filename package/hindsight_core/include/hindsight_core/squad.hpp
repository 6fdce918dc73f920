#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "hindsight_core/player.hpp"

namespace hindsight_core {

// Squad composition limits. Defaults are the standard 15-player game rules.
struct SquadRules {
  int lineup_size{11};
  int bench_size{4};
  int budget{1000}; // tenths of a million
  int max_per_club{3};
  // Indexed by Position
  std::array<int, kNumPositions> squad_count{2, 5, 5, 3};
  std::array<int, kNumPositions> lineup_min{1, 3, 2, 1};
  std::array<int, kNumPositions> lineup_max{1, 5, 5, 3};
};

struct Squad {
  std::vector<std::int64_t> lineup; // processed in this order for subs
  std::int64_t bench_goalkeeper{0};
  std::array<std::int64_t, 3> bench_outfield{0, 0, 0}; // substitution priority
  std::int64_t captain{0};
  std::int64_t vice_captain{0};

  std::vector<std::int64_t> bench() const {
    return {bench_goalkeeper, bench_outfield[0], bench_outfield[1],
            bench_outfield[2]};
  }
  std::vector<std::int64_t> members() const;

  Squad with_captaincy(std::int64_t captain_id, std::int64_t vice_id) const {
    Squad s = *this;
    s.captain = captain_id;
    s.vice_captain = vice_id;
    return s;
  }

  Squad with_bench_order(const std::array<std::int64_t, 3> &order) const {
    Squad s = *this;
    s.bench_outfield = order;
    return s;
  }
};

// Human-readable list of every broken composition rule; empty when valid.
std::vector<std::string> validate_squad(const Squad &squad,
                                        const PlayerRegistry &registry,
                                        const SquadRules &rules = {});

// Throws std::invalid_argument listing the violations.
void require_valid_squad(const Squad &squad, const PlayerRegistry &registry,
                         const SquadRules &rules = {});

int squad_cost(const Squad &squad, const PlayerRegistry &registry);

} // namespace hindsight_core
