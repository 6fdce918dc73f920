#include <catch2/catch.hpp>

#include <stdexcept>

#include "fixtures.hpp"
#include "hindsight_core/gameweek.hpp"
#include "hindsight_core/season.hpp"

using namespace hindsight_core;

namespace {

// Sum of ids 1..11, every starter scoring its own id
constexpr int kLineupPoints = 66;

GameweekResult score_one(const std::vector<fixtures::PlayerSpec> &specs,
                         const Squad &squad = fixtures::fixed_squad()) {
  PlayerRegistry reg = fixtures::build_registry(specs, 1, 1);
  GameweekScorer scorer(reg, 1);
  return scorer.score(squad, 1);
}

} // namespace

TEST_CASE("Full lineup doubles the captain and makes no substitutions",
          "[gameweek]") {
  const GameweekResult r = score_one(fixtures::squad_specs());
  REQUIRE(r.gameweek == 1);
  REQUIRE(r.points == kLineupPoints + 9);
  REQUIRE(r.subs_made.empty());
  REQUIRE(r.did_captain_play);
  REQUIRE_FALSE(r.vice_play_in_captains_place);
}

TEST_CASE("Vice-captain takes the armband when the captain does not play",
          "[gameweek][captaincy]") {
  auto specs = fixtures::squad_specs();
  specs[8].set(1, 0, 0); // captain, FWD 9

  const GameweekResult r = score_one(specs);
  REQUIRE_FALSE(r.did_captain_play);
  REQUIRE(r.vice_play_in_captains_place);
  // Two forwards still start, so the first bench player (MID 13) comes on
  REQUIRE(r.subs_made.size() == 1);
  REQUIRE(r.subs_made[0] == Substitution{9, 13});
  REQUIRE(r.points == kLineupPoints - 9 + 5 + 13);
}

TEST_CASE("No captaincy bonus when captain and vice both miss out",
          "[gameweek][captaincy]") {
  auto specs = fixtures::squad_specs();
  specs[8].set(1, 0, 0); // captain
  specs[4].set(1, 0, 0); // vice, MID 5

  const GameweekResult r = score_one(specs);
  REQUIRE_FALSE(r.did_captain_play);
  REQUIRE_FALSE(r.vice_play_in_captains_place);
  // MID 5 goes out with three midfielders left: any position, bench MID 13.
  // FWD 9 then gets the next one, DEF 14.
  REQUIRE(r.subs_made.size() == 2);
  REQUIRE(r.subs_made[0] == Substitution{5, 13});
  REQUIRE(r.subs_made[1] == Substitution{9, 14});
  REQUIRE(r.points == kLineupPoints - 9 - 5 + 13 + 14);
}

TEST_CASE("Bench goalkeeper replaces the starting goalkeeper",
          "[gameweek][substitution]") {
  auto specs = fixtures::squad_specs();
  specs[0].set(1, 0, 0);

  const GameweekResult r = score_one(specs);
  REQUIRE(r.subs_made.size() == 1);
  REQUIRE(r.subs_made[0] == Substitution{1, 12});
  REQUIRE(r.points == kLineupPoints - 1 + 12 + 9);
}

TEST_CASE("Bench goalkeeper is used even when the outfield bench is not",
          "[gameweek][substitution]") {
  auto specs = fixtures::squad_specs();
  specs[0].set(1, 0, 0);
  specs[11].set(1, 0, 0); // bench GK did not play either

  const GameweekResult r = score_one(specs);
  REQUIRE(r.subs_made.size() == 1);
  REQUIRE(r.subs_made[0] == Substitution{1, 12});
  REQUIRE(r.points == kLineupPoints - 1 + 9);
}

TEST_CASE("Defender at the floor is replaced by a bench defender",
          "[gameweek][substitution]") {
  auto specs = fixtures::squad_specs();
  specs[1].set(1, 0, 0); // DEF 2; three defenders started

  const GameweekResult r = score_one(specs);
  // MID 13 is first on the bench but DEF 14 restores the back three
  REQUIRE(r.subs_made.size() == 1);
  REQUIRE(r.subs_made[0] == Substitution{2, 14});
  REQUIRE(r.points == kLineupPoints - 2 + 14 + 9);
}

TEST_CASE("Defender count is restored after each like-for-like swap",
          "[gameweek][substitution]") {
  auto specs = fixtures::squad_specs();
  specs[1].set(1, 0, 0); // DEF 2
  specs[2].set(1, 0, 0); // DEF 3

  const GameweekResult r = score_one(specs);
  REQUIRE(r.subs_made.size() == 2);
  REQUIRE(r.subs_made[0] == Substitution{2, 14});
  REQUIRE(r.subs_made[1] == Substitution{3, 15});
  REQUIRE(r.points == kLineupPoints - 2 - 3 + 14 + 15 + 9);
}

TEST_CASE("Exhausted bench leaves the missing starter on zero",
          "[gameweek][substitution]") {
  auto specs = fixtures::squad_specs();
  specs[1].set(1, 0, 0);
  specs[2].set(1, 0, 0);
  specs[3].set(1, 0, 0);

  const GameweekResult r = score_one(specs);
  REQUIRE(r.subs_made.size() == 2);
  REQUIRE(r.subs_made[0].out == 2);
  REQUIRE(r.subs_made[1].out == 3);
  REQUIRE(r.points == kLineupPoints - 2 - 3 - 4 + 14 + 15 + 9);
}

TEST_CASE("Bench players who did not feature are skipped",
          "[gameweek][substitution]") {
  auto specs = fixtures::squad_specs();
  specs[1].set(1, 0, 0);  // DEF 2
  specs[13].set(1, 0, 0); // bench DEF 14

  const GameweekResult r = score_one(specs);
  REQUIRE(r.subs_made.size() == 1);
  REQUIRE(r.subs_made[0] == Substitution{2, 15});
}

TEST_CASE("A second forward keeps the bench open to any position",
          "[gameweek][substitution]") {
  auto specs = fixtures::squad_specs();
  specs[9].set(1, 0, 0);  // FWD 10
  specs[10].set(1, 0, 0); // FWD 11

  // FWD 9 still plays, so the bench comes on in order
  const GameweekResult r = score_one(specs);
  REQUIRE(r.subs_made.size() == 2);
  REQUIRE(r.subs_made[0] == Substitution{10, 13});
  REQUIRE(r.subs_made[1] == Substitution{11, 14});
  REQUIRE(r.points == kLineupPoints - 10 - 11 + 13 + 14 + 9);
  REQUIRE(r.points == 81);
}

TEST_CASE("A lone forward is only replaced by a forward",
          "[gameweek][substitution]") {
  auto specs = fixtures::squad_specs();
  specs[8].set(1, 0, 0); // FWD 9

  // 4-5-1 with DEF 15 ahead of the bench forwards
  Squad squad;
  squad.lineup = {1, 2, 3, 4, 14, 5, 6, 7, 8, 13, 9};
  squad.bench_goalkeeper = 12;
  squad.bench_outfield = {15, 10, 11};
  squad.captain = 13;
  squad.vice_captain = 8;

  const GameweekResult r = score_one(specs, squad);
  REQUIRE(r.subs_made.size() == 1);
  REQUIRE(r.subs_made[0] == Substitution{9, 10});
  REQUIRE(r.points == 1 + 2 + 3 + 4 + 14 + 5 + 6 + 7 + 8 + 13 + 10 + 13);
}

TEST_CASE("Above the floor any bench position may come on",
          "[gameweek][substitution]") {
  auto specs = fixtures::squad_specs();
  specs[5].set(1, 0, 0);  // MID 6, three midfielders remain
  specs[12].set(1, 0, 0); // bench MID 13 did not play

  const GameweekResult r = score_one(specs);
  REQUIRE(r.subs_made.size() == 1);
  REQUIRE(r.subs_made[0] == Substitution{6, 14});
}

TEST_CASE("Negative scores count like any other", "[gameweek]") {
  auto specs = fixtures::squad_specs();
  specs[1].set(1, -2, 90);
  specs[8].set(1, -1, 90);

  const GameweekResult r = score_one(specs);
  REQUIRE(r.subs_made.empty());
  REQUIRE(r.points == kLineupPoints - 2 - 2 - 9 - 1 - 1);
}

TEST_CASE("Scoring is a pure function of squad and gameweek data",
          "[gameweek]") {
  auto specs = fixtures::squad_specs();
  specs[0].set(1, 0, 0);
  specs[1].set(1, 0, 0);
  specs[8].set(1, 0, 0);
  PlayerRegistry reg = fixtures::build_registry(specs, 1, 1);
  GameweekScorer scorer(reg, 1);

  const Squad squad = fixtures::fixed_squad();
  const GameweekResult a = scorer.score(squad, 1);
  const GameweekResult b = scorer.score(squad, 1);
  REQUIRE(a == b);
}

TEST_CASE("Unplayed gameweeks score nothing", "[gameweek]") {
  PlayerRegistry reg =
      fixtures::build_registry(fixtures::squad_specs(38), 38, 5);
  GameweekScorer scorer(reg, 5);
  const Squad squad = fixtures::fixed_squad();

  const GameweekResult r = scorer.score(squad, 6);
  REQUIRE(r.gameweek == 6);
  REQUIRE(r.points == 0);
  REQUIRE(r.subs_made.empty());
  REQUIRE_FALSE(r.did_captain_play);

  REQUIRE_THROWS_AS(scorer.score(squad, 0), std::invalid_argument);
  REQUIRE_THROWS_AS(GameweekScorer(reg, 39), std::invalid_argument);
}

TEST_CASE("Season replay sums gameweeks in order", "[season]") {
  auto specs = fixtures::squad_specs(4);
  specs[0].set(2, 0, 0); // keeper out in gameweek 2
  PlayerRegistry reg = fixtures::build_registry(specs, 4, 3);
  SeasonSimulator sim(reg, 3);
  const Squad squad = fixtures::fixed_squad();

  const SeasonResult season = sim.run(squad);
  REQUIRE(season.gameweeks.size() == 3);
  REQUIRE(season.gameweeks[0].gameweek == 1);
  REQUIRE(season.gameweeks[2].gameweek == 3);
  REQUIRE(season.gameweeks[1].subs_made.size() == 1);
  const int full = kLineupPoints + 9;
  REQUIRE(season.total_points == full + (full - 1 + 12) + full);

  SECTION("a fixed 38-gameweek range pads with zeros") {
    const SeasonResult padded = sim.run(squad, 1, 38);
    REQUIRE(padded.gameweeks.size() == 38);
    REQUIRE(padded.total_points == season.total_points);
    REQUIRE(padded.gameweeks[37].points == 0);
  }
  SECTION("bad ranges are rejected") {
    REQUIRE_THROWS_AS(sim.run(squad, 0, 3), std::invalid_argument);
  }
  SECTION("unknown squad members are rejected") {
    Squad bad = squad;
    bad.lineup[3] = 404;
    REQUIRE_THROWS_AS(sim.run(bad), std::out_of_range);
  }
}
