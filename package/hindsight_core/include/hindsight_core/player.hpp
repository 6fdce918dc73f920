#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <Eigen/Dense>

namespace hindsight_core {

enum class Position { GK = 0, DEF = 1, MID = 2, FWD = 3 };

inline constexpr int kNumPositions = 4;

// Provider element types: 1=GK, 2=DEF, 3=MID, 4=FWD
Position position_from_code(int code);
Position position_from_string(const std::string &name);
std::string position_name(Position pos);

struct Player {
  // Data members
  std::int64_t id{0};
  std::string name;
  Position position{Position::GK};
  std::string club;
  int cost{0}; // start-of-season cost in tenths of a million
  // Indexed by gameweek - 1
  Eigen::VectorXi points;
  Eigen::VectorXi minutes;

  // Default constructor
  Player() = default;
  // Constructor with parameters
  Player(std::int64_t id_, std::string name_, Position position_,
         std::string club_, int cost_, Eigen::VectorXi points_,
         Eigen::VectorXi minutes_)
      : id(id_), name(std::move(name_)), position(position_),
        club(std::move(club_)), cost(cost_), points(std::move(points_)),
        minutes(std::move(minutes_)) {}

  bool featured(int gameweek) const { return minutes[gameweek - 1] > 0; }
  int points_in(int gameweek) const { return points[gameweek - 1]; }
};

class PlayerRegistry {
public:
  PlayerRegistry() = default;
  PlayerRegistry(int n_gameweeks, int last_completed_gameweek);

  // Throws std::invalid_argument on a duplicate id or malformed record
  void add_player(const Player &p);

  std::size_t size() const { return players_.size(); }
  int n_gameweeks() const { return n_gameweeks_; }
  int last_completed_gameweek() const { return last_completed_; }

  // Requested end of range limited to what has actually been played
  int clamp_gameweek(int requested) const {
    return requested > last_completed_ ? last_completed_ : requested;
  }

  bool has_id(const std::int64_t &id) const {
    return id_index_.find(id) != id_index_.end();
  }

  std::size_t index_of(const std::int64_t &id) const {
    auto it = id_index_.find(id);
    if (it == id_index_.end()) {
      throw std::out_of_range("Player id not found");
    }
    return it->second;
  }

  const Player &get(const std::int64_t &id) const {
    return players_[index_of(id)];
  }

  const Player &at(std::size_t idx) const { return players_.at(idx); }

  // Sum of points over gameweeks [1, last_completed_gameweek]
  int season_points(const std::int64_t &id) const;

  const std::vector<Player> &players() const { return players_; }

private:
  int n_gameweeks_{0};
  int last_completed_{0};
  std::vector<Player> players_;
  std::unordered_map<std::int64_t, std::size_t> id_index_;
};

} // namespace hindsight_core
