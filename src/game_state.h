// Copyright 2022 Ola Rozenfeld
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef SRC_GAME_STATE_H_
#define SRC_GAME_STATE_H_

#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "absl/strings/str_format.h"
#include "absl/types/span.h"
#include "src/agent.h"
#include "src/game_log.pb.h"
#include "src/knowledge.h"
#include "src/recorder.h"
#include "src/roles.h"
#include "src/util.h"

namespace tabletalk {

using std::map;
using std::ostream;
using std::string;
using std::vector;

// In-game current time. Games with a private phase start with Night 1, after
// which Day x follows Night x, and is followed by Night x + 1. Games without
// one go from Day x straight to Day x + 1.
struct Time {
  bool is_day = true;
  int count = 0;
  operator string() const {
    return absl::StrFormat("%s_%d", is_day ? "day" : "night", count);
  }
  // Night x is followed by Day x, and Day x by Night x + 1.
  Time& operator++() {
    if (is_day) {
      ++count;
    }
    is_day = !is_day;
    return *this;
  }
  static Time Day(int day) { return {.is_day = true, .count = day}; }
  static Time Night(int night) { return {.is_day = false, .count = night}; }
};

ostream& operator<<(ostream& os, const Time& t);
bool operator==(const Time& l, const Time& r);

struct Player {
  string name;
  string model;
  Role role = ROLE_UNSPECIFIED;
  bool alive = true;
  bool ability_used = false;  // For one-shot abilities.
  int master = kNoPlayer;  // Whose approving ballot a proxy voter mirrors.
};

// A terminal game result. Once set on a GameState it never changes.
struct Winner {
  Team team = TEAM_UNSPECIFIED;
  vector<string> players;  // Individual winners, for free-for-all games.
  bool forced = false;  // Declared by the round or time limit fallback.
  string reason;
};

// Cumulative public counters. Each game only moves the ones it uses.
struct Tallies {
  int liberal_policies = 0;
  int fascist_policies = 0;
  int completed_missions = 0;
  int failed_missions = 0;
  int accusations = 0;
  int executions = 0;
};

// The full engine state of one game, from the Storyteller's perspective.
// Every mutation is sent to the recorder right after it is applied.
class GameState {
 public:
  // Roles are already validated against the setup table.
  GameState(GameKind kind, absl::Span<const PlayerConfig> players,
            absl::Span<const Role> roles, uint64_t seed, Recorder* recorder);

  GameKind Kind() const { return kind_; }

  // Roster.
  int NumPlayers() const { return players_.size(); }
  const Player& GetPlayer(int player) const;
  Player& MutablePlayer(int player);
  string PlayerName(int player) const;
  int PlayerIndex(const string& name) const;  // Dies on unknown names.
  int FindPlayer(const string& name) const;  // kNoPlayer on unknown names.
  vector<string> PlayerNames(absl::Span<const int> players) const;
  vector<string> AllNames() const;
  Role GetRole(int player) const { return GetPlayer(player).role; }
  Team GetTeam(int player) const { return TeamOf(GetRole(player)); }
  vector<Role> Roles() const;

  // Alive state.
  bool IsAlive(int player) const { return GetPlayer(player).alive; }
  int NumAlive() const;
  int NumAliveOnTeam(Team team) const;
  vector<int> AlivePlayers() const;
  vector<int> AlivePlayersExcept(int player) const;
  vector<string> AliveNames() const { return PlayerNames(AlivePlayers()); }
  vector<int> AlivePlayersWithRole(Role role) const;
  // The closest alive players clockwise and anti-clockwise.
  vector<int> AliveNeighbors(int player) const;
  // The next alive player clockwise from `player` (exclusive).
  int NextAlive(int player) const;

  // Phases.
  const Time& CurrentTime() const { return cur_time_; }
  int Round() const { return cur_time_.count; }
  void StartNight();
  void StartDay();

  // Mutations.
  void Kill(int player, DeathCause cause);
  // The player executed by public vote on the given day, if any.
  int ExecutionOnDay(int day) const;
  // Players that died during the given night.
  vector<int> DeathsAtNight(int night) const;
  const HiddenFact& AddFact(int owner, const string& text, bool reliable,
                            Role source);
  void AddTableTalk(int speaker, const string& text);
  // The current phase's last `last_k` table talk lines, as "Name: text".
  vector<string> RecentTableTalk(int last_k) const;
  Tallies& MutableTallies() { return tallies_; }
  const Tallies& GetTallies() const { return tallies_; }
  void SetRedHerring(int player) { red_herring_ = player; }
  int RedHerring() const { return red_herring_; }
  void Record(const Event& event) const { RecordOrWarn(recorder_, event); }

  const KnowledgeStore& Knowledge() const { return knowledge_; }

  // Terminal state.
  bool IsGameOver() const { return winner_.has_value(); }
  const std::optional<Winner>& GetWinner() const { return winner_; }
  void SetWinner(const Winner& winner);

  // A request carrying the player's private context. kNoPlayer addresses the
  // arbiter.
  DecisionRequest NewRequest(int player, DecisionKind kind,
                             vector<string> options,
                             const string& public_state) const;

 private:
  GameKind kind_;
  vector<Player> players_;
  map<string, int> player_index_;
  Time cur_time_;
  KnowledgeStore knowledge_;
  Tallies tallies_;
  map<int, int> executions_;  // Day -> executed player.
  map<int, vector<int>> night_deaths_;
  map<string, vector<string>> table_talk_;  // By phase.
  int red_herring_ = kNoPlayer;
  std::optional<Winner> winner_;
  Recorder* recorder_;
};
}  // namespace tabletalk

#endif  // SRC_GAME_STATE_H_
