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

#include "src/game_state.h"

#include <algorithm>
#include <utility>

#include "ortools/base/logging.h"

namespace tabletalk {

ostream& operator<<(ostream& os, const Time& t) {
  os << string(t);
  return os;
}
bool operator==(const Time& l, const Time& r) {
  return l.is_day == r.is_day && l.count == r.count;
}

GameState::GameState(GameKind kind, absl::Span<const PlayerConfig> players,
                     absl::Span<const Role> roles, uint64_t seed,
                     Recorder* recorder)
    : kind_(kind), knowledge_(players.size()), recorder_(recorder) {
  CHECK_EQ(players.size(), roles.size())
      << "Every player needs exactly one role";
  Event event;
  GameStart* start = event.mutable_game_start();
  start->set_kind(kind);
  start->set_seed(seed);
  for (int i = 0; i < players.size(); ++i) {
    const string& name = players[i].name();
    CHECK(player_index_.emplace(name, i).second)
        << "Duplicate player name " << name;
    CHECK_EQ(GameOf(roles[i]), kind)
        << RoleName(roles[i]) << " is not a role of " << GameKind_Name(kind);
    players_.push_back({.name = name, .model = players[i].model(),
                        .role = roles[i]});
    PlayerRecord* record = start->add_players();
    record->set_name(name);
    record->set_model(players[i].model());
    record->set_role(roles[i]);
    record->set_team(TeamOf(roles[i]));
  }
  Record(event);
}

const Player& GameState::GetPlayer(int player) const {
  CHECK(player >= 0 && player < players_.size())
      << "Invalid player index " << player;
  return players_[player];
}

Player& GameState::MutablePlayer(int player) {
  CHECK(player >= 0 && player < players_.size())
      << "Invalid player index " << player;
  return players_[player];
}

string GameState::PlayerName(int player) const {
  return player == kNoPlayer ? "" : GetPlayer(player).name;
}

int GameState::PlayerIndex(const string& name) const {
  const auto& it = player_index_.find(name);
  CHECK(it != player_index_.end()) << "Invalid player name: " << name;
  return it->second;
}

int GameState::FindPlayer(const string& name) const {
  const auto& it = player_index_.find(name);
  return it == player_index_.end() ? kNoPlayer : it->second;
}

vector<string> GameState::PlayerNames(absl::Span<const int> players) const {
  vector<string> names;
  for (int player : players) {
    names.push_back(PlayerName(player));
  }
  return names;
}

vector<string> GameState::AllNames() const {
  vector<string> names;
  for (const Player& p : players_) {
    names.push_back(p.name);
  }
  return names;
}

vector<Role> GameState::Roles() const {
  vector<Role> roles;
  for (const Player& p : players_) {
    roles.push_back(p.role);
  }
  return roles;
}

int GameState::NumAlive() const {
  return std::count_if(players_.begin(), players_.end(),
                       [](const Player& p) { return p.alive; });
}

int GameState::NumAliveOnTeam(Team team) const {
  return std::count_if(players_.begin(), players_.end(),
                       [team](const Player& p) {
                         return p.alive && TeamOf(p.role) == team;
                       });
}

vector<int> GameState::AlivePlayers() const {
  return AlivePlayersExcept(kNoPlayer);
}

vector<int> GameState::AlivePlayersExcept(int player) const {
  vector<int> result;
  for (int i = 0; i < players_.size(); ++i) {
    if (players_[i].alive && i != player) {
      result.push_back(i);
    }
  }
  return result;
}

vector<int> GameState::AlivePlayersWithRole(Role role) const {
  vector<int> result;
  for (int i = 0; i < players_.size(); ++i) {
    if (players_[i].alive && players_[i].role == role) {
      result.push_back(i);
    }
  }
  return result;
}

vector<int> GameState::AliveNeighbors(int player) const {
  const int num_players = players_.size();
  vector<int> result;
  int i = (player + 1) % num_players;
  while (i != player && !IsAlive(i)) {
    i = (i + 1) % num_players;
  }
  if (i == player) {
    return result;  // Nobody else is alive.
  }
  result.push_back(i);
  int j = (player + num_players - 1) % num_players;
  while (!IsAlive(j)) {
    j = (j + num_players - 1) % num_players;
  }
  if (j != i) {
    result.push_back(j);
  }
  return result;
}

int GameState::NextAlive(int player) const {
  const int num_players = players_.size();
  for (int k = 1; k <= num_players; ++k) {
    const int i = (player + k) % num_players;
    if (players_[i].alive) {
      return i;
    }
  }
  return kNoPlayer;
}

void GameState::StartNight() {
  CHECK(cur_time_.is_day) << cur_time_ << " cannot be followed by a night";
  ++cur_time_;
  Event event;
  event.mutable_phase()->set_is_day(false);
  event.mutable_phase()->set_count(cur_time_.count);
  Record(event);
}

void GameState::StartDay() {
  if (cur_time_.is_day) {
    cur_time_ = Time::Day(cur_time_.count + 1);
  } else {
    ++cur_time_;
  }
  Event event;
  event.mutable_phase()->set_is_day(true);
  event.mutable_phase()->set_count(cur_time_.count);
  Record(event);
}

void GameState::Kill(int player, DeathCause cause) {
  Player& p = MutablePlayer(player);
  CHECK(p.alive) << p.name << " is already dead";
  p.alive = false;
  if (cause == EXECUTED) {
    CHECK(cur_time_.is_day) << "Executions only happen during the day";
    CHECK(!executions_.contains(cur_time_.count))
        << "Only one execution per day";
    executions_[cur_time_.count] = player;
    tallies_.executions++;
  }
  if (!cur_time_.is_day) {
    night_deaths_[cur_time_.count].push_back(player);
  }
  Event event;
  Elimination* elimination = event.mutable_elimination();
  elimination->set_player(p.name);
  elimination->set_role(p.role);
  elimination->set_cause(cause);
  Record(event);
}

int GameState::ExecutionOnDay(int day) const {
  const auto& it = executions_.find(day);
  return it == executions_.end() ? kNoPlayer : it->second;
}

vector<int> GameState::DeathsAtNight(int night) const {
  const auto& it = night_deaths_.find(night);
  return it == night_deaths_.end() ? vector<int>() : it->second;
}

const HiddenFact& GameState::AddFact(int owner, const string& text,
                                     bool reliable, Role source) {
  HiddenFact fact;
  fact.set_owner(PlayerName(owner));
  fact.set_time(string(cur_time_));
  fact.set_text(text);
  fact.set_reliable(reliable);
  fact.set_source(source);
  Event event;
  *event.mutable_hidden_fact() = fact;
  const HiddenFact& added = knowledge_.Add(owner, fact);
  Record(event);
  return added;
}

void GameState::AddTableTalk(int speaker, const string& text) {
  CHECK(IsAlive(speaker)) << "Dead players do not talk";
  table_talk_[string(cur_time_)].push_back(
      absl::StrFormat("%s: %s", PlayerName(speaker), text));
  Event event;
  event.mutable_table_talk()->set_speaker(PlayerName(speaker));
  event.mutable_table_talk()->set_text(text);
  Record(event);
}

vector<string> GameState::RecentTableTalk(int last_k) const {
  const auto& it = table_talk_.find(string(cur_time_));
  if (it == table_talk_.end()) {
    return {};
  }
  const vector<string>& lines = it->second;
  const int start = std::max<int>(0, lines.size() - last_k);
  return vector<string>(lines.begin() + start, lines.end());
}

void GameState::SetWinner(const Winner& winner) {
  CHECK_NE(winner.team, TEAM_UNSPECIFIED) << "Victory needs a team";
  CHECK(!winner_.has_value())
      << TeamName(winner_->team) << " have already won.";
  winner_ = winner;
  Event event;
  Victory* victory = event.mutable_victory();
  victory->set_team(winner.team);
  for (const string& name : winner.players) {
    victory->add_winners(name);
  }
  victory->set_forced(winner.forced);
  victory->set_reason(winner.reason);
  Record(event);
}

DecisionRequest GameState::NewRequest(int player, DecisionKind kind,
                                      vector<string> options,
                                      const string& public_state) const {
  DecisionRequest request;
  request.kind = kind;
  request.player = player;
  request.options = std::move(options);
  request.public_state = public_state;
  if (player == kNoPlayer) {
    request.player_name = "arbiter";
    return request;
  }
  request.player_name = PlayerName(player);
  request.role = GetRole(player);
  request.private_facts = knowledge_.FactTexts(player);
  return request;
}
}  // namespace tabletalk
