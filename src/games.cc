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

#include "src/games.h"

#include <set>
#include <string>
#include <utility>

#include "absl/strings/str_format.h"
#include "src/alpha_complex.h"
#include "src/clocktower.h"
#include "src/liars_deck.h"
#include "src/mafia.h"
#include "src/secret_hitler.h"
#include "src/setup.h"
#include "src/util.h"

namespace tabletalk {

using std::string;
using std::unique_ptr;
using std::vector;

SetupTable SetupTableFor(const GameConfig& config) {
  if (config.has_setup_table()) {
    SetupTable table = config.setup_table();
    table.set_kind(config.kind());
    return table;
  }
  return DefaultSetupTable(config.kind());
}

absl::StatusOr<unique_ptr<Game>> NewGame(const GameConfig& config,
                                         vector<shared_ptr<Agent>> seats,
                                         shared_ptr<Agent> arbiter,
                                         Recorder* recorder) {
  if (!IsSupportedGame(config.kind())) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Unsupported game %s", GameKind_Name(config.kind())));
  }
  if (seats.size() != config.players_size()) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "%d agents for %d players", seats.size(), config.players_size()));
  }
  std::set<string> names;
  int num_assigned = 0;
  for (const PlayerConfig& player : config.players()) {
    if (player.name().empty()) {
      return absl::InvalidArgumentError("Player names cannot be empty");
    }
    if (!names.insert(player.name()).second) {
      return absl::InvalidArgumentError(
          absl::StrFormat("Duplicate player name %s", player.name()));
    }
    if (player.role() != ROLE_UNSPECIFIED) {
      ++num_assigned;
    }
  }
  for (const shared_ptr<Agent>& seat : seats) {
    if (seat == nullptr) {
      return absl::InvalidArgumentError("Every player needs an agent");
    }
  }
  if (config.max_rounds() < 0 || config.max_game_seconds() < 0 ||
      config.decision_timeout_ms() < 0 || config.talks_per_player() < 0 ||
      config.recent_talk_window() < 0) {
    return absl::InvalidArgumentError("Game limits cannot be negative");
  }

  const SetupTable table = SetupTableFor(config);
  vector<Role> roles;
  if (num_assigned == 0) {
    Rng setup_rng(config.seed());
    absl::StatusOr<vector<Role>> assigned =
        AssignRoles(table, config.players_size(), &setup_rng);
    if (!assigned.ok()) {
      return assigned.status();
    }
    roles = *std::move(assigned);
  } else if (num_assigned == config.players_size()) {
    for (const PlayerConfig& player : config.players()) {
      roles.push_back(player.role());
    }
    absl::Status valid = ValidateRoles(table, roles);
    if (!valid.ok()) {
      return valid;
    }
  } else {
    return absl::InvalidArgumentError(
        "Either all or none of the players have a pre-assigned role");
  }

  unique_ptr<Game> game;
  switch (config.kind()) {
    case CLOCKTOWER_LITE:
      game = std::make_unique<ClocktowerGame>(config, roles, std::move(seats),
                                              std::move(arbiter), recorder);
      break;
    case SECRET_HITLER:
      game = std::make_unique<SecretHitlerGame>(
          config, roles, std::move(seats), std::move(arbiter), recorder);
      break;
    case MAFIA_CLASSIC:
      game = std::make_unique<MafiaGame>(config, roles, std::move(seats),
                                         std::move(arbiter), recorder);
      break;
    case ALPHA_COMPLEX:
      game = std::make_unique<AlphaComplexGame>(
          config, roles, std::move(seats), std::move(arbiter), recorder);
      break;
    case LIARS_DECK:
      game = std::make_unique<LiarsDeckGame>(config, roles, std::move(seats),
                                             std::move(arbiter), recorder);
      break;
    default:
      return absl::InvalidArgumentError(absl::StrFormat(
          "Unsupported game %s", GameKind_Name(config.kind())));
  }
  return game;
}
}  // namespace tabletalk
