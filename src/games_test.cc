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

#include <memory>
#include <utility>

#include "absl/strings/str_format.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "ortools/base/logging.h"
#include "src/mafia.h"

namespace tabletalk {
namespace {

using testing::HasSubstr;

GameConfig MakeConfig(GameKind kind, int num_players) {
  GameConfig config;
  config.set_kind(kind);
  config.set_seed(17);
  for (int i = 0; i < num_players; ++i) {
    PlayerConfig* player = config.add_players();
    player->set_name(absl::StrFormat("P%d", i + 1));
    player->set_model("test");
  }
  return config;
}

vector<shared_ptr<Agent>> RandomSeats(int n) {
  vector<shared_ptr<Agent>> seats;
  for (int i = 0; i < n; ++i) {
    seats.push_back(std::make_shared<RandomAgent>(i));
  }
  return seats;
}

void ExpectInvalid(const GameConfig& config, vector<shared_ptr<Agent>> seats,
                   const string& message) {
  absl::StatusOr<unique_ptr<Game>> game =
      NewGame(config, std::move(seats), nullptr, nullptr);
  ASSERT_FALSE(game.ok());
  EXPECT_EQ(game.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(game.status().message(), HasSubstr(message));
}

TEST(NewGame, CreatesEveryGame) {
  const int kSizes[] = {5, 5, 5, 5, 3};
  const GameKind kKinds[] = {CLOCKTOWER_LITE, SECRET_HITLER, MAFIA_CLASSIC,
                             ALPHA_COMPLEX, LIARS_DECK};
  for (int i = 0; i < 5; ++i) {
    absl::StatusOr<unique_ptr<Game>> game =
        NewGame(MakeConfig(kKinds[i], kSizes[i]), RandomSeats(kSizes[i]),
                nullptr, nullptr);
    ASSERT_TRUE(game.ok()) << game.status();
    EXPECT_EQ((*game)->State().Kind(), kKinds[i]);
    EXPECT_EQ((*game)->State().NumPlayers(), kSizes[i]);
  }
}

TEST(NewGame, RoleAssignmentIsReproducible) {
  const GameConfig config = MakeConfig(MAFIA_CLASSIC, 9);
  auto roles = [](const GameConfig& config) {
    absl::StatusOr<unique_ptr<Game>> game =
        NewGame(config, RandomSeats(9), nullptr, nullptr);
    CHECK(game.ok()) << game.status();
    vector<Role> result;
    for (int p = 0; p < 9; ++p) {
      result.push_back((*game)->State().GetRole(p));
    }
    return result;
  };
  EXPECT_EQ(roles(config), roles(config));
}

TEST(NewGame, KeepsPreassignedRoles) {
  GameConfig config = MakeConfig(MAFIA_CLASSIC, 5);
  const Role kRoles[] = {TOWNSPERSON, DOCTOR, MAFIOSO, DETECTIVE, TOWNSPERSON};
  for (int i = 0; i < 5; ++i) {
    config.mutable_players(i)->set_role(kRoles[i]);
  }
  absl::StatusOr<unique_ptr<Game>> game =
      NewGame(config, RandomSeats(5), nullptr, nullptr);
  ASSERT_TRUE(game.ok()) << game.status();
  EXPECT_NE(dynamic_cast<MafiaGame*>(game->get()), nullptr);
  for (int i = 0; i < 5; ++i) {
    EXPECT_EQ((*game)->State().GetRole(i), kRoles[i]);
  }
}

TEST(NewGame, RejectsInvalidConfigs) {
  ExpectInvalid(MakeConfig(GAME_KIND_UNSPECIFIED, 5), RandomSeats(5),
                "Unsupported game");
  ExpectInvalid(MakeConfig(MAFIA_CLASSIC, 5), RandomSeats(4),
                "4 agents for 5 players");

  GameConfig config = MakeConfig(MAFIA_CLASSIC, 5);
  config.mutable_players(2)->clear_name();
  ExpectInvalid(config, RandomSeats(5), "cannot be empty");

  config = MakeConfig(MAFIA_CLASSIC, 5);
  config.mutable_players(2)->set_name("P1");
  ExpectInvalid(config, RandomSeats(5), "Duplicate player name P1");

  vector<shared_ptr<Agent>> seats = RandomSeats(5);
  seats[3] = nullptr;
  ExpectInvalid(MakeConfig(MAFIA_CLASSIC, 5), seats, "needs an agent");

  config = MakeConfig(MAFIA_CLASSIC, 5);
  config.set_decision_timeout_ms(-1);
  ExpectInvalid(config, RandomSeats(5), "cannot be negative");
}

TEST(NewGame, RejectsUnsupportedTableSizes) {
  ExpectInvalid(MakeConfig(SECRET_HITLER, 4), RandomSeats(4),
                "does not support 4 players");
  ExpectInvalid(MakeConfig(LIARS_DECK, 5), RandomSeats(5),
                "does not support 5 players");
}

TEST(NewGame, RejectsInvalidPreassignedRoles) {
  GameConfig config = MakeConfig(MAFIA_CLASSIC, 5);
  config.mutable_players(0)->set_role(MAFIOSO);
  ExpectInvalid(config, RandomSeats(5), "Either all or none");

  for (int i = 0; i < 5; ++i) {
    config.mutable_players(i)->set_role(TOWNSPERSON);
  }
  ExpectInvalid(config, RandomSeats(5), "Unexpected TOWNSPERSON");

  config.mutable_players(0)->set_role(IMP);
  ExpectInvalid(config, RandomSeats(5), "Unexpected IMP");
}

TEST(NewGame, SetupTableOverride) {
  GameConfig config = MakeConfig(MAFIA_CLASSIC, 3);
  SetupRow* row = config.mutable_setup_table()->add_rows();
  row->set_num_players(3);
  RoleCount* mafioso = row->add_roles();
  mafioso->set_role(MAFIOSO);
  mafioso->set_count(1);
  RoleCount* town = row->add_roles();
  town->set_role(TOWNSPERSON);
  town->set_count(2);
  EXPECT_EQ(SetupTableFor(config).kind(), MAFIA_CLASSIC);
  absl::StatusOr<unique_ptr<Game>> game =
      NewGame(config, RandomSeats(3), nullptr, nullptr);
  ASSERT_TRUE(game.ok()) << game.status();
  EXPECT_EQ((*game)->State().NumAliveOnTeam(MAFIA), 1);

  town->set_count(3);
  ExpectInvalid(config, RandomSeats(3), "assigns 4 roles");
}
}  // namespace
}  // namespace tabletalk
