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

#include "src/mafia.h"

#include <memory>

#include "absl/strings/str_format.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "src/games.h"
#include "src/recorder.h"
#include "src/scripted_agent.h"

namespace tabletalk {
namespace {

GameConfig MakeConfig(int num_players) {
  GameConfig config;
  config.set_kind(MAFIA_CLASSIC);
  config.set_seed(5);
  config.set_talks_per_player(1);
  for (int i = 0; i < num_players; ++i) {
    PlayerConfig* player = config.add_players();
    player->set_name(absl::StrFormat("P%d", i + 1));
    player->set_model("test");
  }
  return config;
}

const Role kRoles[] = {MAFIOSO, DOCTOR, DETECTIVE, TOWNSPERSON, TOWNSPERSON};

ScriptedAgent::Script Script(const string& kill, const string& save,
                             const string& nominee, const string& ballot) {
  return [=](const DecisionRequest& request) {
    switch (request.kind) {
      case NIGHT_ACTION:
        return PickIfLegal(request, request.player == 0 ? kill : save);
      case NOMINATE:
        return PickIfLegal(request, nominee);
      case VOTE:
        return PickIfLegal(request, ballot);
      default:
        return PickIfLegal(request, "");
    }
  };
}

TEST(Mafia, SetupRevealsTheMafiaToEachOther) {
  const Role roles[] = {MAFIOSO, MAFIOSO, DOCTOR, DETECTIVE,
                        TOWNSPERSON, TOWNSPERSON, TOWNSPERSON};
  MafiaGame game(MakeConfig(7), roles,
                 AsAgents(ScriptedSeats(7, Script("", "", "", ""))), nullptr,
                 nullptr);
  game.Start();
  EXPECT_THAT(game.State().Knowledge().FactTexts(1),
              testing::ElementsAre("The Mafia: P1, P2."));
  EXPECT_EQ(game.State().Knowledge().NumFacts(2), 0);
}

TEST(Mafia, LynchingTheMafiosoIsATownWin) {
  GameLogRecorder recorder;
  MafiaGame game(MakeConfig(5), kRoles,
                 AsAgents(ScriptedSeats(5, Script("P4", "P4", "P1", "YES"))),
                 nullptr, &recorder);
  const Winner winner = game.Play();
  EXPECT_EQ(winner.team, TOWN);
  EXPECT_EQ(winner.reason, "the Mafia is eliminated");
  const GameState& g = game.State();
  // The Doctor saved P4 on the first night.
  EXPECT_EQ(g.NumAlive(), 4);
  EXPECT_EQ(g.ExecutionOnDay(1), 0);
  EXPECT_EQ(g.CurrentTime(), Time::Day(1));
  int governments = 0;
  for (const Event& event : recorder.Log().events()) {
    if (event.has_government()) {
      ++governments;
      EXPECT_EQ(event.government().target(), "P1");
      EXPECT_EQ(event.government().approvals(), 5);
    }
    if (event.has_nomination()) {
      // The Mafioso cannot nominate themselves and proposes P2 instead.
      EXPECT_EQ(event.nomination().proposals().at("P1"), 4);
      EXPECT_EQ(event.nomination().proposals().at("P2"), 1);
    }
  }
  EXPECT_EQ(governments, 1);
}

TEST(Mafia, ParityIsAMafiaWin) {
  MafiaGame game(MakeConfig(5), kRoles,
                 AsAgents(ScriptedSeats(5, Script("P3", "P1", "P4", "NO"))),
                 nullptr, nullptr);
  const Winner winner = game.Play();
  EXPECT_EQ(winner.team, MAFIA);
  EXPECT_EQ(winner.reason, "the Mafia equals or outnumbers the Town");
  EXPECT_FALSE(winner.forced);
  const GameState& g = game.State();
  EXPECT_EQ(g.NumAlive(), 2);
  EXPECT_TRUE(g.IsAlive(0));
  EXPECT_EQ(g.CurrentTime(), Time::Night(3));
  EXPECT_EQ(g.GetTallies().executions, 0);
}

TEST(Mafia, RandomGamesEnd) {
  for (int seed = 0; seed < 10; ++seed) {
    GameConfig config = MakeConfig(5 + seed % 8);
    config.set_seed(seed);
    vector<shared_ptr<Agent>> seats;
    for (int i = 0; i < config.players_size(); ++i) {
      seats.push_back(std::make_shared<RandomAgent>(seed * 100 + i));
    }
    absl::StatusOr<unique_ptr<Game>> game =
        NewGame(config, seats, nullptr, nullptr);
    ASSERT_TRUE(game.ok()) << game.status();
    const Winner winner = (*game)->Play();
    EXPECT_THAT(winner.team, testing::AnyOf(TOWN, MAFIA));
  }
}
}  // namespace
}  // namespace tabletalk
