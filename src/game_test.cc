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

#include "src/game.h"

#include <memory>

#include "absl/strings/str_format.h"
#include "absl/time/clock.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "src/mafia.h"
#include "src/scripted_agent.h"

namespace tabletalk {
namespace {

using testing::HasSubstr;

GameConfig MakeConfig(int talks_per_player) {
  GameConfig config;
  config.set_kind(MAFIA_CLASSIC);
  config.set_seed(21);
  config.set_talks_per_player(talks_per_player);
  for (int i = 0; i < 5; ++i) {
    PlayerConfig* player = config.add_players();
    player->set_name(absl::StrFormat("P%d", i + 1));
    player->set_model("test");
  }
  return config;
}

const Role kRoles[] = {MAFIOSO, DOCTOR, DETECTIVE, TOWNSPERSON, TOWNSPERSON};

// Nobody ever dies: the Doctor saves the Mafia's victim and every lynch vote
// fails. P5 takes `pause` to say anything.
ScriptedAgent::Script Stalemate(absl::Duration pause) {
  return [pause](const DecisionRequest& request) {
    switch (request.kind) {
      case NIGHT_ACTION:
        return PickIfLegal(request, "P4");
      case VOTE:
        return PickIfLegal(request, "NO");
      case TABLE_TALK:
        if (request.player == 4) {
          absl::SleepFor(pause);
        }
        return Say("Hmm.");
      default:
        return PickIfLegal(request, "");
    }
  };
}

TEST(Game, RoundLimitDeclaresTheFallbackWinner) {
  GameConfig config = MakeConfig(1);
  config.set_max_rounds(2);
  MafiaGame game(config, kRoles,
                 AsAgents(ScriptedSeats(5, Stalemate(absl::ZeroDuration()))),
                 nullptr, nullptr);
  const Winner winner = game.Play();
  EXPECT_EQ(winner.team, MAFIA);
  EXPECT_TRUE(winner.forced);
  EXPECT_EQ(winner.reason, "round limit reached: the Mafia survived");
  EXPECT_EQ(game.State().Round(), 2);
  EXPECT_EQ(game.State().NumAlive(), 5);
}

TEST(Game, TimeBudgetDeclaresTheFallbackWinner) {
  GameConfig config = MakeConfig(1);
  config.set_max_game_seconds(1);
  MafiaGame game(config, kRoles,
                 AsAgents(ScriptedSeats(5, Stalemate(absl::Milliseconds(600)))),
                 nullptr, nullptr);
  const absl::Time start = absl::Now();
  const Winner winner = game.Play();
  EXPECT_EQ(winner.team, MAFIA);
  EXPECT_TRUE(winner.forced);
  EXPECT_THAT(winner.reason, HasSubstr("time budget exceeded"));
  // Two slow days use up the budget.
  EXPECT_LE(game.State().Round(), 3);
  EXPECT_LT(absl::Now() - start, absl::Seconds(5));
}

TEST(Game, TableTalkStopsWhenTheTimeBudgetRunsOut) {
  GameConfig config = MakeConfig(3);
  config.set_max_game_seconds(1);
  vector<shared_ptr<ScriptedAgent>> seats =
      ScriptedSeats(5, Stalemate(absl::Milliseconds(600)));
  MafiaGame game(config, kRoles, AsAgents(seats), nullptr, nullptr);
  ASSERT_TRUE(game.Step());  // Night 1.
  ASSERT_TRUE(game.Step());  // Day 1.
  // The second pass ends past the budget, so there is no third.
  EXPECT_EQ(seats[4]->NumRequests(TABLE_TALK), 2);
  EXPECT_THAT(game.State().RecentTableTalk(100), testing::SizeIs(10));
  EXPECT_FALSE(game.Step());
  EXPECT_TRUE(game.State().GetWinner()->forced);
  EXPECT_THAT(game.State().GetWinner()->reason,
              HasSubstr("time budget exceeded"));
}
}  // namespace
}  // namespace tabletalk
