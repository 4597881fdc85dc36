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

#include "src/alpha_complex.h"

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
  config.set_kind(ALPHA_COMPLEX);
  config.set_seed(9);
  config.set_talks_per_player(1);
  for (int i = 0; i < num_players; ++i) {
    PlayerConfig* player = config.add_players();
    player->set_name(absl::StrFormat("P%d", i + 1));
    player->set_model("test");
  }
  return config;
}

const Role kRoles[] = {TRAITOR, MUTANT, TROUBLESHOOTER, TROUBLESHOOTER,
                       TROUBLESHOOTER};

// The Traitor P1 sabotages or complies; everybody accuses P1 and votes
// `ballot`.
ScriptedAgent::Script Citizens(const string& mission, const string& ballot) {
  return [=](const DecisionRequest& request) {
    switch (request.kind) {
      case NIGHT_ACTION:
        return PickIfLegal(request, request.player == 0 ? mission : kPass);
      case NOMINATE:
        return PickIfLegal(request, "P1");
      case VOTE:
        return PickIfLegal(request, ballot);
      default:
        return PickIfLegal(request, "");
    }
  };
}

shared_ptr<ScriptedAgent> Computer(const string& verdict,
                                   const string& terminate) {
  return std::make_shared<ScriptedAgent>(
      [=](const DecisionRequest& request) {
        return Pick(request.kind == JUDGE_ACCUSATION ? verdict : terminate);
      });
}

TEST(MoodVerdict, OnlyASatisfiedComputerTurnsOnTheAccuser) {
  EXPECT_EQ(MoodVerdict(SATISFIED), kAccuser);
  EXPECT_EQ(MoodVerdict(SUSPICIOUS), kAccused);
  EXPECT_EQ(MoodVerdict(ANGRY), kAccused);
}

TEST(AlphaComplex, ThreeSabotagedMissionsWinForTheSecretSociety) {
  GameLogRecorder recorder;
  AlphaComplexGame game(MakeConfig(5), kRoles,
                        AsAgents(ScriptedSeats(5, Citizens(kSabotage, "NO"))),
                        nullptr, &recorder);
  const Winner winner = game.Play();
  EXPECT_EQ(winner.team, SECRET_SOCIETY);
  EXPECT_EQ(winner.reason, "three missions failed");
  EXPECT_EQ(game.State().CurrentTime(), Time::Night(3));
  EXPECT_EQ(game.State().GetTallies().failed_missions, 3);
  EXPECT_EQ(game.State().GetTallies().accusations, 2);
  EXPECT_EQ(game.ComputerMood(), SUSPICIOUS);
  int missions = 0;
  for (const Event& event : recorder.Log().events()) {
    if (event.has_mission()) {
      ++missions;
      EXPECT_FALSE(event.mission().success());
      EXPECT_EQ(event.mission().sabotage_count(), 1);
    }
  }
  EXPECT_EQ(missions, 3);
}

TEST(AlphaComplex, VerdictFollowsTheMoodWithoutAnArbiter) {
  GameLogRecorder recorder;
  AlphaComplexGame game(MakeConfig(5), kRoles,
                        AsAgents(ScriptedSeats(5, Citizens(kComply, "YES"))),
                        nullptr, &recorder);
  ASSERT_TRUE(game.Step());  // A successful mission.
  EXPECT_EQ(game.State().GetTallies().completed_missions, 1);
  const Mood mood = game.ComputerMood();
  game.Step();
  const GameState& g = game.State();
  EXPECT_EQ(g.GetTallies().accusations, 1);
  if (mood == SATISFIED) {
    EXPECT_TRUE(g.IsAlive(0));
    EXPECT_EQ(g.NumAlive(), 4);
    EXPECT_FALSE(g.IsGameOver());
  } else {
    EXPECT_FALSE(g.IsAlive(0));
    EXPECT_EQ(g.GetWinner()->team, LOYALISTS);
  }
  for (const Event& event : recorder.Log().events()) {
    EXPECT_FALSE(event.has_fallback());
    if (event.has_verdict()) {
      EXPECT_EQ(event.verdict().accused(), "P1");
      EXPECT_EQ(event.verdict().mood(), mood);
      EXPECT_EQ(event.verdict().executed_size(), 1);
    }
  }
}

TEST(AlphaComplex, TheComputerMayExecuteBoth) {
  GameLogRecorder recorder;
  AlphaComplexGame game(MakeConfig(5), kRoles,
                        AsAgents(ScriptedSeats(5, Citizens(kComply, "YES"))),
                        Computer(kBoth, kContinue), &recorder);
  const Winner winner = game.Play();
  EXPECT_EQ(winner.team, LOYALISTS);
  EXPECT_EQ(winner.reason, "all Traitors are eliminated");
  EXPECT_EQ(game.State().NumAlive(), 3);
  EXPECT_EQ(game.State().GetTallies().executions, 0);
  bool judged = false;
  for (const Event& event : recorder.Log().events()) {
    if (event.has_verdict()) {
      judged = true;
      EXPECT_EQ(event.verdict().executed_size(), 2);
    }
    if (event.has_elimination()) {
      EXPECT_EQ(event.elimination().cause(), COMPUTER_VERDICT);
    }
  }
  EXPECT_TRUE(judged);
}

TEST(AlphaComplex, TheComputerMayTerminateTheGame) {
  shared_ptr<ScriptedAgent> computer = Computer(kNeither, kTerminate);
  AlphaComplexGame game(MakeConfig(5), kRoles,
                        AsAgents(ScriptedSeats(5, Citizens(kComply, "NO"))),
                        computer, nullptr);
  const Winner winner = game.Play();
  EXPECT_EQ(winner.team, THE_COMPUTER);
  EXPECT_EQ(winner.reason, "The Computer terminated the game");
  EXPECT_EQ(game.State().CurrentTime(), Time::Day(1));
  EXPECT_EQ(game.State().NumAlive(), 5);
  ASSERT_EQ(computer->NumRequests(TERMINATE_GAME), 1);
  // The case was not brought: the vote failed.
  EXPECT_EQ(computer->NumRequests(JUDGE_ACCUSATION), 0);
  EXPECT_EQ(computer->Requests()[0].player_name, kComputerName);
}

TEST(AlphaComplex, TheComputerMayHandTheWinToASurvivor) {
  GameLogRecorder recorder;
  shared_ptr<ScriptedAgent> computer = Computer(kNeither, "P3");
  AlphaComplexGame game(MakeConfig(5), kRoles,
                        AsAgents(ScriptedSeats(5, Citizens(kComply, "NO"))),
                        computer, &recorder);
  const Winner winner = game.Play();
  EXPECT_EQ(winner.team, SOLO);
  EXPECT_FALSE(winner.forced);
  EXPECT_THAT(winner.players, testing::ElementsAre("P3"));
  EXPECT_EQ(winner.reason,
            "The Computer terminated the game and named P3 the winner");
  EXPECT_EQ(game.State().CurrentTime(), Time::Day(1));
  ASSERT_EQ(computer->NumRequests(TERMINATE_GAME), 1);
  EXPECT_THAT(computer->Requests()[0].options,
              testing::ElementsAre(kContinue, kTerminate, "P1", "P2", "P3",
                                   "P4", "P5"));
  EXPECT_THAT(recorder.Log().result().winners(), testing::ElementsAre("P3"));
}

TEST(AlphaComplex, IllegalVerdictIsReplacedByALegalOne) {
  GameLogRecorder recorder;
  AlphaComplexGame game(MakeConfig(5), kRoles,
                        AsAgents(ScriptedSeats(5, Citizens(kComply, "YES"))),
                        Computer("GUILTY", kContinue), &recorder);
  ASSERT_TRUE(game.Step());
  game.Step();
  int fallbacks = 0;
  for (const Event& event : recorder.Log().events()) {
    if (event.has_fallback()) {
      ++fallbacks;
      EXPECT_EQ(event.fallback().player(), kComputerName);
      EXPECT_EQ(event.fallback().kind(), JUDGE_ACCUSATION);
      EXPECT_EQ(event.fallback().reason(), ILLEGAL_DECISION);
      ASSERT_EQ(event.fallback().chosen_size(), 1);
      EXPECT_THAT(event.fallback().chosen(0),
                  testing::AnyOf(kAccused, kAccuser, kBoth, kNeither));
    }
  }
  EXPECT_EQ(fallbacks, 1);
}

TEST(AlphaComplex, RoundLimitIsAComputerWin) {
  GameConfig config = MakeConfig(5);
  config.set_max_rounds(2);
  AlphaComplexGame game(config, kRoles,
                        AsAgents(ScriptedSeats(5, Citizens(kComply, "NO"))),
                        nullptr, nullptr);
  const Winner winner = game.Play();
  EXPECT_EQ(winner.team, THE_COMPUTER);
  EXPECT_TRUE(winner.forced);
  EXPECT_EQ(game.State().GetTallies().completed_missions, 2);
}

TEST(AlphaComplex, RandomGamesEnd) {
  for (int seed = 0; seed < 10; ++seed) {
    GameConfig config = MakeConfig(4 + seed % 5);
    config.set_seed(seed);
    vector<shared_ptr<Agent>> seats;
    for (int i = 0; i < config.players_size(); ++i) {
      seats.push_back(std::make_shared<RandomAgent>(seed * 100 + i));
    }
    shared_ptr<Agent> computer;
    if (seed % 2 == 0) {
      computer = std::make_shared<RandomAgent>(seed);
    }
    absl::StatusOr<unique_ptr<Game>> game =
        NewGame(config, seats, computer, nullptr);
    ASSERT_TRUE(game.ok()) << game.status();
    const Winner winner = (*game)->Play();
    EXPECT_THAT(winner.team,
                testing::AnyOf(LOYALISTS, SECRET_SOCIETY, THE_COMPUTER, SOLO));
  }
}
}  // namespace
}  // namespace tabletalk
