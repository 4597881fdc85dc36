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

#include "src/clocktower.h"

#include <map>
#include <memory>

#include "absl/strings/str_format.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "src/games.h"
#include "src/recorder.h"
#include "src/scripted_agent.h"

namespace tabletalk {
namespace {

using testing::HasSubstr;

GameConfig MakeConfig(const vector<Role>& roles) {
  GameConfig config;
  config.set_kind(CLOCKTOWER_LITE);
  config.set_seed(1);
  for (int i = 0; i < roles.size(); ++i) {
    PlayerConfig* player = config.add_players();
    player->set_name(absl::StrFormat("P%d", i + 1));
    player->set_model("test");
    player->set_role(roles[i]);
  }
  return config;
}

// Night targets by seat; everybody nominates `nominee` and votes `ballot`.
ScriptedAgent::Script Storyline(std::map<int, string> night_targets,
                                const string& nominee, const string& ballot) {
  return [=](const DecisionRequest& request) {
    switch (request.kind) {
      case NIGHT_ACTION: {
        const auto it = night_targets.find(request.player);
        return PickIfLegal(request,
                           it == night_targets.end() ? "" : it->second);
      }
      case NOMINATE:
        return PickIfLegal(request, nominee);
      case VOTE:
        return PickIfLegal(request, ballot);
      default:
        return PickIfLegal(request, kPass);
    }
  };
}

unique_ptr<Game> NewClocktowerGame(const GameConfig& config,
                                   const ScriptedAgent::Script& script,
                                   Recorder* recorder) {
  absl::StatusOr<unique_ptr<Game>> game = NewGame(
      config, AsAgents(ScriptedSeats(config.players_size(), script)), nullptr,
      recorder);
  EXPECT_TRUE(game.ok()) << game.status();
  return *std::move(game);
}

vector<Government> Governments(const GameLogRecorder& recorder) {
  vector<Government> result;
  for (const Event& event : recorder.Log().events()) {
    if (event.has_government()) {
      result.push_back(event.government());
    }
  }
  return result;
}

TEST(Clocktower, SetupInformsTheEvilTeam) {
  unique_ptr<Game> game = NewClocktowerGame(
      MakeConfig({IMP, POISONER, EMPATH, MONK, CHEF}),
      Storyline({}, "P1", "NO"), nullptr);
  game->Start();
  const GameState& g = game->State();
  EXPECT_THAT(g.Knowledge().FactTexts(0),
              testing::ElementsAre(HasSubstr("Your minions: P2.")));
  EXPECT_THAT(g.Knowledge().FactTexts(1),
              testing::ElementsAre("Your demon: P1. Fellow minions: P2."));
  EXPECT_EQ(g.Knowledge().NumFacts(2), 0);
  EXPECT_EQ(g.GetTeam(g.RedHerring()), GOOD);
}

TEST(Clocktower, PoisonedEmpathNightKillAndUndertaker) {
  // The Poisoner poisons the Empath P3, the Monk protects P6, and the Imp
  // kills the Chef P5.
  GameLogRecorder recorder;
  unique_ptr<Game> game = NewClocktowerGame(
      MakeConfig({IMP, POISONER, EMPATH, MONK, CHEF, UNDERTAKER, RAVENKEEPER}),
      Storyline({{0, "P5"}, {1, "P3"}, {3, "P6"}}, "P2", "YES"), &recorder);
  const GameState& g = game->State();

  ASSERT_TRUE(game->Step());  // Night 1.
  EXPECT_FALSE(g.IsAlive(4));
  EXPECT_THAT(g.DeathsAtNight(1), testing::ElementsAre(4));
  ASSERT_EQ(g.Knowledge().NumFacts(2), 1);
  EXPECT_FALSE(g.Knowledge().FactsOf(2)[0].reliable());
  EXPECT_EQ(g.Knowledge().NumFacts(5), 0);

  ASSERT_TRUE(game->Step());  // Day 1: the Poisoner is executed.
  EXPECT_EQ(g.ExecutionOnDay(1), 1);
  ASSERT_EQ(Governments(recorder).size(), 1);
  EXPECT_TRUE(Governments(recorder)[0].passed());
  EXPECT_EQ(Governments(recorder)[0].approvals(), 6);

  ASSERT_TRUE(game->Step());  // Night 2.
  ASSERT_EQ(g.Knowledge().NumFacts(5), 1);
  EXPECT_EQ(g.Knowledge().FactsOf(5)[0].text(),
            absl::StrFormat("P2, executed yesterday, was the %s.",
                            RoleName(POISONER)));
  EXPECT_TRUE(g.Knowledge().FactsOf(5)[0].reliable());
}

TEST(Clocktower, SlayerShootsTheDemon) {
  auto script = [](const DecisionRequest& request) {
    if (request.kind == DAY_ABILITY) {
      return Pick("P1");
    }
    return Storyline({{0, "P4"}, {1, "P4"}}, "P4", "NO")(request);
  };
  GameLogRecorder recorder;
  unique_ptr<Game> game = NewClocktowerGame(
      MakeConfig({IMP, POISONER, SLAYER, CHEF, EMPATH}), script, &recorder);
  const Winner winner = game->Play();
  EXPECT_EQ(winner.team, GOOD);
  EXPECT_EQ(winner.reason, "the Demon is dead");
  EXPECT_FALSE(winner.forced);
  const GameState& g = game->State();
  EXPECT_EQ(g.CurrentTime(), Time::Day(1));
  EXPECT_TRUE(g.GetPlayer(2).ability_used);
  // The game ends before nominations.
  EXPECT_TRUE(Governments(recorder).empty());
  EXPECT_EQ(recorder.Log().result().team(), GOOD);
}

TEST(Clocktower, SlayerMissesAndCannotShootAgain) {
  vector<shared_ptr<ScriptedAgent>> seats =
      ScriptedSeats(5, [](const DecisionRequest& request) {
        if (request.kind == DAY_ABILITY) {
          return Pick("P4");
        }
        // The poisoned Imp never kills; nobody is executed.
        return Storyline({{0, "P4"}, {1, "P1"}}, "P4", "NO")(request);
      });
  GameConfig config = MakeConfig({IMP, POISONER, SLAYER, CHEF, EMPATH});
  config.set_max_rounds(2);
  absl::StatusOr<unique_ptr<Game>> game =
      NewGame(config, AsAgents(seats), nullptr, nullptr);
  ASSERT_TRUE(game.ok());
  const Winner winner = (*game)->Play();
  EXPECT_EQ(seats[2]->NumRequests(DAY_ABILITY), 1);
  EXPECT_TRUE((*game)->State().IsAlive(3));
  EXPECT_EQ(winner.team, EVIL);
  EXPECT_TRUE(winner.forced);
  EXPECT_EQ(winner.reason, "round limit reached: the Demon survived");
}

TEST(Clocktower, MayorCancelsTheirOwnExecution) {
  auto script = [](const DecisionRequest& request) {
    if (request.kind == CANCEL_EXECUTION) {
      return Pick(kCancel);
    }
    return Storyline({{0, "P4"}, {1, "P1"}}, "P3", "YES")(request);
  };
  GameLogRecorder recorder;
  unique_ptr<Game> game = NewClocktowerGame(
      MakeConfig({IMP, POISONER, MAYOR, CHEF, EMPATH}), script, &recorder);
  ASSERT_TRUE(game->Step());
  ASSERT_TRUE(game->Step());
  const GameState& g = game->State();
  EXPECT_TRUE(g.IsAlive(2));
  EXPECT_EQ(g.ExecutionOnDay(1), kNoPlayer);
  const vector<Government> governments = Governments(recorder);
  ASSERT_EQ(governments.size(), 1);
  EXPECT_TRUE(governments[0].passed());
  EXPECT_TRUE(governments[0].cancelled());
  EXPECT_EQ(governments[0].target(), "P3");
}

TEST(Clocktower, TwoPlayersLeftIsAnEvilWin) {
  // The evil team targets the first good player at night, and the town
  // executes the first good player every day.
  auto first_good = [](const DecisionRequest& request) {
    for (const string& option : request.options) {
      if (option != "P1" && option != "P2") {
        return Pick(option);
      }
    }
    return PickIfLegal(request, "");
  };
  auto script = [first_good](const DecisionRequest& request) {
    if ((request.kind == NIGHT_ACTION && request.player <= 1) ||
        request.kind == NOMINATE) {
      return first_good(request);
    }
    return PickIfLegal(request, "YES");
  };
  unique_ptr<Game> game = NewClocktowerGame(
      MakeConfig({IMP, POISONER, CHEF, EMPATH, UNDERTAKER, FORTUNE_TELLER,
                  RAVENKEEPER}),
      script, nullptr);
  const Winner winner = game->Play();
  EXPECT_EQ(winner.team, EVIL);
  EXPECT_EQ(winner.reason, "only two players are alive");
  EXPECT_THAT(game->State().AlivePlayers(), testing::ElementsAre(0, 1));
}

TEST(Clocktower, RandomGamesEnd) {
  for (int seed = 0; seed < 10; ++seed) {
    GameConfig config;
    config.set_kind(CLOCKTOWER_LITE);
    config.set_seed(seed);
    vector<shared_ptr<Agent>> seats;
    for (int i = 0; i < 7; ++i) {
      PlayerConfig* player = config.add_players();
      player->set_name(absl::StrFormat("P%d", i + 1));
      seats.push_back(std::make_shared<RandomAgent>(seed * 10 + i));
    }
    config.set_talks_per_player(1);
    absl::StatusOr<unique_ptr<Game>> game =
        NewGame(config, seats, nullptr, nullptr);
    ASSERT_TRUE(game.ok()) << game.status();
    const Winner winner = (*game)->Play();
    EXPECT_THAT(winner.team, testing::AnyOf(GOOD, EVIL));
    EXPECT_TRUE((*game)->State().IsGameOver());
    EXPECT_LE((*game)->State().Round(), 20);
  }
}
}  // namespace
}  // namespace tabletalk
