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

#include "src/agent.h"

#include <atomic>
#include <memory>
#include <stdexcept>
#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/synchronization/notification.h"
#include "absl/time/clock.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "src/recorder.h"
#include "src/scripted_agent.h"

namespace tabletalk {
namespace {

DecisionRequest Request(int player, vector<string> options) {
  DecisionRequest request;
  request.kind = VOTE;
  request.player = player;
  request.player_name = absl::StrCat("P", player + 1);
  request.options = std::move(options);
  return request;
}

vector<DecisionFallback> Fallbacks(const GameLogRecorder& recorder) {
  vector<DecisionFallback> fallbacks;
  for (const Event& event : recorder.Log().events()) {
    if (event.has_fallback()) {
      fallbacks.push_back(event.fallback());
    }
  }
  return fallbacks;
}

TEST(IsLegalDecision, ChecksOptionsBoundsAndDuplicates) {
  DecisionRequest request = Request(0, {"A", "B", "C"});
  EXPECT_TRUE(IsLegalDecision(request, Pick("B")));
  EXPECT_FALSE(IsLegalDecision(request, Pick("D")));
  EXPECT_FALSE(IsLegalDecision(request, Decision()));
  request.max_picks = 2;
  EXPECT_TRUE(IsLegalDecision(request, {.picks = {"A", "C"}}));
  EXPECT_FALSE(IsLegalDecision(request, {.picks = {"A", "A"}}));
  EXPECT_FALSE(IsLegalDecision(request, {.picks = {"A", "B", "C"}}));
  EXPECT_TRUE(IsLegalDecision(Request(0, {}), Say("Hello")));
}

TEST(DecisionBroker, ReplacesIllegalDecisionsWithALegalOne) {
  Rng rng(1);
  GameLogRecorder recorder;
  auto agent = std::make_shared<ScriptedAgent>(
      [](const DecisionRequest&) { return Pick("Nobody"); });
  DecisionBroker broker({agent}, nullptr, &rng, absl::InfiniteDuration(),
                        &recorder);
  DecisionRequest request = Request(0, {"YES", "NO"});
  request.fallback = "NO";
  for (int i = 0; i < 10; ++i) {
    const Decision decision = broker.Decide(request);
    EXPECT_TRUE(IsLegalDecision(request, decision));
  }
  const vector<DecisionFallback> fallbacks = Fallbacks(recorder);
  ASSERT_EQ(fallbacks.size(), 10);
  EXPECT_EQ(fallbacks[0].reason(), ILLEGAL_DECISION);
  EXPECT_EQ(fallbacks[0].player(), "P1");
  EXPECT_EQ(fallbacks[0].kind(), VOTE);
}

TEST(DecisionBroker, LegalDecisionsPassThrough) {
  Rng rng(1);
  GameLogRecorder recorder;
  auto agent = std::make_shared<ScriptedAgent>(
      [](const DecisionRequest&) { return Pick("NO"); });
  DecisionBroker broker({agent}, nullptr, &rng, absl::Seconds(10), &recorder);
  EXPECT_EQ(broker.Choose(Request(0, {"YES", "NO"})), "NO");
  EXPECT_TRUE(Fallbacks(recorder).empty());
}

TEST(DecisionBroker, TimeoutUsesTheFallbackOption) {
  Rng rng(1);
  GameLogRecorder recorder;
  auto done = std::make_shared<absl::Notification>();
  auto agent = std::make_shared<ScriptedAgent>(
      [done](const DecisionRequest&) {
        done->WaitForNotificationWithTimeout(absl::Seconds(5));
        return Pick("CHALLENGE");
      });
  DecisionBroker broker({agent}, nullptr, &rng, absl::Milliseconds(50),
                        &recorder);
  DecisionRequest request = Request(0, {"CHALLENGE", "PASS"});
  request.fallback = "PASS";
  EXPECT_EQ(broker.Choose(request), "PASS");
  EXPECT_EQ(broker.NumStragglers(), 1);
  done->Notify();
  const vector<DecisionFallback> fallbacks = Fallbacks(recorder);
  ASSERT_EQ(fallbacks.size(), 1);
  EXPECT_EQ(fallbacks[0].reason(), DECISION_TIMEOUT);
  EXPECT_THAT(fallbacks[0].chosen(), testing::ElementsAre("PASS"));
}

TEST(DecisionBroker, DestructorWaitsForLateAgents) {
  Rng rng(1);
  auto returned = std::make_shared<std::atomic<bool>>(false);
  auto agent = std::make_shared<ScriptedAgent>(
      [returned](const DecisionRequest&) {
        absl::SleepFor(absl::Milliseconds(300));
        *returned = true;
        return Pick("YES");
      });
  {
    DecisionBroker broker({agent}, nullptr, &rng, absl::Milliseconds(10),
                          nullptr);
    DecisionRequest request = Request(0, {"YES", "NO"});
    request.fallback = "NO";
    EXPECT_EQ(broker.Choose(request), "NO");
    EXPECT_EQ(broker.NumStragglers(), 1);
  }
  EXPECT_TRUE(returned->load());
}

TEST(DecisionBroker, ReturnedStragglersAreJoined) {
  Rng rng(1);
  auto release = std::make_shared<absl::Notification>();
  auto agent = std::make_shared<ScriptedAgent>(
      [release](const DecisionRequest&) {
        release->WaitForNotificationWithTimeout(absl::Seconds(5));
        return Pick("YES");
      });
  DecisionBroker broker({agent}, nullptr, &rng, absl::Milliseconds(20),
                        nullptr);
  DecisionRequest request = Request(0, {"YES", "NO"});
  request.fallback = "NO";
  EXPECT_EQ(broker.Choose(request), "NO");
  EXPECT_EQ(broker.NumStragglers(), 1);
  release->Notify();
  absl::SleepFor(absl::Milliseconds(100));
  request.fallback = "";
  broker.DecideAll({request});
  EXPECT_EQ(broker.NumStragglers(), 0);
}

TEST(DecisionBroker, FailingAgentsAreUnavailable) {
  Rng rng(1);
  GameLogRecorder recorder;
  auto agent = std::make_shared<ScriptedAgent>(
      [](const DecisionRequest&) -> Decision {
        throw std::runtime_error("connection refused");
      });
  DecisionBroker broker({agent}, nullptr, &rng, absl::InfiniteDuration(),
                        &recorder);
  DecisionRequest request = Request(0, {"ACCEPT", "CANCEL"});
  request.fallback = "ACCEPT";
  EXPECT_EQ(broker.Choose(request), "ACCEPT");
  // Silence for free text.
  EXPECT_EQ(broker.Decide(Request(0, {})).text, "(says nothing)");
  const vector<DecisionFallback> fallbacks = Fallbacks(recorder);
  ASSERT_EQ(fallbacks.size(), 2);
  EXPECT_EQ(fallbacks[0].reason(), AGENT_UNAVAILABLE);
  EXPECT_EQ(fallbacks[1].reason(), AGENT_UNAVAILABLE);
}

TEST(DecisionBroker, MissingArbiterIsUnavailable) {
  Rng rng(1);
  GameLogRecorder recorder;
  DecisionBroker broker({}, nullptr, &rng, absl::InfiniteDuration(),
                        &recorder);
  EXPECT_FALSE(broker.HasArbiter());
  DecisionRequest request = Request(kNoPlayer, {"CONTINUE", "TERMINATE"});
  request.fallback = "CONTINUE";
  EXPECT_EQ(broker.Choose(request), "CONTINUE");
}

TEST(DecisionBroker, DecideAllKeepsRequestOrder) {
  Rng rng(1);
  vector<shared_ptr<Agent>> seats;
  for (int i = 0; i < 4; ++i) {
    // Later seats answer sooner.
    seats.push_back(std::make_shared<ScriptedAgent>(
        [i](const DecisionRequest& request) {
          absl::SleepFor(absl::Milliseconds(10 * (4 - i)));
          return Pick(request.options[i]);
        }));
  }
  DecisionBroker broker(seats, nullptr, &rng, absl::Seconds(30), nullptr);
  vector<DecisionRequest> requests;
  for (int i = 0; i < 4; ++i) {
    requests.push_back(Request(i, {"A", "B", "C", "D"}));
  }
  vector<string> picks;
  for (const Decision& decision : broker.DecideAll(requests)) {
    picks.push_back(decision.Pick());
  }
  EXPECT_THAT(picks, testing::ElementsAre("A", "B", "C", "D"));
}

TEST(DecisionBroker, DecideAllIsConcurrentWithoutATimeout) {
  Rng rng(1);
  // Each seat answers only once the other one has been asked.
  auto asked = std::make_shared<vector<absl::Notification>>(2);
  vector<shared_ptr<Agent>> seats;
  for (int i = 0; i < 2; ++i) {
    seats.push_back(std::make_shared<ScriptedAgent>(
        [asked, i](const DecisionRequest&) {
          (*asked)[i].Notify();
          return Pick((*asked)[1 - i].WaitForNotificationWithTimeout(
                          absl::Seconds(5))
                          ? "MET"
                          : "ALONE");
        }));
  }
  DecisionBroker broker(seats, nullptr, &rng, absl::InfiniteDuration(),
                        nullptr);
  vector<string> picks;
  for (const Decision& decision :
       broker.DecideAll({Request(0, {"MET", "ALONE"}),
                         Request(1, {"MET", "ALONE"})})) {
    picks.push_back(decision.Pick());
  }
  EXPECT_THAT(picks, testing::ElementsAre("MET", "MET"));
  EXPECT_EQ(broker.NumStragglers(), 0);
}

TEST(DecisionBroker, FallbackRandomnessIsReproducible) {
  auto run = [](uint64_t seed) {
    Rng rng(seed);
    vector<shared_ptr<Agent>> seats;
    for (int i = 0; i < 5; ++i) {
      seats.push_back(std::make_shared<ScriptedAgent>(
          [](const DecisionRequest&) { return Pick("illegal"); }));
    }
    DecisionBroker broker(seats, nullptr, &rng, absl::Seconds(30), nullptr);
    vector<DecisionRequest> requests;
    for (int i = 0; i < 5; ++i) {
      requests.push_back(Request(i, {"A", "B", "C", "D", "E", "F"}));
    }
    vector<string> picks;
    for (const Decision& decision : broker.DecideAll(requests)) {
      picks.push_back(decision.Pick());
    }
    return picks;
  };
  EXPECT_EQ(run(42), run(42));
}

TEST(PickIfLegal, TopsUpToTheMinimumWhileOptionsLast) {
  DecisionRequest request = Request(0, {"A", "B"});
  request.min_picks = 3;
  request.max_picks = 3;
  EXPECT_THAT(PickIfLegal(request, "B").picks, testing::ElementsAre("B", "A"));
  request.options = {"A", "B", "C", "D"};
  EXPECT_THAT(PickIfLegal(request, "C").picks,
              testing::ElementsAre("C", "A", "B"));
  request.options = {"A", "A"};
  EXPECT_THAT(PickIfLegal(request, "Z").picks, testing::ElementsAre("A"));
}

TEST(RandomAgent, PicksWithinBounds) {
  RandomAgent agent(5);
  DecisionRequest request = Request(0, {"1:KING", "2:ACE", "3:JOKER"});
  request.max_picks = 3;
  for (int i = 0; i < 20; ++i) {
    EXPECT_TRUE(IsLegalDecision(request, agent.Decide(request)));
  }
  EXPECT_FALSE(agent.Decide(Request(0, {})).text.empty());
}
}  // namespace
}  // namespace tabletalk
