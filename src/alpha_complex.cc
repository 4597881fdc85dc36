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

#include <optional>
#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"

namespace tabletalk {

string MoodVerdict(Mood mood) {
  return mood == SATISFIED ? kAccuser : kAccused;
}

AlphaComplexGame::AlphaComplexGame(const GameConfig& config,
                                   absl::Span<const Role> roles,
                                   vector<shared_ptr<Agent>> seats,
                                   shared_ptr<Agent> arbiter,
                                   Recorder* recorder)
    : Game(ALPHA_COMPLEX, config, roles, std::move(seats), std::move(arbiter),
           recorder),
      resolver_(AlphaComplexAbilities()) {}

void AlphaComplexGame::Setup() {
  const vector<int> traitors = g_.AlivePlayersWithRole(TRAITOR);
  for (int traitor : traitors) {
    g_.AddFact(traitor, absl::StrCat("The Secret Society: ",
                                     absl::StrJoin(g_.PlayerNames(traitors),
                                                   ", "),
                                     "."),
               true, TRAITOR);
  }
}

void AlphaComplexGame::RunPrivatePhase() {
  const NightSummary summary = resolver_.Resolve(&g_, &broker_, &rng_);
  const bool success = summary.sabotage_count == 0;
  Tallies& tallies = g_.MutableTallies();
  if (success) {
    tallies.completed_missions++;
  } else {
    tallies.failed_missions++;
  }
  if (verdict_executions_ > executions_at_last_mission_) {
    mood_ = SATISFIED;
  } else if (!success) {
    mood_ = SUSPICIOUS;
  } else {
    static const vector<Mood> kMoods = {SATISFIED, SUSPICIOUS, ANGRY};
    mood_ = PickRandom(kMoods, &rng_);
  }
  executions_at_last_mission_ = verdict_executions_;
  Event event;
  MissionResult* mission = event.mutable_mission();
  mission->set_mission(g_.Round());
  mission->set_sabotage_count(summary.sabotage_count);
  mission->set_success(success);
  mission->set_mood(mood_);
  g_.Record(event);
}

DecisionRequest AlphaComplexGame::ComputerRequest(
    DecisionKind kind, vector<string> options, const string& question) const {
  DecisionRequest request = NewRequest(kNoPlayer, kind, std::move(options));
  request.player_name = kComputerName;
  absl::StrAppend(&request.public_state, "\n", question);
  return request;
}

void AlphaComplexGame::RunPublicPhase() {
  CollectTableTalk();
  const vector<int> alive = g_.AlivePlayers();
  const NominationResult nomination = vote_.Nominate(
      alive, [this](int p) { return g_.AlivePlayersExcept(p); },
      absl::StrCat(PublicSummary(), "\nAccuse a player of treason."));
  if (nomination.Empty()) {
    return;
  }
  g_.MutableTallies().accusations++;
  vector<VoterSpec> voters;
  for (int voter : alive) {
    voters.push_back({.voter = voter});
  }
  GovernmentRecord record = vote_.Vote(
      nomination.nominator, nomination.nominee, voters, BallotLabels(),
      absl::StrCat(PublicSummary(), "\nBring the case before The Computer?"));
  const bool brought =
      ResolveGovernment(&record, {}) == GovernmentOutcome::kPassed;
  Event event;
  *event.mutable_government() = record.ToProto(g_);
  g_.Record(event);
  if (brought) {
    JudgeAccusation(nomination.nominator, nomination.nominee);
  }
  if (!CheckWin()) {
    AskToTerminate();
  }
}

void AlphaComplexGame::JudgeAccusation(int accuser, int accused) {
  const string by_mood = MoodVerdict(mood_);
  string verdict = by_mood;
  if (broker_.HasArbiter()) {
    DecisionRequest request = ComputerRequest(
        JUDGE_ACCUSATION, {kAccused, kAccuser, kBoth, kNeither},
        absl::StrFormat("You are %s, currently %s. %s accuses %s of treason. "
                        "Whom do you execute?",
                        kComputerName, Mood_Name(mood_),
                        g_.PlayerName(accuser), g_.PlayerName(accused)));
    request.fallback = by_mood;
    verdict = broker_.Choose(request);
  }
  vector<int> executed;
  if (verdict == kAccused || verdict == kBoth) {
    executed.push_back(accused);
  }
  if (verdict == kAccuser || verdict == kBoth) {
    executed.push_back(accuser);
  }
  Event event;
  Verdict* v = event.mutable_verdict();
  v->set_accuser(g_.PlayerName(accuser));
  v->set_accused(g_.PlayerName(accused));
  for (int p : executed) {
    v->add_executed(g_.PlayerName(p));
  }
  v->set_mood(mood_);
  g_.Record(event);
  for (int p : executed) {
    g_.Kill(p, COMPUTER_VERDICT);
    verdict_executions_++;
  }
}

void AlphaComplexGame::AskToTerminate() {
  if (!broker_.HasArbiter()) {
    return;
  }
  // TERMINATE wins the game for The Computer. Naming a surviving player
  // ends it with that player as the sole winner.
  vector<string> options = {kContinue, kTerminate};
  for (const string& name : g_.AliveNames()) {
    options.push_back(name);
  }
  DecisionRequest request = ComputerRequest(
      TERMINATE_GAME, std::move(options),
      absl::StrFormat("You are %s. You may end the game now: %s to win it "
                      "yourself, or name a surviving player to hand them "
                      "the win.",
                      kComputerName, kTerminate));
  request.fallback = kContinue;
  const string choice = broker_.Choose(request);
  if (choice == kContinue) {
    return;
  }
  terminated_ = true;
  if (choice != kTerminate) {
    named_winner_ = g_.PlayerIndex(choice);
  }
}

vector<WinPredicate> AlphaComplexGame::WinPredicates() const {
  return {
      {.name = "The Computer terminated the game",
       .check = [this](const GameState& g) -> std::optional<Winner> {
         if (!terminated_) {
           return std::nullopt;
         }
         if (named_winner_ == kNoPlayer) {
           return TeamWinner(THE_COMPUTER, "The Computer terminated the game");
         }
         Winner winner = TeamWinner(
             SOLO, absl::StrFormat(
                       "The Computer terminated the game and named %s the "
                       "winner",
                       g.PlayerName(named_winner_)));
         winner.players = {g.PlayerName(named_winner_)};
         return winner;
       }},
      TeamWinsWhen("nobody is left alive", THE_COMPUTER,
                   [](const GameState& g) { return g.NumAlive() == 0; }),
      TeamWinsWhen("all Traitors are eliminated", LOYALISTS,
                   [](const GameState& g) {
                     return g.NumAliveOnTeam(SECRET_SOCIETY) == 0;
                   }),
      TeamWinsWhen("three missions failed", SECRET_SOCIETY,
                   [](const GameState& g) {
                     return g.GetTallies().failed_missions >=
                            kFailedMissionsToWin;
                   }),
      TeamWinsWhen("the Traitors equal or outnumber the Loyalists",
                   SECRET_SOCIETY,
                   [](const GameState& g) {
                     return g.NumAliveOnTeam(SECRET_SOCIETY) >=
                            g.NumAliveOnTeam(LOYALISTS);
                   }),
  };
}

Winner AlphaComplexGame::FallbackWinner() const {
  return TeamWinner(THE_COMPUTER, "The Computer always wins in the end");
}

string AlphaComplexGame::PublicSummary() const {
  const Tallies& tallies = g_.GetTallies();
  return absl::StrFormat(
      "%s\nMissions: %d completed, %d failed. The Computer is %s.",
      Game::PublicSummary(), tallies.completed_missions,
      tallies.failed_missions, Mood_Name(mood_));
}
}  // namespace tabletalk
