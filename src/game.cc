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

#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "ortools/base/logging.h"

namespace tabletalk {

GameOptions OptionsFromConfig(const GameConfig& config) {
  GameOptions options;
  options.seed = config.seed();
  if (config.max_rounds() > 0) {
    options.max_rounds = config.max_rounds();
  }
  if (config.max_game_seconds() > 0) {
    options.time_budget = absl::Seconds(config.max_game_seconds());
  }
  if (config.decision_timeout_ms() > 0) {
    options.decision_timeout = absl::Milliseconds(config.decision_timeout_ms());
  }
  if (config.talks_per_player() > 0) {
    options.talks_per_player = config.talks_per_player();
  }
  if (config.recent_talk_window() > 0) {
    options.recent_talk_window = config.recent_talk_window();
  }
  return options;
}

string PhaseName(const Time& t) {
  return absl::StrFormat("%s %d", t.is_day ? "Day" : "Night", t.count);
}

Game::Game(GameKind kind, const GameConfig& config,
           absl::Span<const Role> roles, vector<shared_ptr<Agent>> seats,
           shared_ptr<Agent> arbiter, Recorder* recorder)
    : options_(OptionsFromConfig(config)),
      rng_(options_.seed + 1),
      g_(kind,
         vector<PlayerConfig>(config.players().begin(),
                              config.players().end()),
         roles, options_.seed, recorder),
      broker_(std::move(seats), std::move(arbiter), &rng_,
              options_.decision_timeout, recorder),
      vote_(&g_, &broker_, &rng_) {
  CHECK_GE(options_.max_rounds, 1);
}

void Game::Start() {
  if (evaluator_ != nullptr) {
    return;
  }
  evaluator_ = std::make_unique<WinEvaluator>(WinPredicates());
  start_ = absl::Now();
  Setup();
}

bool Game::Step() {
  Start();
  if (CheckWin()) {
    return false;
  }
  if (OverTimeBudget()) {
    ForceFallback("time budget exceeded");
    return false;
  }
  const Time& t = g_.CurrentTime();
  const bool night_next = HasPrivatePhase() && t.is_day;
  // A new round begins with its first phase.
  if ((night_next || !HasPrivatePhase()) && g_.Round() >= options_.max_rounds) {
    ForceFallback("round limit reached");
    return false;
  }
  if (night_next) {
    g_.StartNight();
    RunPrivatePhase();
  } else {
    g_.StartDay();
    RunPublicPhase();
  }
  return !CheckWin();
}

Winner Game::Play() {
  while (Step()) {
  }
  CHECK(g_.IsGameOver());
  return *g_.GetWinner();
}

bool Game::CheckWin() {
  CHECK(evaluator_ != nullptr) << "The game has not started";
  return evaluator_->Evaluate(&g_).has_value();
}

void Game::ForceFallback(const string& reason) {
  if (g_.IsGameOver()) {
    return;
  }
  Winner winner = FallbackWinner();
  winner.forced = true;
  winner.reason = winner.reason.empty()
                      ? reason
                      : absl::StrCat(reason, ": ", winner.reason);
  LOG(WARNING) << "Ending the game early, " << reason;
  g_.SetWinner(winner);
}

bool Game::OverTimeBudget() const {
  return evaluator_ != nullptr && absl::Now() - start_ > options_.time_budget;
}

string Game::PublicSummary() const {
  vector<string> dead;
  for (int i = 0; i < g_.NumPlayers(); ++i) {
    if (!g_.IsAlive(i)) {
      dead.push_back(g_.PlayerName(i));
    }
  }
  string summary = absl::StrFormat("It is %s.\nAlive: %s.",
                                   PhaseName(g_.CurrentTime()),
                                   absl::StrJoin(g_.AliveNames(), ", "));
  if (!dead.empty()) {
    absl::StrAppend(&summary, "\nDead: ", absl::StrJoin(dead, ", "), ".");
  }
  return summary;
}

DecisionRequest Game::NewRequest(int player, DecisionKind kind,
                                 vector<string> options) const {
  return g_.NewRequest(player, kind, std::move(options), PublicSummary());
}

void Game::CollectTableTalk() {
  const vector<int> speakers = g_.AlivePlayers();
  auto talk_request = [this](int speaker) {
    DecisionRequest request = NewRequest(speaker, TABLE_TALK, {});
    const vector<string> recent =
        g_.RecentTableTalk(options_.recent_talk_window);
    if (!recent.empty()) {
      absl::StrAppend(&request.public_state, "\nRecent table talk:\n",
                      absl::StrJoin(recent, "\n"));
    }
    return request;
  };
  for (int pass = 0; pass < options_.talks_per_player; ++pass) {
    if (OverTimeBudget()) {
      return;
    }
    if (pass == 0) {
      vector<DecisionRequest> requests;
      for (int speaker : speakers) {
        requests.push_back(talk_request(speaker));
      }
      const vector<Decision> decisions = broker_.DecideAll(requests);
      for (int i = 0; i < speakers.size(); ++i) {
        g_.AddTableTalk(speakers[i], decisions[i].text);
      }
      continue;
    }
    for (int speaker : speakers) {
      g_.AddTableTalk(speaker, broker_.Decide(talk_request(speaker)).text);
    }
  }
}
}  // namespace tabletalk
