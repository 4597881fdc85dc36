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

#ifndef SRC_GAME_H_
#define SRC_GAME_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/time/time.h"
#include "absl/types/span.h"
#include "src/agent.h"
#include "src/game_log.pb.h"
#include "src/game_state.h"
#include "src/recorder.h"
#include "src/util.h"
#include "src/voting.h"
#include "src/win.h"

namespace tabletalk {

using std::shared_ptr;
using std::string;
using std::unique_ptr;
using std::vector;

struct GameOptions {
  int max_rounds = 20;
  absl::Duration time_budget = absl::Hours(1);
  absl::Duration decision_timeout = absl::InfiniteDuration();
  int talks_per_player = 2;
  int recent_talk_window = 8;
  uint64_t seed = 0;
};

// Zero valued config fields keep their defaults.
GameOptions OptionsFromConfig(const GameConfig& config);

// The phase state machine shared by all games. A game alternates private
// (night) and public (day) phases, or runs public phases only, until the win
// evaluator declares a winner. The round limit and the wall-clock budget end
// every game with the game's deterministic fallback winner.
class Game {
 public:
  virtual ~Game() = default;

  // Runs the game to completion.
  Winner Play();

  // Deals setup information. Called once, before the first phase; Play and
  // Step call it when needed.
  void Start();
  // Runs the next phase and evaluates wins. Returns false once the game is
  // over.
  bool Step();

  const GameState& State() const { return g_; }
  GameState* MutableState() { return &g_; }
  DecisionBroker* Broker() { return &broker_; }
  const GameOptions& Options() const { return options_; }

 protected:
  Game(GameKind kind, const GameConfig& config, absl::Span<const Role> roles,
       vector<shared_ptr<Agent>> seats, shared_ptr<Agent> arbiter,
       Recorder* recorder);

  virtual void Setup() {}
  virtual bool HasPrivatePhase() const { return true; }
  virtual void RunPrivatePhase() {}
  virtual void RunPublicPhase() = 0;
  // In evaluation order.
  virtual vector<WinPredicate> WinPredicates() const = 0;
  // The winner declared when the round limit or the time budget run out.
  virtual Winner FallbackWinner() const = 0;
  // What every seat sees: the phase, who is alive, and the game's public
  // counters.
  virtual string PublicSummary() const;

  // Evaluates wins, returning whether the game is over.
  bool CheckWin();
  void ForceFallback(const string& reason);
  // The alive players speak `talks_per_player` times. The first pass is
  // gathered concurrently; later passes go around the table so every speaker
  // sees what was said before them.
  void CollectTableTalk();
  DecisionRequest NewRequest(int player, DecisionKind kind,
                             vector<string> options) const;
  bool OverTimeBudget() const;

  GameOptions options_;
  Rng rng_;
  GameState g_;
  DecisionBroker broker_;
  PublicVote vote_;

 private:
  unique_ptr<WinEvaluator> evaluator_;
  absl::Time start_;
};

// "Night 2", "Day 3".
string PhaseName(const Time& t);
}  // namespace tabletalk

#endif  // SRC_GAME_H_
