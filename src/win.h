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

#ifndef SRC_WIN_H_
#define SRC_WIN_H_

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "src/game_state.h"

namespace tabletalk {

using std::string;
using std::vector;

// One win condition: returns the winner when it holds.
struct WinPredicate {
  string name;
  std::function<std::optional<Winner>(const GameState&)> check;
};

// Evaluates the predicates in order and stops at the first one that fires.
// The result is cached in the GameState: once a winner exists, it is returned
// unchanged by every later call, whatever happened to the state since.
class WinEvaluator {
 public:
  explicit WinEvaluator(vector<WinPredicate> predicates)
      : predicates_(std::move(predicates)) {}

  std::optional<Winner> Evaluate(GameState* g) const;
  // The first firing predicate's winner, ignoring and not touching the cache.
  std::optional<Winner> Peek(const GameState& g) const;

 private:
  vector<WinPredicate> predicates_;
};

Winner TeamWinner(Team team, const string& reason);

// A predicate that fires with `team` whenever `condition` holds.
WinPredicate TeamWinsWhen(const string& name, Team team,
                          std::function<bool(const GameState&)> condition);
}  // namespace tabletalk

#endif  // SRC_WIN_H_
