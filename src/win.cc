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

#include "src/win.h"

#include <utility>

namespace tabletalk {

std::optional<Winner> WinEvaluator::Evaluate(GameState* g) const {
  if (g->IsGameOver()) {
    return g->GetWinner();
  }
  std::optional<Winner> winner = Peek(*g);
  if (winner.has_value()) {
    g->SetWinner(*winner);
  }
  return winner;
}

std::optional<Winner> WinEvaluator::Peek(const GameState& g) const {
  for (const WinPredicate& predicate : predicates_) {
    std::optional<Winner> winner = predicate.check(g);
    if (winner.has_value()) {
      return winner;
    }
  }
  return std::nullopt;
}

Winner TeamWinner(Team team, const string& reason) {
  return {.team = team, .reason = reason};
}

WinPredicate TeamWinsWhen(const string& name, Team team,
                          std::function<bool(const GameState&)> condition) {
  return {.name = name,
          .check = [name, team, condition = std::move(condition)](
                       const GameState& g) -> std::optional<Winner> {
            if (condition(g)) {
              return TeamWinner(team, name);
            }
            return std::nullopt;
          }};
}
}  // namespace tabletalk
