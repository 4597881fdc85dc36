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

#ifndef SRC_NIGHT_H_
#define SRC_NIGHT_H_

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "absl/types/span.h"
#include "src/agent.h"
#include "src/game_log.pb.h"
#include "src/game_state.h"
#include "src/roles.h"
#include "src/util.h"

namespace tabletalk {

using std::set;
using std::string;
using std::unique_ptr;
using std::vector;

// Scratch state of one private phase. It is dropped when the phase ends, so
// poison and protection never outlive the night.
struct NightContext {
  GameState* g = nullptr;
  DecisionBroker* broker = nullptr;
  Rng* rng = nullptr;
  set<int> poisoned;
  set<int> protected_players;
  vector<int> kill_attempts;
  vector<int> deaths;
  int sabotage_count = 0;

  bool IsPoisoned(int player) const { return poisoned.contains(player); }
  bool IsProtected(int player) const {
    return protected_players.contains(player);
  }
  bool DiedTonight(int player) const;
  // Whether information the actor gets about the subjects is corrupted.
  bool Tainted(int actor, absl::Span<const int> subjects) const;
  // Records what a holder did, e.g. whom they poisoned.
  void RecordAction(int actor, const vector<string>& targets,
                    bool succeeded) const;
};

// The private-phase power of one role. Abilities are stateless; all state
// lives in the NightContext and the GameState.
class NightAbility {
 public:
  virtual ~NightAbility() = default;
  virtual Role GetRole() const = 0;

  // The decision a holder makes at dusk, before anything is resolved. Passive
  // and death-triggered roles make none.
  virtual std::optional<DecisionRequest> Request(const NightContext& ctx,
                                                 int holder) const {
    return std::nullopt;
  }

  // Applies the effect for every acting holder, in seat order. `decisions`
  // are aligned with `holders` and are empty for roles without a request.
  virtual void Resolve(NightContext* ctx, absl::Span<const int> holders,
                       absl::Span<const Decision> decisions) const = 0;
};

struct NightSummary {
  vector<int> deaths;
  vector<int> kill_attempts;
  int sabotage_count = 0;
};

// Resolves the private phase: every dusk decision is gathered concurrently,
// then the abilities are applied step by step in kNightSteps order.
class NightResolver {
 public:
  explicit NightResolver(vector<unique_ptr<NightAbility>> abilities);

  NightSummary Resolve(GameState* g, DecisionBroker* broker, Rng* rng) const;

 private:
  // Alive holders of the role that wake up this night.
  vector<int> ActingHolders(const GameState& g, Role role) const;

  vector<unique_ptr<NightAbility>> abilities_;
};

vector<unique_ptr<NightAbility>> ClocktowerAbilities();
vector<unique_ptr<NightAbility>> MafiaAbilities();
vector<unique_ptr<NightAbility>> AlphaComplexAbilities();

// Option labels of the Alpha Complex private phase.
inline constexpr char kSabotage[] = "SABOTAGE";
inline constexpr char kComply[] = "COMPLY";
inline constexpr char kPass[] = "PASS";
}  // namespace tabletalk

#endif  // SRC_NIGHT_H_
