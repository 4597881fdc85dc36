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

#ifndef SRC_SECRET_HITLER_H_
#define SRC_SECRET_HITLER_H_

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "absl/types/span.h"
#include "src/deck.h"
#include "src/game.h"
#include "src/voting.h"

namespace tabletalk {

inline constexpr char kJa[] = "JA";
inline constexpr char kNein[] = "NEIN";
inline constexpr char kVeto[] = "VETO";
inline constexpr char kEnact[] = "ENACT";
inline constexpr char kAgree[] = "AGREE";
inline constexpr char kRefuse[] = "REFUSE";

const int kLiberalPoliciesToWin = 5;
const int kFascistPoliciesToWin = 6;
const int kHitlerElectionThreshold = 3;  // Fascist policies.
const int kVetoThreshold = 5;  // Fascist policies.
const int kMaxFailedGovernments = 3;

// "LIBERAL" or "FASCIST".
string PolicyName(Policy policy);

// The presidential power granted by the n-th Fascist policy, by player count.
// EXECUTIVE_POWER_UNSPECIFIED when there is none.
ExecutivePower PowerForFascistPolicy(int num_players, int fascist_policies);

class SecretHitlerGame : public Game {
 public:
  SecretHitlerGame(const GameConfig& config, absl::Span<const Role> roles,
                   vector<shared_ptr<Agent>> seats, shared_ptr<Agent> arbiter,
                   Recorder* recorder);

  const Deck<Policy>& PolicyDeck() const { return deck_; }
  const ElectionTracker& Tracker() const { return tracker_; }
  // Players the president may nominate as Chancellor.
  vector<int> EligibleChancellors(int president) const;

 protected:
  void Setup() override;
  bool HasPrivatePhase() const override { return false; }
  void RunPublicPhase() override;
  vector<WinPredicate> WinPredicates() const override;
  Winner FallbackWinner() const override;
  string PublicSummary() const override;

 private:
  int NextPresident();
  // Draws, discards and enacts. Returns the enacted policy, or nothing when
  // the veto was invoked.
  std::optional<Policy> RunLegislativeSession(int president, int chancellor,
                                              GovernmentRecord* record);
  // The player's pick among the distinct policies in the hand, discarded.
  Policy DiscardPolicy(int player, vector<Policy>* hand);
  void Enact(Policy policy, bool top_deck);
  // A failed or vetoed government. The third one in a row enacts the top
  // policy with no power, and clears the term limits.
  void AdvanceTracker();
  void UseExecutivePower(int president, ExecutivePower power);
  // Asks the president to pick one of the candidates.
  int ChooseTarget(int president, const vector<int>& candidates,
                   const string& question);

  Deck<Policy> deck_;
  ElectionTracker tracker_;
  int president_ = kNoPlayer;  // Anchor of the seat rotation.
  int special_president_ = kNoPlayer;
  int last_president_ = kNoPlayer;
  int last_chancellor_ = kNoPlayer;
  int proposed_chancellor_ = kNoPlayer;
  int proposing_president_ = kNoPlayer;
  bool hitler_elected_ = false;
  std::set<int> investigated_;
};
}  // namespace tabletalk

#endif  // SRC_SECRET_HITLER_H_
