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

#ifndef SRC_LIARS_DECK_H_
#define SRC_LIARS_DECK_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/types/span.h"
#include "src/deck.h"
#include "src/game.h"

namespace tabletalk {

inline constexpr char kChallenge[] = "CHALLENGE";

const int kHandSize = 5;
const int kMaxCardsPerPlay = 3;
const int kRevolverChambers = 6;

// A play is a lie when any card is neither the target rank nor a Joker.
bool IsLie(absl::Span<const Card> played, Card target);

// "2:KING": the option label of the card at `index` in a hand.
string CardLabel(int index, Card card);

// Each round everybody gets a hand and claims to play cards of the round's
// target rank. Whoever loses a challenge pulls the trigger of their own
// revolver. The last player standing wins.
class LiarsDeckGame : public Game {
 public:
  LiarsDeckGame(const GameConfig& config, absl::Span<const Role> roles,
                vector<shared_ptr<Agent>> seats, shared_ptr<Agent> arbiter,
                Recorder* recorder);

  const Deck<Card>& Cards() const { return deck_; }
  const vector<Card>& Hand(int player) const { return hands_[player]; }
  int TriggerPulls(int player) const { return chamber_[player]; }
  Card Target() const { return target_; }

 protected:
  void Setup() override;
  bool HasPrivatePhase() const override { return false; }
  void RunPublicPhase() override;
  vector<WinPredicate> WinPredicates() const override;
  Winner FallbackWinner() const override;
  string PublicSummary() const override;

 private:
  // Collects every card and deals new hands. Returns false when the deck
  // cannot cover the deal.
  bool Deal();
  // Removes the picked cards from the player's hand onto the pile.
  vector<Card> PlayCards(int player);
  bool WantsToChallenge(int challenger, int player, int count);
  bool OthersHoldCards(int player) const;
  // Returns whether the shot was live.
  bool FireRevolver(int player);

  Deck<Card> deck_;
  vector<vector<Card>> hands_;
  vector<Card> pile_;
  vector<int> bullet_;  // Hidden live chamber of each revolver.
  vector<int> chamber_;  // Trigger pulls so far.
  Card target_ = CARD_UNSPECIFIED;
  int starter_ = 0;
};
}  // namespace tabletalk

#endif  // SRC_LIARS_DECK_H_
