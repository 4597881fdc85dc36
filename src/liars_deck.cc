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

#include "src/liars_deck.h"

#include <algorithm>
#include <functional>
#include <iterator>
#include <utility>

#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "ortools/base/logging.h"
#include "src/night.h"

namespace tabletalk {

namespace {
const int kNumEachRank = 6;
const int kNumJokers = 2;
const Card kTargetRanks[] = {QUEEN, KING, ACE};

vector<Card> StandardCards() {
  vector<Card> cards;
  for (Card rank : kTargetRanks) {
    cards.insert(cards.end(), kNumEachRank, rank);
  }
  cards.insert(cards.end(), kNumJokers, JOKER);
  return cards;
}

vector<string> CardNames(absl::Span<const Card> cards) {
  vector<string> names;
  for (Card card : cards) {
    names.push_back(Card_Name(card));
  }
  return names;
}
}  // namespace

bool IsLie(absl::Span<const Card> played, Card target) {
  return std::any_of(played.begin(), played.end(), [target](Card card) {
    return card != target && card != JOKER;
  });
}

string CardLabel(int index, Card card) {
  return absl::StrFormat("%d:%s", index + 1, Card_Name(card));
}

LiarsDeckGame::LiarsDeckGame(const GameConfig& config,
                             absl::Span<const Role> roles,
                             vector<shared_ptr<Agent>> seats,
                             shared_ptr<Agent> arbiter, Recorder* recorder)
    : Game(LIARS_DECK, config, roles, std::move(seats), std::move(arbiter),
           recorder),
      deck_(StandardCards(), &rng_) {
  hands_.resize(g_.NumPlayers());
  bullet_.assign(g_.NumPlayers(), 0);
  chamber_.assign(g_.NumPlayers(), 0);
}

void LiarsDeckGame::Setup() {
  for (int p = 0; p < g_.NumPlayers(); ++p) {
    bullet_[p] = RandomIndex(kRevolverChambers, &rng_);
  }
}

bool LiarsDeckGame::Deal() {
  for (vector<Card>& hand : hands_) {
    deck_.Discard(hand);
    hand.clear();
  }
  deck_.Discard(pile_);
  pile_.clear();
  deck_.ReshuffleDiscards();
  target_ = kTargetRanks[RandomIndex(std::size(kTargetRanks), &rng_)];
  for (int p : g_.AlivePlayers()) {
    absl::StatusOr<vector<Card>> hand = deck_.Draw(kHandSize);
    if (!hand.ok()) {
      LOG(WARNING) << hand.status();
      return false;
    }
    hands_[p] = *std::move(hand);
    g_.AddFact(p, absl::StrFormat("Round %d: the target is %s. Your hand: %s.",
                                  g_.Round(), Card_Name(target_),
                                  absl::StrJoin(CardNames(hands_[p]), ", ")),
               true, GAMBLER);
  }
  return true;
}

bool LiarsDeckGame::OthersHoldCards(int player) const {
  for (int p : g_.AlivePlayersExcept(player)) {
    if (!hands_[p].empty()) {
      return true;
    }
  }
  return false;
}

vector<Card> LiarsDeckGame::PlayCards(int player) {
  vector<Card>& hand = hands_[player];
  vector<string> labels;
  for (int i = 0; i < hand.size(); ++i) {
    labels.push_back(CardLabel(i, hand[i]));
  }
  DecisionRequest request = NewRequest(player, PLAY_CARDS, labels);
  request.max_picks = std::min<int>(kMaxCardsPerPlay, hand.size());
  absl::StrAppend(&request.public_state, "\nPlay 1 to ", request.max_picks,
                  " cards face down, claiming they are all ",
                  Card_Name(target_), ".");
  const Decision decision = broker_.Decide(request);
  vector<int> indices;
  for (const string& pick : decision.picks) {
    indices.push_back(std::find(labels.begin(), labels.end(), pick) -
                      labels.begin());
  }
  std::sort(indices.begin(), indices.end(), std::greater<int>());
  vector<Card> played;
  for (int i : indices) {
    played.push_back(hand[i]);
    hand.erase(hand.begin() + i);
  }
  pile_.insert(pile_.end(), played.begin(), played.end());
  Event event;
  CardPlay* play = event.mutable_card_play();
  play->set_player(g_.PlayerName(player));
  play->set_count(played.size());
  play->set_claimed(target_);
  g_.Record(event);
  return played;
}

bool LiarsDeckGame::WantsToChallenge(int challenger, int player, int count) {
  DecisionRequest request =
      NewRequest(challenger, CHALLENGE, {kChallenge, kPass});
  absl::StrAppend(&request.public_state, "\n", g_.PlayerName(player),
                  " played ", count, " cards claiming ", Card_Name(target_),
                  ". Call the bluff?");
  request.fallback = kPass;
  return broker_.Choose(request) == kChallenge;
}

bool LiarsDeckGame::FireRevolver(int player) {
  if (chamber_[player] == bullet_[player]) {
    return true;
  }
  chamber_[player]++;
  return false;
}

void LiarsDeckGame::RunPublicPhase() {
  if (!Deal()) {
    ForceFallback("not enough cards to deal");
    return;
  }
  int player = g_.IsAlive(starter_) ? starter_ : g_.NextAlive(starter_);
  while (true) {
    if (hands_[player].empty() && !OthersHoldCards(player)) {
      return;
    }
    while (hands_[player].empty()) {
      player = g_.NextAlive(player);
    }
    const vector<Card> played = PlayCards(player);
    const int challenger = g_.NextAlive(player);
    if (challenger == player) {
      return;
    }
    const bool forced = !OthersHoldCards(player);
    if (!forced &&
        !WantsToChallenge(challenger, player, played.size())) {
      player = challenger;
      continue;
    }
    const bool lie = IsLie(played, target_);
    const int loser = lie ? player : challenger;
    const bool died = FireRevolver(loser);
    Event event;
    ChallengeResult* result = event.mutable_challenge();
    result->set_challenger(g_.PlayerName(challenger));
    result->set_challenged(g_.PlayerName(player));
    result->set_was_lie(lie);
    result->set_forced(forced);
    result->set_penalized(g_.PlayerName(loser));
    result->set_died(died);
    g_.Record(event);
    if (died) {
      g_.Kill(loser, REVOLVER);
      starter_ = g_.NextAlive(loser);
    } else {
      starter_ = loser;
    }
    return;
  }
}

vector<WinPredicate> LiarsDeckGame::WinPredicates() const {
  return {{.name = "last player standing",
           .check = [](const GameState& g) -> std::optional<Winner> {
             if (g.NumAlive() != 1) {
               return std::nullopt;
             }
             Winner winner = TeamWinner(SOLO, "last player standing");
             winner.players = g.AliveNames();
             return winner;
           }}};
}

Winner LiarsDeckGame::FallbackWinner() const {
  int best = kNoPlayer;
  for (int p : g_.AlivePlayers()) {
    if (best == kNoPlayer || hands_[p].size() > hands_[best].size() ||
        (hands_[p].size() == hands_[best].size() &&
         chamber_[p] < chamber_[best])) {
      best = p;
    }
  }
  Winner winner = TeamWinner(SOLO, "most cards, then fewest trigger pulls");
  if (best != kNoPlayer) {
    winner.players = {g_.PlayerName(best)};
  }
  return winner;
}

string LiarsDeckGame::PublicSummary() const {
  vector<string> status;
  for (int p : g_.AlivePlayers()) {
    status.push_back(absl::StrFormat("%s holds %d cards, pulled the trigger "
                                     "%d times",
                                     g_.PlayerName(p), hands_[p].size(),
                                     chamber_[p]));
  }
  return absl::StrFormat("%s\nTarget: %s. Cards on the pile: %d.\n%s.",
                         Game::PublicSummary(), Card_Name(target_),
                         pile_.size(), absl::StrJoin(status, ".\n"));
}
}  // namespace tabletalk
