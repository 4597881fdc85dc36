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

#include "src/mafia.h"

#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

namespace tabletalk {

MafiaGame::MafiaGame(const GameConfig& config, absl::Span<const Role> roles,
                     vector<shared_ptr<Agent>> seats,
                     shared_ptr<Agent> arbiter, Recorder* recorder)
    : Game(MAFIA_CLASSIC, config, roles, std::move(seats), std::move(arbiter),
           recorder),
      resolver_(MafiaAbilities()) {}

void MafiaGame::Setup() {
  const vector<int> mafia = g_.AlivePlayersWithRole(MAFIOSO);
  for (int mafioso : mafia) {
    g_.AddFact(mafioso, absl::StrCat("The Mafia: ",
                                     absl::StrJoin(g_.PlayerNames(mafia), ", "),
                                     "."),
               true, MAFIOSO);
  }
}

void MafiaGame::RunPrivatePhase() { resolver_.Resolve(&g_, &broker_, &rng_); }

void MafiaGame::RunPublicPhase() {
  CollectTableTalk();
  const vector<int> alive = g_.AlivePlayers();
  const NominationResult nomination = vote_.Nominate(
      alive, [this](int p) { return g_.AlivePlayersExcept(p); },
      absl::StrCat(PublicSummary(), "\nNominate a player to lynch."));
  if (nomination.Empty()) {
    return;
  }
  vector<VoterSpec> voters;
  for (int voter : alive) {
    voters.push_back({.voter = voter});
  }
  GovernmentRecord record =
      vote_.Vote(nomination.nominator, nomination.nominee, voters,
                 BallotLabels(), PublicSummary());
  if (ResolveGovernment(&record, {}) == GovernmentOutcome::kPassed) {
    g_.Kill(nomination.nominee, EXECUTED);
  }
  Event event;
  *event.mutable_government() = record.ToProto(g_);
  g_.Record(event);
}

vector<WinPredicate> MafiaGame::WinPredicates() const {
  return {
      TeamWinsWhen("the Mafia is eliminated", TOWN,
                   [](const GameState& g) {
                     return g.NumAliveOnTeam(MAFIA) == 0;
                   }),
      TeamWinsWhen("the Mafia equals or outnumbers the Town", MAFIA,
                   [](const GameState& g) {
                     const int mafia = g.NumAliveOnTeam(MAFIA);
                     return mafia >= g.NumAlive() - mafia;
                   }),
  };
}

Winner MafiaGame::FallbackWinner() const {
  return TeamWinner(MAFIA, "the Mafia survived");
}

string MafiaGame::PublicSummary() const {
  string summary = Game::PublicSummary();
  const Time& t = g_.CurrentTime();
  if (t.is_day && t.count > 0) {
    const vector<int> deaths = g_.DeathsAtNight(t.count);
    absl::StrAppend(&summary, "\nLast night ",
                    deaths.empty() ? string("nobody was killed.")
                                   : absl::StrCat(absl::StrJoin(
                                                      g_.PlayerNames(deaths),
                                                      ", "),
                                                  " was killed."));
  }
  return summary;
}
}  // namespace tabletalk
