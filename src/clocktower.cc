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

#include "src/clocktower.h"

#include <algorithm>
#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "ortools/base/logging.h"

namespace tabletalk {

namespace {
const int kNumDemonBluffs = 3;

vector<string> RoleNames(absl::Span<const Role> roles) {
  vector<string> names;
  for (Role role : roles) {
    names.push_back(RoleName(role));
  }
  return names;
}
}  // namespace

ClocktowerGame::ClocktowerGame(const GameConfig& config,
                               absl::Span<const Role> roles,
                               vector<shared_ptr<Agent>> seats,
                               shared_ptr<Agent> arbiter, Recorder* recorder)
    : Game(CLOCKTOWER_LITE, config, roles, std::move(seats),
           std::move(arbiter), recorder),
      resolver_(ClocktowerAbilities()) {}

void ClocktowerGame::Setup() {
  vector<int> good, minions, demons;
  for (int i = 0; i < g_.NumPlayers(); ++i) {
    if (g_.GetTeam(i) == GOOD) {
      good.push_back(i);
    } else if (g_.GetRole(i) == IMP) {
      demons.push_back(i);
    } else {
      minions.push_back(i);
    }
  }
  if (!good.empty()) {
    g_.SetRedHerring(PickRandom(good, &rng_));
  }
  const vector<Role> in_play = g_.Roles();
  vector<Role> bluffs;
  for (Role role : RolesOf(CLOCKTOWER_LITE)) {
    if (TeamOf(role) == GOOD && !IsRoleInRoles(role, in_play)) {
      bluffs.push_back(role);
    }
  }
  Shuffle(&bluffs, &rng_);
  bluffs.resize(std::min<int>(bluffs.size(), kNumDemonBluffs));

  for (int demon : demons) {
    g_.AddFact(demon, absl::StrFormat(
                          "Your minions: %s. Good roles not in play: %s.",
                          absl::StrJoin(g_.PlayerNames(minions), ", "),
                          absl::StrJoin(RoleNames(bluffs), ", ")),
               true, IMP);
  }
  for (int minion : minions) {
    g_.AddFact(minion, absl::StrFormat(
                           "Your demon: %s. Fellow minions: %s.",
                           absl::StrJoin(g_.PlayerNames(demons), ", "),
                           absl::StrJoin(g_.PlayerNames(minions), ", ")),
               true, g_.GetRole(minion));
  }
}

void ClocktowerGame::RunPrivatePhase() {
  resolver_.Resolve(&g_, &broker_, &rng_);
}

void ClocktowerGame::RunPublicPhase() {
  CollectTableTalk();
  if (RunSlayerShots()) {
    return;
  }
  RunExecution();
}

bool ClocktowerGame::RunSlayerShots() {
  for (int slayer : g_.AlivePlayers()) {
    const RoleMetadata& meta = GetRoleMetadata(g_.GetRole(slayer));
    if (!meta.day_action || (meta.one_shot &&
                             g_.GetPlayer(slayer).ability_used)) {
      continue;
    }
    vector<string> options = g_.PlayerNames(g_.AlivePlayersExcept(slayer));
    options.push_back(kPass);
    DecisionRequest request =
        NewRequest(slayer, DAY_ABILITY, std::move(options));
    request.public_state += "\nYou may publicly shoot a player once per game: "
                            "if they are the Demon, they die. Or PASS.";
    request.fallback = kPass;
    const int target = g_.FindPlayer(broker_.Choose(request));
    if (target == kNoPlayer) {
      continue;
    }
    g_.MutablePlayer(slayer).ability_used = true;
    const bool hit = g_.GetRole(target) == IMP;
    Event event;
    RoleActionRecord* ra = event.mutable_role_action();
    ra->set_player(g_.PlayerName(slayer));
    ra->set_role(g_.GetRole(slayer));
    ra->add_targets(g_.PlayerName(target));
    ra->set_succeeded(hit);
    g_.Record(event);
    if (hit) {
      g_.Kill(target, SLAYER_SHOT);
    }
    if (CheckWin()) {
      return true;
    }
  }
  return false;
}

bool ClocktowerGame::CancelsOwnExecution(int nominee) {
  if (!GetRoleMetadata(g_.GetRole(nominee)).cancels_own_execution) {
    return false;
  }
  DecisionRequest request =
      NewRequest(nominee, CANCEL_EXECUTION, {kCancel, kAccept});
  request.public_state +=
      "\nYou were voted for execution. You may cancel it.";
  request.fallback = kAccept;
  return broker_.Choose(request) == kCancel;
}

void ClocktowerGame::RunExecution() {
  const vector<int> alive = g_.AlivePlayers();
  const NominationResult nomination = vote_.Nominate(
      alive, [this](int) { return g_.AlivePlayers(); },
      absl::StrCat(PublicSummary(), "\nNominate a player for execution."));
  if (nomination.Empty()) {
    return;
  }
  vector<VoterSpec> voters;
  for (int voter : alive) {
    const bool proxy = GetRoleMetadata(g_.GetRole(voter)).proxy_voter;
    voters.push_back({.voter = voter,
                      .depends_on = proxy ? g_.GetPlayer(voter).master
                                          : kNoPlayer});
  }
  GovernmentRecord record = vote_.Vote(nomination.nominator,
                                       nomination.nominee, voters,
                                       BallotLabels(), PublicSummary());
  const GovernmentOutcome outcome = ResolveGovernment(
      &record, {.self_cancel = [this, &nomination] {
                  return CancelsOwnExecution(nomination.nominee);
                }});
  if (outcome == GovernmentOutcome::kPassed) {
    g_.Kill(nomination.nominee, EXECUTED);
  }
  Event event;
  *event.mutable_government() = record.ToProto(g_);
  g_.Record(event);
}

vector<WinPredicate> ClocktowerGame::WinPredicates() const {
  return {
      TeamWinsWhen("the Demon is dead", GOOD,
                   [](const GameState& g) {
                     return g.AlivePlayersWithRole(IMP).empty();
                   }),
      TeamWinsWhen("only two players are alive", EVIL,
                   [](const GameState& g) { return g.NumAlive() <= 2; }),
  };
}

Winner ClocktowerGame::FallbackWinner() const {
  return g_.AlivePlayersWithRole(IMP).empty()
             ? TeamWinner(GOOD, "the Demon is dead")
             : TeamWinner(EVIL, "the Demon survived");
}

string ClocktowerGame::PublicSummary() const {
  string summary = Game::PublicSummary();
  const Time& t = g_.CurrentTime();
  if (t.is_day && t.count > 0) {
    const vector<int> deaths = g_.DeathsAtNight(t.count);
    absl::StrAppend(&summary, "\nLast night ",
                    deaths.empty()
                        ? "nobody died."
                        : absl::StrCat(absl::StrJoin(g_.PlayerNames(deaths),
                                                     ", "),
                                       " died."));
  }
  return summary;
}
}  // namespace tabletalk
