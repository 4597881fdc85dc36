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

#include "src/secret_hitler.h"

#include <algorithm>
#include <optional>
#include <utility>

#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "ortools/base/logging.h"

namespace tabletalk {

namespace {
const int kNumLiberalPolicies = 6;
const int kNumFascistPolicies = 11;
const int kPoliciesPerSession = 3;
const int kHitlerKnowsFascistsUpTo = 6;  // Players.
const int kStrictTermLimitsUpTo = 6;  // Alive players.

vector<Policy> StandardPolicies() {
  vector<Policy> policies(kNumLiberalPolicies, LIBERAL_POLICY);
  policies.insert(policies.end(), kNumFascistPolicies, FASCIST_POLICY);
  return policies;
}

bool IsFascist(Role role) { return TeamOf(role) == FASCISTS; }
}  // namespace

string PolicyName(Policy policy) {
  switch (policy) {
    case LIBERAL_POLICY:
      return "LIBERAL";
    case FASCIST_POLICY:
      return "FASCIST";
    default:
      return "";
  }
}

ExecutivePower PowerForFascistPolicy(int num_players, int fascist_policies) {
  // Indexed by the number of Fascist policies enacted, starting at 1.
  static const ExecutivePower kSmall[] = {
      EXECUTIVE_POWER_UNSPECIFIED, EXECUTIVE_POWER_UNSPECIFIED, POLICY_PEEK,
      EXECUTION, EXECUTION};
  static const ExecutivePower kMedium[] = {
      EXECUTIVE_POWER_UNSPECIFIED, INVESTIGATE_LOYALTY, SPECIAL_ELECTION,
      EXECUTION, EXECUTION};
  static const ExecutivePower kLarge[] = {
      INVESTIGATE_LOYALTY, INVESTIGATE_LOYALTY, SPECIAL_ELECTION, EXECUTION,
      EXECUTION};
  if (fascist_policies < 1 || fascist_policies >= kFascistPoliciesToWin) {
    return EXECUTIVE_POWER_UNSPECIFIED;
  }
  const int i = fascist_policies - 1;
  if (num_players <= 6) {
    return kSmall[i];
  }
  return num_players <= 8 ? kMedium[i] : kLarge[i];
}

SecretHitlerGame::SecretHitlerGame(const GameConfig& config,
                                   absl::Span<const Role> roles,
                                   vector<shared_ptr<Agent>> seats,
                                   shared_ptr<Agent> arbiter,
                                   Recorder* recorder)
    : Game(SECRET_HITLER, config, roles, std::move(seats), std::move(arbiter),
           recorder),
      deck_(StandardPolicies(), &rng_),
      tracker_(kMaxFailedGovernments) {}

void SecretHitlerGame::Setup() {
  vector<int> fascists, hitler;
  for (int i = 0; i < g_.NumPlayers(); ++i) {
    if (g_.GetRole(i) == HITLER) {
      hitler.push_back(i);
    } else if (g_.GetRole(i) == FASCIST) {
      fascists.push_back(i);
    }
  }
  for (int fascist : fascists) {
    vector<int> others;
    for (int f : fascists) {
      if (f != fascist) {
        others.push_back(f);
      }
    }
    g_.AddFact(fascist, absl::StrFormat(
                            "Hitler is %s. Your fellow Fascists: %s.",
                            absl::StrJoin(g_.PlayerNames(hitler), ", "),
                            others.empty()
                                ? "none"
                                : absl::StrJoin(g_.PlayerNames(others), ", ")),
               true, FASCIST);
  }
  if (g_.NumPlayers() <= kHitlerKnowsFascistsUpTo && !fascists.empty()) {
    for (int h : hitler) {
      g_.AddFact(h, absl::StrFormat("%s is a Fascist.",
                                    g_.PlayerName(fascists[0])),
                 true, HITLER);
    }
  }
}

vector<int> SecretHitlerGame::EligibleChancellors(int president) const {
  const bool strict = g_.NumAlive() <= kStrictTermLimitsUpTo;
  vector<int> eligible;
  for (int p : g_.AlivePlayersExcept(president)) {
    if (p == last_chancellor_ || (strict && p == last_president_)) {
      continue;
    }
    eligible.push_back(p);
  }
  if (eligible.empty()) {
    return g_.AlivePlayersExcept(president);
  }
  return eligible;
}

int SecretHitlerGame::NextPresident() {
  if (special_president_ != kNoPlayer) {
    const int president = special_president_;
    special_president_ = kNoPlayer;
    if (g_.IsAlive(president)) {
      return president;
    }
  }
  if (president_ == kNoPlayer) {
    president_ = g_.IsAlive(0) ? 0 : g_.NextAlive(0);
  } else {
    president_ = g_.NextAlive(president_);
  }
  return president_;
}

void SecretHitlerGame::RunPublicPhase() {
  const int president = NextPresident();
  const vector<int> candidates = EligibleChancellors(president);
  if (candidates.empty()) {
    ForceFallback("no Chancellor candidates left");
    return;
  }
  DecisionRequest request = NewRequest(president, CHOOSE_CHANCELLOR,
                                       g_.PlayerNames(candidates));
  request.public_state += "\nYou are the President. Nominate a Chancellor.";
  const int chancellor = g_.PlayerIndex(broker_.Choose(request));
  proposing_president_ = president;
  proposed_chancellor_ = chancellor;
  Event event;
  event.mutable_nomination()->set_nominator(g_.PlayerName(president));
  event.mutable_nomination()->set_nominee(g_.PlayerName(chancellor));
  g_.Record(event);

  CollectTableTalk();

  vector<VoterSpec> voters;
  for (int voter : g_.AlivePlayers()) {
    voters.push_back({.voter = voter});
  }
  GovernmentRecord record =
      vote_.Vote(president, chancellor, voters,
                 {.approve = kJa, .reject = kNein}, PublicSummary());
  proposing_president_ = proposed_chancellor_ = kNoPlayer;
  const GovernmentOutcome outcome = ResolveGovernment(
      &record, {.instant_win = [this, chancellor] {
                  return g_.GetRole(chancellor) == HITLER &&
                         g_.GetTallies().fascist_policies >=
                             kHitlerElectionThreshold;
                }});
  std::optional<Policy> enacted;
  switch (outcome) {
    case GovernmentOutcome::kInstantWin:
      hitler_elected_ = true;
      break;
    case GovernmentOutcome::kFailed:
      AdvanceTracker();
      break;
    default:
      last_president_ = president;
      last_chancellor_ = chancellor;
      enacted = RunLegislativeSession(president, chancellor, &record);
  }
  Event government;
  *government.mutable_government() = record.ToProto(g_);
  g_.Record(government);
  if (enacted == FASCIST_POLICY) {
    const ExecutivePower power = PowerForFascistPolicy(
        g_.NumPlayers(), g_.GetTallies().fascist_policies);
    if (power != EXECUTIVE_POWER_UNSPECIFIED) {
      UseExecutivePower(president, power);
    }
  }
}

Policy SecretHitlerGame::DiscardPolicy(int player, vector<Policy>* hand) {
  vector<string> options;
  for (Policy policy : *hand) {
    if (std::find(options.begin(), options.end(), PolicyName(policy)) ==
        options.end()) {
      options.push_back(PolicyName(policy));
    }
  }
  Policy discarded = hand->front();
  if (options.size() > 1) {
    vector<string> hand_names;
    for (Policy policy : *hand) {
      hand_names.push_back(PolicyName(policy));
    }
    DecisionRequest request =
        NewRequest(player, DISCARD_POLICY, std::move(options));
    absl::StrAppend(&request.public_state, "\nYour policies: ",
                    absl::StrJoin(hand_names, ", "),
                    ". Choose one to discard.");
    discarded = broker_.Choose(request) == PolicyName(LIBERAL_POLICY)
                    ? LIBERAL_POLICY
                    : FASCIST_POLICY;
  }
  hand->erase(std::find(hand->begin(), hand->end(), discarded));
  deck_.Discard(discarded);
  return discarded;
}

std::optional<Policy> SecretHitlerGame::RunLegislativeSession(
    int president, int chancellor, GovernmentRecord* record) {
  absl::StatusOr<vector<Policy>> drawn = deck_.Draw(kPoliciesPerSession);
  if (!drawn.ok()) {
    LOG(WARNING) << drawn.status();
    ForceFallback("the policy deck is exhausted");
    return std::nullopt;
  }
  vector<Policy> hand = *std::move(drawn);
  DiscardPolicy(president, &hand);
  DiscardPolicy(chancellor, &hand);
  CHECK_EQ(hand.size(), 1);
  const Policy policy = hand[0];

  if (g_.GetTallies().fascist_policies >= kVetoThreshold) {
    DecisionRequest request =
        NewRequest(chancellor, REQUEST_VETO, {kVeto, kEnact});
    absl::StrAppend(&request.public_state, "\nYou are about to enact a ",
                    PolicyName(policy),
                    " policy. You may ask the President to veto it.");
    request.fallback = kEnact;
    DecisionRequest consent =
        NewRequest(president, CONSENT_VETO, {kAgree, kRefuse});
    consent.public_state += "\nThe Chancellor requests a veto. Do you agree?";
    consent.fallback = kRefuse;
    if (ResolveMutualVeto(&broker_, request, kVeto, consent, kAgree)) {
      record->SetVetoInvoked();
      deck_.Discard(policy);
      AdvanceTracker();
      return std::nullopt;
    }
  }
  Enact(policy, false);
  tracker_.RecordEnactment();
  return policy;
}

void SecretHitlerGame::Enact(Policy policy, bool top_deck) {
  Tallies& tallies = g_.MutableTallies();
  if (policy == LIBERAL_POLICY) {
    tallies.liberal_policies++;
  } else {
    tallies.fascist_policies++;
  }
  Event event;
  PolicyEnacted* enacted = event.mutable_policy();
  enacted->set_policy(policy);
  enacted->set_top_deck(top_deck);
  enacted->set_liberal_policies(tallies.liberal_policies);
  enacted->set_fascist_policies(tallies.fascist_policies);
  g_.Record(event);
}

void SecretHitlerGame::AdvanceTracker() {
  const bool forced = tracker_.RecordFailure();
  Event event;
  event.mutable_tracker()->set_value(tracker_.Value());
  event.mutable_tracker()->set_forced_enactment(forced);
  g_.Record(event);
  if (!forced) {
    return;
  }
  tracker_.RecordEnactment();
  absl::StatusOr<vector<Policy>> top = deck_.Draw(1);
  if (!top.ok()) {
    LOG(WARNING) << top.status();
    ForceFallback("the policy deck is exhausted");
    return;
  }
  Enact(top->front(), true);
  last_president_ = last_chancellor_ = kNoPlayer;
}

int SecretHitlerGame::ChooseTarget(int president,
                                   const vector<int>& candidates,
                                   const string& question) {
  DecisionRequest request = NewRequest(president, USE_EXECUTIVE_POWER,
                                       g_.PlayerNames(candidates));
  absl::StrAppend(&request.public_state, "\n", question);
  return g_.PlayerIndex(broker_.Choose(request));
}

void SecretHitlerGame::UseExecutivePower(int president, ExecutivePower power) {
  Event event;
  ExecutivePowerUsed* used = event.mutable_executive_power();
  used->set_power(power);
  used->set_president(g_.PlayerName(president));
  switch (power) {
    case INVESTIGATE_LOYALTY: {
      vector<int> candidates;
      for (int p : g_.AlivePlayersExcept(president)) {
        if (!investigated_.contains(p)) {
          candidates.push_back(p);
        }
      }
      if (candidates.empty()) {
        return;
      }
      const int target = ChooseTarget(
          president, candidates, "Choose a player to investigate their party.");
      investigated_.insert(target);
      used->set_target(g_.PlayerName(target));
      g_.Record(event);
      g_.AddFact(president, absl::StrFormat(
                                "%s is a member of the %s party.",
                                g_.PlayerName(target),
                                IsFascist(g_.GetRole(target)) ? "Fascist"
                                                              : "Liberal"),
                 true, g_.GetRole(president));
      break;
    }
    case SPECIAL_ELECTION: {
      const int target =
          ChooseTarget(president, g_.AlivePlayersExcept(president),
                       "Choose the next President.");
      special_president_ = target;
      used->set_target(g_.PlayerName(target));
      g_.Record(event);
      break;
    }
    case POLICY_PEEK: {
      g_.Record(event);
      absl::StatusOr<vector<Policy>> top = deck_.Peek(kPoliciesPerSession);
      if (!top.ok()) {
        LOG(WARNING) << top.status();
        return;
      }
      vector<string> names;
      for (Policy policy : *top) {
        names.push_back(PolicyName(policy));
      }
      g_.AddFact(president, absl::StrFormat(
                                "The next three policies are: %s.",
                                absl::StrJoin(names, ", ")),
                 true, g_.GetRole(president));
      break;
    }
    case EXECUTION: {
      const int target =
          ChooseTarget(president, g_.AlivePlayersExcept(president),
                       "Choose a player to execute.");
      used->set_target(g_.PlayerName(target));
      g_.Record(event);
      g_.Kill(target, PRESIDENTIAL_ORDER);
      CheckWin();
      break;
    }
    default:
      LOG(FATAL) << "Unexpected power " << ExecutivePower_Name(power);
  }
}

vector<WinPredicate> SecretHitlerGame::WinPredicates() const {
  return {
      TeamWinsWhen("Hitler was elected Chancellor", FASCISTS,
                   [this](const GameState&) { return hitler_elected_; }),
      TeamWinsWhen("Hitler was executed", LIBERALS,
                   [](const GameState& g) {
                     return g.AlivePlayersWithRole(HITLER).empty();
                   }),
      TeamWinsWhen("five Liberal policies were enacted", LIBERALS,
                   [](const GameState& g) {
                     return g.GetTallies().liberal_policies >=
                            kLiberalPoliciesToWin;
                   }),
      TeamWinsWhen("six Fascist policies were enacted", FASCISTS,
                   [](const GameState& g) {
                     return g.GetTallies().fascist_policies >=
                            kFascistPoliciesToWin;
                   }),
  };
}

Winner SecretHitlerGame::FallbackWinner() const {
  const Tallies& tallies = g_.GetTallies();
  // Progress along each track, compared as fractions of the goal.
  if (tallies.liberal_policies * kFascistPoliciesToWin >
      tallies.fascist_policies * kLiberalPoliciesToWin) {
    return TeamWinner(LIBERALS, "the Liberal track is further along");
  }
  return TeamWinner(FASCISTS, "the Fascist track is at least as far along");
}

string SecretHitlerGame::PublicSummary() const {
  const Tallies& tallies = g_.GetTallies();
  string summary = absl::StrFormat(
      "%s\nLiberal policies: %d/%d. Fascist policies: %d/%d. Election "
      "tracker: %d/%d.",
      Game::PublicSummary(), tallies.liberal_policies, kLiberalPoliciesToWin,
      tallies.fascist_policies, kFascistPoliciesToWin, tracker_.Value(),
      tracker_.Max());
  if (last_chancellor_ != kNoPlayer) {
    absl::StrAppend(&summary, "\nLast government: President ",
                    g_.PlayerName(last_president_), ", Chancellor ",
                    g_.PlayerName(last_chancellor_), ".");
  }
  if (proposed_chancellor_ != kNoPlayer) {
    absl::StrAppend(&summary, "\nPresident ",
                    g_.PlayerName(proposing_president_), " proposes ",
                    g_.PlayerName(proposed_chancellor_), " as Chancellor.");
  }
  return summary;
}
}  // namespace tabletalk
