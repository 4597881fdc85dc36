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

#include "src/night.h"

#include <algorithm>
#include <utility>

#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "ortools/base/logging.h"
#include "src/voting.h"

namespace tabletalk {

bool NightContext::DiedTonight(int player) const {
  return std::find(deaths.begin(), deaths.end(), player) != deaths.end();
}

bool NightContext::Tainted(int actor, absl::Span<const int> subjects) const {
  if (IsPoisoned(actor)) {
    return true;
  }
  return std::any_of(subjects.begin(), subjects.end(),
                     [this](int p) { return IsPoisoned(p); });
}

void NightContext::RecordAction(int actor, const vector<string>& targets,
                                bool succeeded) const {
  Event event;
  RoleActionRecord* ra = event.mutable_role_action();
  ra->set_player(g->PlayerName(actor));
  ra->set_role(g->GetRole(actor));
  for (const string& target : targets) {
    ra->add_targets(target);
  }
  ra->set_poisoned(IsPoisoned(actor));
  ra->set_succeeded(succeeded);
  g->Record(event);
}

namespace {
DecisionRequest NightRequest(const NightContext& ctx, int holder,
                             vector<string> options, const string& question) {
  const string state = absl::StrFormat(
      "Night %d. Alive players: %s.\n%s", ctx.g->Round(),
      absl::StrJoin(ctx.g->AliveNames(), ", "), question);
  return ctx.g->NewRequest(holder, NIGHT_ACTION, std::move(options), state);
}

// Asks the holder to pick one of the targets. No request without targets.
std::optional<DecisionRequest> TargetRequest(const NightContext& ctx,
                                             int holder,
                                             const vector<int>& targets,
                                             const string& question) {
  if (targets.empty()) {
    return std::nullopt;
  }
  return NightRequest(ctx, holder, ctx.g->PlayerNames(targets), question);
}

int PickedPlayer(const NightContext& ctx, const Decision& decision) {
  return decision.picks.empty() ? kNoPlayer
                                : ctx.g->FindPlayer(decision.Pick());
}

// A uniformly random role of the same game other than `truth`.
Role FalseRole(const NightContext& ctx, Role truth) {
  vector<Role> roles;
  for (Role role : RolesOf(ctx.g->Kind())) {
    if (role != truth) {
      roles.push_back(role);
    }
  }
  return PickRandom(roles, ctx.rng);
}

// A uniformly random number in [0, max] other than `truth`.
int FalseNumber(const NightContext& ctx, int truth, int max) {
  vector<int> numbers;
  for (int i = 0; i <= max; ++i) {
    if (i != truth) {
      numbers.push_back(i);
    }
  }
  return numbers.empty() ? truth : PickRandom(numbers, ctx.rng);
}

bool IsEvil(const GameState& g, int player) {
  return g.GetTeam(player) == EVIL;
}

// Clocktower Lite.

class PoisonerAbility : public NightAbility {
 public:
  Role GetRole() const override { return POISONER; }
  std::optional<DecisionRequest> Request(const NightContext& ctx,
                                         int holder) const override {
    return TargetRequest(ctx, holder, ctx.g->AlivePlayersExcept(holder),
                         "Choose a player to poison tonight.");
  }
  void Resolve(NightContext* ctx, absl::Span<const int> holders,
               absl::Span<const Decision> decisions) const override {
    for (int i = 0; i < holders.size(); ++i) {
      const int target = PickedPlayer(*ctx, decisions[i]);
      if (target == kNoPlayer) {
        continue;
      }
      ctx->poisoned.insert(target);
      ctx->RecordAction(holders[i], {ctx->g->PlayerName(target)}, true);
    }
  }
};

class MonkAbility : public NightAbility {
 public:
  Role GetRole() const override { return MONK; }
  std::optional<DecisionRequest> Request(const NightContext& ctx,
                                         int holder) const override {
    return TargetRequest(ctx, holder, ctx.g->AlivePlayersExcept(holder),
                         "Choose a player to protect from the Demon.");
  }
  void Resolve(NightContext* ctx, absl::Span<const int> holders,
               absl::Span<const Decision> decisions) const override {
    for (int i = 0; i < holders.size(); ++i) {
      const int target = PickedPlayer(*ctx, decisions[i]);
      if (target == kNoPlayer) {
        continue;
      }
      const bool works = !ctx->IsPoisoned(holders[i]);
      if (works) {
        ctx->protected_players.insert(target);
      }
      ctx->RecordAction(holders[i], {ctx->g->PlayerName(target)}, works);
    }
  }
};

class ImpAbility : public NightAbility {
 public:
  Role GetRole() const override { return IMP; }
  std::optional<DecisionRequest> Request(const NightContext& ctx,
                                         int holder) const override {
    return TargetRequest(ctx, holder, ctx.g->AlivePlayersExcept(holder),
                         "Choose a player to kill tonight.");
  }
  void Resolve(NightContext* ctx, absl::Span<const int> holders,
               absl::Span<const Decision> decisions) const override {
    for (int i = 0; i < holders.size(); ++i) {
      const int target = PickedPlayer(*ctx, decisions[i]);
      if (target == kNoPlayer) {
        continue;
      }
      ctx->kill_attempts.push_back(target);
      const bool kills = !ctx->IsPoisoned(holders[i]) &&
                         !ctx->IsProtected(target) && ctx->g->IsAlive(target);
      ctx->RecordAction(holders[i], {ctx->g->PlayerName(target)}, kills);
      if (kills) {
        ctx->g->Kill(target, NIGHT_KILL);
        ctx->deaths.push_back(target);
      }
    }
  }
};

class RavenkeeperAbility : public NightAbility {
 public:
  Role GetRole() const override { return RAVENKEEPER; }
  // Only holders that died tonight get here, so the choice is made late.
  void Resolve(NightContext* ctx, absl::Span<const int> holders,
               absl::Span<const Decision> decisions) const override {
    GameState* g = ctx->g;
    for (int holder : holders) {
      vector<int> others;
      for (int i = 0; i < g->NumPlayers(); ++i) {
        if (i != holder) {
          others.push_back(i);
        }
      }
      const int target = PickedPlayer(
          *ctx, ctx->broker->Decide(NightRequest(
                    *ctx, holder, g->PlayerNames(others),
                    "You died tonight. Choose a player to learn their role.")));
      const Role truth = g->GetRole(target);
      const bool tainted = ctx->Tainted(holder, {target});
      const Role shown = tainted ? FalseRole(*ctx, truth) : truth;
      ctx->RecordAction(holder, {g->PlayerName(target)}, true);
      g->AddFact(holder, absl::StrFormat("%s is the %s.", g->PlayerName(target),
                                         RoleName(shown)),
                 !tainted, RAVENKEEPER);
    }
  }
};

class UndertakerAbility : public NightAbility {
 public:
  Role GetRole() const override { return UNDERTAKER; }
  void Resolve(NightContext* ctx, absl::Span<const int> holders,
               absl::Span<const Decision> decisions) const override {
    GameState* g = ctx->g;
    const int executed = g->ExecutionOnDay(g->Round() - 1);
    if (executed == kNoPlayer) {
      return;  // Nothing to learn after a day without an execution.
    }
    for (int holder : holders) {
      const Role truth = g->GetRole(executed);
      const bool tainted = ctx->Tainted(holder, {executed});
      const Role shown = tainted ? FalseRole(*ctx, truth) : truth;
      g->AddFact(holder, absl::StrFormat("%s, executed yesterday, was the %s.",
                                         g->PlayerName(executed),
                                         RoleName(shown)),
                 !tainted, UNDERTAKER);
    }
  }
};

class EmpathAbility : public NightAbility {
 public:
  Role GetRole() const override { return EMPATH; }
  void Resolve(NightContext* ctx, absl::Span<const int> holders,
               absl::Span<const Decision> decisions) const override {
    GameState* g = ctx->g;
    for (int holder : holders) {
      const vector<int> neighbors = g->AliveNeighbors(holder);
      const int truth = std::count_if(
          neighbors.begin(), neighbors.end(),
          [g](int p) { return IsEvil(*g, p); });
      const bool tainted = ctx->Tainted(holder, neighbors);
      const int shown =
          tainted ? FalseNumber(*ctx, truth, neighbors.size()) : truth;
      g->AddFact(holder, absl::StrFormat(
                             "%d of your alive neighbours (%s) are evil.",
                             shown,
                             absl::StrJoin(g->PlayerNames(neighbors), ", ")),
                 !tainted, EMPATH);
    }
  }
};

class ChefAbility : public NightAbility {
 public:
  Role GetRole() const override { return CHEF; }
  void Resolve(NightContext* ctx, absl::Span<const int> holders,
               absl::Span<const Decision> decisions) const override {
    GameState* g = ctx->g;
    const int n = g->NumPlayers();
    int pairs = 0, num_evil = 0;
    for (int i = 0; i < n; ++i) {
      num_evil += IsEvil(*g, i);
      if (IsEvil(*g, i) && IsEvil(*g, (i + 1) % n) && (n > 2 || i == 0)) {
        ++pairs;
      }
    }
    for (int holder : holders) {
      const bool tainted = ctx->Tainted(holder, {});
      const int shown =
          tainted ? FalseNumber(*ctx, pairs, std::max(num_evil, 1)) : pairs;
      g->AddFact(holder, absl::StrFormat(
                             "%d pairs of evil players sit next to each other.",
                             shown),
                 !tainted, CHEF);
    }
  }
};

class FortuneTellerAbility : public NightAbility {
 public:
  Role GetRole() const override { return FORTUNE_TELLER; }
  std::optional<DecisionRequest> Request(const NightContext& ctx,
                                         int holder) const override {
    DecisionRequest request = NightRequest(
        ctx, holder, ctx.g->AllNames(),
        "Choose two players: you learn whether either of them is the Demon.");
    request.min_picks = request.max_picks = 2;
    return request;
  }
  void Resolve(NightContext* ctx, absl::Span<const int> holders,
               absl::Span<const Decision> decisions) const override {
    GameState* g = ctx->g;
    for (int i = 0; i < holders.size(); ++i) {
      if (decisions[i].picks.size() != 2) {
        continue;
      }
      const vector<int> picked = {g->PlayerIndex(decisions[i].picks[0]),
                                  g->PlayerIndex(decisions[i].picks[1])};
      const bool truth = std::any_of(
          picked.begin(), picked.end(), [g](int p) {
            return g->GetRole(p) == IMP || p == g->RedHerring();
          });
      const bool tainted = ctx->Tainted(holders[i], picked);
      const bool shown = tainted ? !truth : truth;
      ctx->RecordAction(holders[i], g->PlayerNames(picked), true);
      g->AddFact(holders[i], absl::StrFormat(
                                 "Is the Demon among %s and %s? %s.",
                                 g->PlayerName(picked[0]),
                                 g->PlayerName(picked[1]),
                                 shown ? "YES" : "NO"),
                 !tainted, FORTUNE_TELLER);
    }
  }
};

class ButlerAbility : public NightAbility {
 public:
  Role GetRole() const override { return BUTLER; }
  std::optional<DecisionRequest> Request(const NightContext& ctx,
                                         int holder) const override {
    return TargetRequest(
        ctx, holder, ctx.g->AlivePlayersExcept(holder),
        "Choose your master. Tomorrow, whenever they vote YES, so do you.");
  }
  void Resolve(NightContext* ctx, absl::Span<const int> holders,
               absl::Span<const Decision> decisions) const override {
    for (int i = 0; i < holders.size(); ++i) {
      const int target = PickedPlayer(*ctx, decisions[i]);
      if (target == kNoPlayer) {
        continue;
      }
      ctx->g->MutablePlayer(holders[i]).master = target;
      ctx->RecordAction(holders[i], {ctx->g->PlayerName(target)}, true);
    }
  }
};

// Mafia.

class MafiosoAbility : public NightAbility {
 public:
  Role GetRole() const override { return MAFIOSO; }
  std::optional<DecisionRequest> Request(const NightContext& ctx,
                                         int holder) const override {
    vector<int> targets;
    for (int p : ctx.g->AlivePlayers()) {
      if (ctx.g->GetTeam(p) != MAFIA) {
        targets.push_back(p);
      }
    }
    return TargetRequest(ctx, holder, targets,
                         "Propose a player for the Mafia to kill tonight.");
  }
  // The Mafia kill once per night: the most proposed target.
  void Resolve(NightContext* ctx, absl::Span<const int> holders,
               absl::Span<const Decision> decisions) const override {
    vector<pair<int, int>> proposals;
    for (int i = 0; i < holders.size(); ++i) {
      proposals.push_back({holders[i], PickedPlayer(*ctx, decisions[i])});
    }
    const NominationResult choice = ResolveNominations(proposals, ctx->rng);
    if (choice.Empty()) {
      return;
    }
    const int target = choice.nominee;
    ctx->kill_attempts.push_back(target);
    const bool kills = !ctx->IsProtected(target) && ctx->g->IsAlive(target);
    ctx->RecordAction(choice.nominator, {ctx->g->PlayerName(target)}, kills);
    if (kills) {
      ctx->g->Kill(target, NIGHT_KILL);
      ctx->deaths.push_back(target);
    }
  }
};

class DoctorAbility : public NightAbility {
 public:
  Role GetRole() const override { return DOCTOR; }
  std::optional<DecisionRequest> Request(const NightContext& ctx,
                                         int holder) const override {
    return TargetRequest(ctx, holder, ctx.g->AlivePlayers(),
                         "Choose a player to save tonight.");
  }
  void Resolve(NightContext* ctx, absl::Span<const int> holders,
               absl::Span<const Decision> decisions) const override {
    for (int i = 0; i < holders.size(); ++i) {
      const int target = PickedPlayer(*ctx, decisions[i]);
      if (target == kNoPlayer) {
        continue;
      }
      ctx->protected_players.insert(target);
      ctx->RecordAction(holders[i], {ctx->g->PlayerName(target)}, true);
    }
  }
};

class DetectiveAbility : public NightAbility {
 public:
  Role GetRole() const override { return DETECTIVE; }
  std::optional<DecisionRequest> Request(const NightContext& ctx,
                                         int holder) const override {
    return TargetRequest(ctx, holder, ctx.g->AlivePlayersExcept(holder),
                         "Choose a player to investigate.");
  }
  void Resolve(NightContext* ctx, absl::Span<const int> holders,
               absl::Span<const Decision> decisions) const override {
    GameState* g = ctx->g;
    for (int i = 0; i < holders.size(); ++i) {
      const int target = PickedPlayer(*ctx, decisions[i]);
      if (target == kNoPlayer) {
        continue;
      }
      const bool tainted = ctx->Tainted(holders[i], {target});
      const bool mafia = (g->GetTeam(target) == MAFIA) != tainted;
      ctx->RecordAction(holders[i], {g->PlayerName(target)}, true);
      g->AddFact(holders[i], absl::StrFormat(
                                 "Night %d investigation: %s is %s.",
                                 g->Round(), g->PlayerName(target),
                                 mafia ? "MAFIA" : "NOT Mafia"),
                 !tainted, DETECTIVE);
    }
  }
};

// Alpha Complex.

class TraitorAbility : public NightAbility {
 public:
  Role GetRole() const override { return TRAITOR; }
  std::optional<DecisionRequest> Request(const NightContext& ctx,
                                         int holder) const override {
    DecisionRequest request = NightRequest(
        ctx, holder, {kSabotage, kComply},
        "The team is on a mission. Do you secretly sabotage it?");
    request.fallback = kComply;
    return request;
  }
  void Resolve(NightContext* ctx, absl::Span<const int> holders,
               absl::Span<const Decision> decisions) const override {
    for (int i = 0; i < holders.size(); ++i) {
      const bool sabotaged = decisions[i].Pick() == kSabotage;
      if (sabotaged) {
        ctx->sabotage_count++;
      }
      ctx->RecordAction(holders[i], {}, sabotaged);
    }
  }
};

class MutantAbility : public NightAbility {
 public:
  Role GetRole() const override { return MUTANT; }
  std::optional<DecisionRequest> Request(const NightContext& ctx,
                                         int holder) const override {
    vector<string> options =
        ctx.g->PlayerNames(ctx.g->AlivePlayersExcept(holder));
    options.push_back(kPass);
    DecisionRequest request = NightRequest(
        ctx, holder, std::move(options),
        "You may read one mind, once per game: learn whether a player is a "
        "traitor, or PASS.");
    request.fallback = kPass;
    return request;
  }
  void Resolve(NightContext* ctx, absl::Span<const int> holders,
               absl::Span<const Decision> decisions) const override {
    GameState* g = ctx->g;
    for (int i = 0; i < holders.size(); ++i) {
      const int target = PickedPlayer(*ctx, decisions[i]);
      if (target == kNoPlayer) {
        continue;  // Passed.
      }
      g->MutablePlayer(holders[i]).ability_used = true;
      const bool tainted = ctx->Tainted(holders[i], {target});
      const bool traitor = (g->GetRole(target) == TRAITOR) != tainted;
      ctx->RecordAction(holders[i], {g->PlayerName(target)}, true);
      g->AddFact(holders[i], absl::StrFormat(
                                 "Mind reading: %s %s a traitor.",
                                 g->PlayerName(target),
                                 traitor ? "IS" : "is NOT"),
                 !tainted, MUTANT);
    }
  }
};
}  // namespace

NightResolver::NightResolver(vector<unique_ptr<NightAbility>> abilities)
    : abilities_(std::move(abilities)) {
  for (const auto& ability : abilities_) {
    CHECK(NightStepOf(ability->GetRole()) != NightStep::kNone)
        << RoleName(ability->GetRole()) << " does not act at night";
  }
}

vector<int> NightResolver::ActingHolders(const GameState& g, Role role) const {
  const RoleMetadata& meta = GetRoleMetadata(role);
  const bool first_night = g.Round() == 1;
  if ((meta.first_night_only && !first_night) ||
      (meta.other_nights_only && first_night)) {
    return {};
  }
  vector<int> holders;
  for (int p : g.AlivePlayersWithRole(role)) {
    if (!(meta.one_shot && g.GetPlayer(p).ability_used)) {
      holders.push_back(p);
    }
  }
  return holders;
}

NightSummary NightResolver::Resolve(GameState* g, DecisionBroker* broker,
                                    Rng* rng) const {
  CHECK(!g->CurrentTime().is_day) << "Night abilities resolve at night";
  NightContext ctx{.g = g, .broker = broker, .rng = rng};

  // Dusk: everybody decides against the same state.
  vector<vector<int>> holders(abilities_.size());
  vector<vector<Decision>> decisions(abilities_.size());
  vector<DecisionRequest> requests;
  vector<pair<int, int>> slots;  // (ability, holder) of each request.
  for (int a = 0; a < abilities_.size(); ++a) {
    holders[a] = ActingHolders(*g, abilities_[a]->GetRole());
    decisions[a].resize(holders[a].size());
    for (int h = 0; h < holders[a].size(); ++h) {
      std::optional<DecisionRequest> request =
          abilities_[a]->Request(ctx, holders[a][h]);
      if (request.has_value()) {
        requests.push_back(*std::move(request));
        slots.push_back({a, h});
      }
    }
  }
  const vector<Decision> answers = broker->DecideAll(requests);
  for (int k = 0; k < slots.size(); ++k) {
    decisions[slots[k].first][slots[k].second] = answers[k];
  }

  for (NightStep step : kNightSteps) {
    for (int a = 0; a < abilities_.size(); ++a) {
      if (NightStepOf(abilities_[a]->GetRole()) != step) {
        continue;
      }
      vector<int> acting;
      vector<Decision> acting_decisions;
      for (int h = 0; h < holders[a].size(); ++h) {
        const int p = holders[a][h];
        if (step == NightStep::kDeathTrigger ? ctx.DiedTonight(p)
                                             : g->IsAlive(p)) {
          acting.push_back(p);
          acting_decisions.push_back(decisions[a][h]);
        }
      }
      if (!acting.empty()) {
        abilities_[a]->Resolve(&ctx, acting, acting_decisions);
      }
    }
  }
  return {.deaths = ctx.deaths, .kill_attempts = ctx.kill_attempts,
          .sabotage_count = ctx.sabotage_count};
}

vector<unique_ptr<NightAbility>> ClocktowerAbilities() {
  vector<unique_ptr<NightAbility>> abilities;
  abilities.push_back(std::make_unique<PoisonerAbility>());
  abilities.push_back(std::make_unique<MonkAbility>());
  abilities.push_back(std::make_unique<ImpAbility>());
  abilities.push_back(std::make_unique<RavenkeeperAbility>());
  abilities.push_back(std::make_unique<UndertakerAbility>());
  abilities.push_back(std::make_unique<ChefAbility>());
  abilities.push_back(std::make_unique<EmpathAbility>());
  abilities.push_back(std::make_unique<FortuneTellerAbility>());
  abilities.push_back(std::make_unique<ButlerAbility>());
  return abilities;
}

vector<unique_ptr<NightAbility>> MafiaAbilities() {
  vector<unique_ptr<NightAbility>> abilities;
  abilities.push_back(std::make_unique<DoctorAbility>());
  abilities.push_back(std::make_unique<MafiosoAbility>());
  abilities.push_back(std::make_unique<DetectiveAbility>());
  return abilities;
}

vector<unique_ptr<NightAbility>> AlphaComplexAbilities() {
  vector<unique_ptr<NightAbility>> abilities;
  abilities.push_back(std::make_unique<TraitorAbility>());
  abilities.push_back(std::make_unique<MutantAbility>());
  return abilities;
}
}  // namespace tabletalk
