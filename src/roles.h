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

#ifndef SRC_ROLES_H_
#define SRC_ROLES_H_

#include <string>
#include <vector>

#include "absl/types/span.h"
#include "src/game_log.pb.h"

namespace tabletalk {

using std::string;
using std::vector;

// Kinds of private phase effects, in resolution order. An earlier step may
// suppress or corrupt the effects of a later one, never the reverse.
enum class NightStep {
  kNone = 0,
  kDisrupt,        // Poison, sabotage. Lasts for the current phase only.
  kProtect,
  kKill,
  kDeathTrigger,   // Holders who died earlier this night.
  kRetrospective,  // Reads what happened in the previous public phase.
  kSense,          // Reads the current state.
  kAllegiance,     // Affects only the holder's own later votes.
};

const NightStep kNightSteps[] = {
    NightStep::kDisrupt, NightStep::kProtect, NightStep::kKill,
    NightStep::kDeathTrigger, NightStep::kRetrospective, NightStep::kSense,
    NightStep::kAllegiance};

// Describes a supported role.
struct RoleMetadata {
  GameKind game = GAME_KIND_UNSPECIFIED;
  Team team = TEAM_UNSPECIFIED;
  NightStep night_step = NightStep::kNone;
  bool first_night_only = false;
  bool other_nights_only = false;
  bool one_shot = false;  // E.g. Slayer, Mutant.
  bool proxy_voter = false;  // Votes depend on another player's ballot.
  bool day_action = false;  // Has an optional public daytime action.
  bool cancels_own_execution = false;
};

const RoleMetadata kRoleMetadata[] = {
  {},  // ROLE_UNSPECIFIED

  // Clocktower Lite roles:
  // CHEF
  {.game = CLOCKTOWER_LITE, .team = GOOD, .night_step = NightStep::kSense,
   .first_night_only = true},
  // EMPATH
  {.game = CLOCKTOWER_LITE, .team = GOOD, .night_step = NightStep::kSense},
  // FORTUNE_TELLER
  {.game = CLOCKTOWER_LITE, .team = GOOD, .night_step = NightStep::kSense},
  // UNDERTAKER
  {.game = CLOCKTOWER_LITE, .team = GOOD,
   .night_step = NightStep::kRetrospective, .other_nights_only = true},
  // MONK
  {.game = CLOCKTOWER_LITE, .team = GOOD, .night_step = NightStep::kProtect},
  // RAVENKEEPER
  {.game = CLOCKTOWER_LITE, .team = GOOD,
   .night_step = NightStep::kDeathTrigger},
  // SLAYER
  {.game = CLOCKTOWER_LITE, .team = GOOD, .one_shot = true,
   .day_action = true},
  // MAYOR
  {.game = CLOCKTOWER_LITE, .team = GOOD, .cancels_own_execution = true},
  // BUTLER
  {.game = CLOCKTOWER_LITE, .team = GOOD,
   .night_step = NightStep::kAllegiance, .proxy_voter = true},
  // POISONER
  {.game = CLOCKTOWER_LITE, .team = EVIL, .night_step = NightStep::kDisrupt},
  // IMP
  {.game = CLOCKTOWER_LITE, .team = EVIL, .night_step = NightStep::kKill},

  // Secret Hitler roles:
  // LIBERAL
  {.game = SECRET_HITLER, .team = LIBERALS},
  // FASCIST
  {.game = SECRET_HITLER, .team = FASCISTS},
  // HITLER
  {.game = SECRET_HITLER, .team = FASCISTS},

  // Mafia roles:
  // MAFIOSO
  {.game = MAFIA_CLASSIC, .team = MAFIA, .night_step = NightStep::kKill},
  // DOCTOR
  {.game = MAFIA_CLASSIC, .team = TOWN, .night_step = NightStep::kProtect},
  // DETECTIVE
  {.game = MAFIA_CLASSIC, .team = TOWN, .night_step = NightStep::kSense},
  // TOWNSPERSON
  {.game = MAFIA_CLASSIC, .team = TOWN},

  // Alpha Complex roles:
  // TROUBLESHOOTER
  {.game = ALPHA_COMPLEX, .team = LOYALISTS},
  // MUTANT
  {.game = ALPHA_COMPLEX, .team = LOYALISTS, .night_step = NightStep::kSense,
   .one_shot = true},
  // TRAITOR
  {.game = ALPHA_COMPLEX, .team = SECRET_SOCIETY,
   .night_step = NightStep::kDisrupt},

  // Liar's Deck roles:
  // GAMBLER
  {.game = LIARS_DECK, .team = SOLO},
};

static_assert(sizeof(kRoleMetadata) / sizeof(kRoleMetadata[0]) ==
              Role_ARRAYSIZE, "Every role needs metadata");

const GameKind kSupportedGames[] = {
    CLOCKTOWER_LITE, SECRET_HITLER, MAFIA_CLASSIC, ALPHA_COMPLEX, LIARS_DECK};

const RoleMetadata& GetRoleMetadata(Role role);
Team TeamOf(Role role);
GameKind GameOf(Role role);
NightStep NightStepOf(Role role);
bool IsRoleInRoles(Role role, absl::Span<const Role> roles);
bool IsSupportedGame(GameKind kind);

// All roles of a game, in enum order.
vector<Role> RolesOf(GameKind kind);

// Human readable names, e.g. "Fortune Teller", "Secret Society".
string RoleName(Role role);
string TeamName(Team team);
}  // namespace tabletalk

#endif  // SRC_ROLES_H_
