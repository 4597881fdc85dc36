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

#include "src/roles.h"

#include <algorithm>
#include <cctype>

#include "ortools/base/logging.h"

namespace tabletalk {

namespace {
// FORTUNE_TELLER -> Fortune Teller.
string TitleCase(const string& enum_name) {
  string result;
  bool word_start = true;
  for (char c : enum_name) {
    if (c == '_') {
      result += ' ';
      word_start = true;
      continue;
    }
    result += word_start ? c : std::tolower(c);
    word_start = false;
  }
  return result;
}
}  // namespace

const RoleMetadata& GetRoleMetadata(Role role) {
  CHECK(Role_IsValid(role)) << "Invalid role " << role;
  return kRoleMetadata[role];
}

Team TeamOf(Role role) { return GetRoleMetadata(role).team; }

GameKind GameOf(Role role) { return GetRoleMetadata(role).game; }

NightStep NightStepOf(Role role) { return GetRoleMetadata(role).night_step; }

bool IsRoleInRoles(Role role, absl::Span<const Role> roles) {
  return std::find(roles.begin(), roles.end(), role) != roles.end();
}

bool IsSupportedGame(GameKind kind) {
  absl::Span<const GameKind> supported(kSupportedGames);
  return std::find(supported.begin(), supported.end(), kind) !=
         supported.end();
}

vector<Role> RolesOf(GameKind kind) {
  vector<Role> roles;
  for (int i = Role_MIN; i <= Role_MAX; ++i) {
    const Role role = Role(i);
    if (Role_IsValid(i) && kRoleMetadata[i].game == kind) {
      roles.push_back(role);
    }
  }
  return roles;
}

string RoleName(Role role) { return TitleCase(Role_Name(role)); }

string TeamName(Team team) { return TitleCase(Team_Name(team)); }
}  // namespace tabletalk
