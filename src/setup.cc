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

#include "src/setup.h"

#include <initializer_list>
#include <set>
#include <utility>

#include "absl/strings/str_format.h"
#include "ortools/base/logging.h"
#include "src/roles.h"

namespace tabletalk {

namespace {
using std::pair;

const Role kClocktowerGoodRoles[] = {
    CHEF, EMPATH, FORTUNE_TELLER, UNDERTAKER, MONK, RAVENKEEPER, SLAYER,
    MAYOR, BUTLER};

// Secret Hitler: number of Liberals and Fascists other than Hitler, for
// 5 to 10 players.
const int kNumLiberals[] = {3, 4, 4, 5, 5, 6};
const int kNumFascists[] = {1, 1, 2, 2, 3, 3};

SetupRow Row(int num_players,
             std::initializer_list<pair<Role, int>> role_counts) {
  SetupRow row;
  row.set_num_players(num_players);
  for (const auto& [role, count] : role_counts) {
    if (count == 0) {
      continue;
    }
    RoleCount* rc = row.add_roles();
    rc->set_role(role);
    rc->set_count(count);
  }
  return row;
}

SetupTable ClocktowerTable() {
  SetupTable table;
  table.set_kind(CLOCKTOWER_LITE);
  for (int n = 5; n <= 11; ++n) {
    SetupRow* row = table.add_rows();
    *row = Row(n, {{IMP, 1}, {POISONER, 1}});
    for (Role role : kClocktowerGoodRoles) {
      row->mutable_pool()->add_roles(role);
    }
    row->mutable_pool()->set_count(n - 2);
  }
  return table;
}

SetupTable SecretHitlerTable() {
  SetupTable table;
  table.set_kind(SECRET_HITLER);
  for (int n = 5; n <= 10; ++n) {
    *table.add_rows() = Row(n, {{LIBERAL, kNumLiberals[n - 5]},
                                {FASCIST, kNumFascists[n - 5]},
                                {HITLER, 1}});
  }
  return table;
}

SetupTable MafiaTable() {
  SetupTable table;
  table.set_kind(MAFIA_CLASSIC);
  for (int n = 5; n <= 12; ++n) {
    const int mafia = n < 7 ? 1 : (n < 10 ? 2 : 3);
    *table.add_rows() = Row(n, {{MAFIOSO, mafia}, {DOCTOR, 1},
                                {DETECTIVE, 1}, {TOWNSPERSON, n - mafia - 2}});
  }
  return table;
}

SetupTable AlphaComplexTable() {
  SetupTable table;
  table.set_kind(ALPHA_COMPLEX);
  for (int n = 4; n <= 8; ++n) {
    const int traitors = n < 6 ? 1 : 2;
    *table.add_rows() = Row(n, {{TRAITOR, traitors}, {MUTANT, 1},
                                {TROUBLESHOOTER, n - traitors - 1}});
  }
  return table;
}

SetupTable LiarsDeckTable() {
  SetupTable table;
  table.set_kind(LIARS_DECK);
  for (int n = 2; n <= 4; ++n) {
    *table.add_rows() = Row(n, {{GAMBLER, n}});
  }
  return table;
}
}  // namespace

SetupTable DefaultSetupTable(GameKind kind) {
  switch (kind) {
    case CLOCKTOWER_LITE:
      return ClocktowerTable();
    case SECRET_HITLER:
      return SecretHitlerTable();
    case MAFIA_CLASSIC:
      return MafiaTable();
    case ALPHA_COMPLEX:
      return AlphaComplexTable();
    case LIARS_DECK:
      return LiarsDeckTable();
    default:
      CHECK(false) << "Unsupported game " << GameKind_Name(kind);
  }
  return SetupTable();
}

absl::Status ValidateSetupTable(const SetupTable& table) {
  std::set<int> sizes;
  for (const SetupRow& row : table.rows()) {
    if (!sizes.insert(row.num_players()).second) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Duplicate setup row for %d players", row.num_players()));
    }
    int total = 0;
    std::set<Role> fixed;
    for (const RoleCount& rc : row.roles()) {
      if (!Role_IsValid(rc.role()) || GameOf(rc.role()) != table.kind() ||
          rc.count() <= 0) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "Invalid entry %s x%d for %d players", Role_Name(rc.role()),
            rc.count(), row.num_players()));
      }
      fixed.insert(rc.role());
      total += rc.count();
    }
    std::set<Role> pool;
    for (int role : row.pool().roles()) {
      if (!Role_IsValid(role) || GameOf(Role(role)) != table.kind() ||
          fixed.contains(Role(role)) || !pool.insert(Role(role)).second) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "Invalid pool role %s for %d players", Role_Name(role),
            row.num_players()));
      }
    }
    if (row.pool().count() < 0 || row.pool().count() > pool.size()) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Cannot draw %d roles from a pool of %d", row.pool().count(),
          pool.size()));
    }
    total += row.pool().count();
    if (total != row.num_players()) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Setup row for %d players assigns %d roles", row.num_players(),
          total));
    }
  }
  return absl::OkStatus();
}

absl::StatusOr<SetupRow> FindSetupRow(const SetupTable& table,
                                      int num_players) {
  for (const SetupRow& row : table.rows()) {
    if (row.num_players() == num_players) {
      return row;
    }
  }
  return absl::InvalidArgumentError(absl::StrFormat(
      "%s does not support %d players", GameKind_Name(table.kind()),
      num_players));
}

absl::StatusOr<vector<Role>> AssignRoles(const SetupTable& table,
                                         int num_players, Rng* rng) {
  absl::Status valid = ValidateSetupTable(table);
  if (!valid.ok()) {
    return valid;
  }
  absl::StatusOr<SetupRow> row = FindSetupRow(table, num_players);
  if (!row.ok()) {
    return row.status();
  }
  vector<Role> roles;
  for (const RoleCount& rc : row->roles()) {
    roles.insert(roles.end(), rc.count(), rc.role());
  }
  vector<Role> pool;
  for (int role : row->pool().roles()) {
    pool.push_back(Role(role));
  }
  Shuffle(&pool, rng);
  roles.insert(roles.end(), pool.begin(), pool.begin() + row->pool().count());
  Shuffle(&roles, rng);
  return roles;
}

absl::Status ValidateRoles(const SetupTable& table,
                           absl::Span<const Role> roles) {
  absl::Status valid = ValidateSetupTable(table);
  if (!valid.ok()) {
    return valid;
  }
  absl::StatusOr<SetupRow> row = FindSetupRow(table, roles.size());
  if (!row.ok()) {
    return row.status();
  }
  map<Role, int> expected;
  for (const RoleCount& rc : row->roles()) {
    expected[rc.role()] = rc.count();
  }
  std::set<Role> pool;
  for (int role : row->pool().roles()) {
    pool.insert(Role(role));
  }
  std::set<Role> drawn;
  for (Role role : roles) {
    auto it = expected.find(role);
    if (it != expected.end() && it->second > 0) {
      it->second--;
    } else if (pool.contains(role) && drawn.insert(role).second) {
      continue;
    } else {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Unexpected %s for %d players", Role_Name(role), roles.size()));
    }
  }
  for (const auto& [role, missing] : expected) {
    if (missing != 0) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Missing %d x %s for %d players", missing, Role_Name(role),
          roles.size()));
    }
  }
  if (drawn.size() != row->pool().count()) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Expected %d pool roles, got %d", row->pool().count(), drawn.size()));
  }
  return absl::OkStatus();
}

map<Team, int> CountTeams(absl::Span<const Role> roles) {
  map<Team, int> result;
  for (Role role : roles) {
    result[TeamOf(role)]++;
  }
  return result;
}
}  // namespace tabletalk
