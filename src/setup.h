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

#ifndef SRC_SETUP_H_
#define SRC_SETUP_H_

#include <map>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "src/game_log.pb.h"
#include "src/util.h"

namespace tabletalk {

using std::map;
using std::vector;

// The built in player-count keyed role table of a game.
SetupTable DefaultSetupTable(GameKind kind);

// Checks that every row of the table adds up to its player count and only
// uses roles of the table's game.
absl::Status ValidateSetupTable(const SetupTable& table);

absl::StatusOr<SetupRow> FindSetupRow(const SetupTable& table,
                                      int num_players);

// A uniformly shuffled role assignment satisfying the table row.
absl::StatusOr<vector<Role>> AssignRoles(const SetupTable& table,
                                         int num_players, Rng* rng);

// Checks a pre-made assignment against the table row for its size.
absl::Status ValidateRoles(const SetupTable& table,
                           absl::Span<const Role> roles);

map<Team, int> CountTeams(absl::Span<const Role> roles);
}  // namespace tabletalk

#endif  // SRC_SETUP_H_
