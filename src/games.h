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

#ifndef SRC_GAMES_H_
#define SRC_GAMES_H_

#include <memory>
#include <vector>

#include "absl/status/statusor.h"
#include "src/agent.h"
#include "src/game.h"
#include "src/game_log.pb.h"
#include "src/recorder.h"

namespace tabletalk {

// Validates the configuration, assigns roles (unless every player has one
// already), and creates the game. `seats` are aligned with config.players();
// `arbiter` may be null. The recorder must outlive the game.
absl::StatusOr<std::unique_ptr<Game>> NewGame(
    const GameConfig& config, std::vector<std::shared_ptr<Agent>> seats,
    std::shared_ptr<Agent> arbiter, Recorder* recorder);

// The setup table a config plays with: its own override, or the default.
SetupTable SetupTableFor(const GameConfig& config);
}  // namespace tabletalk

#endif  // SRC_GAMES_H_
