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

#ifndef SRC_MAFIA_H_
#define SRC_MAFIA_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/types/span.h"
#include "src/game.h"
#include "src/night.h"

namespace tabletalk {

class MafiaGame : public Game {
 public:
  MafiaGame(const GameConfig& config, absl::Span<const Role> roles,
            vector<shared_ptr<Agent>> seats, shared_ptr<Agent> arbiter,
            Recorder* recorder);

 protected:
  void Setup() override;
  void RunPrivatePhase() override;
  void RunPublicPhase() override;
  vector<WinPredicate> WinPredicates() const override;
  Winner FallbackWinner() const override;
  string PublicSummary() const override;

 private:
  NightResolver resolver_;
};
}  // namespace tabletalk

#endif  // SRC_MAFIA_H_
