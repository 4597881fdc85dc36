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

#ifndef SRC_ALPHA_COMPLEX_H_
#define SRC_ALPHA_COMPLEX_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/types/span.h"
#include "src/game.h"
#include "src/night.h"

namespace tabletalk {

inline constexpr char kComputerName[] = "The Computer";
inline constexpr char kAccused[] = "ACCUSED";
inline constexpr char kAccuser[] = "ACCUSER";
inline constexpr char kBoth[] = "BOTH";
inline constexpr char kNeither[] = "NEITHER";
inline constexpr char kContinue[] = "CONTINUE";
inline constexpr char kTerminate[] = "TERMINATE";

const int kFailedMissionsToWin = 3;

// The verdict The Computer reaches on its own: an angry or suspicious Computer
// executes the accused, a satisfied one executes the accuser.
string MoodVerdict(Mood mood);

// Troubleshooters and a Mutant hunt the Secret Society's Traitors, under the
// eye of The Computer. An arbiter agent may play The Computer; without one,
// its verdicts follow its mood and it never ends the game early.
class AlphaComplexGame : public Game {
 public:
  AlphaComplexGame(const GameConfig& config, absl::Span<const Role> roles,
                   vector<shared_ptr<Agent>> seats, shared_ptr<Agent> arbiter,
                   Recorder* recorder);

  Mood ComputerMood() const { return mood_; }

 protected:
  void Setup() override;
  // The mission.
  void RunPrivatePhase() override;
  void RunPublicPhase() override;
  vector<WinPredicate> WinPredicates() const override;
  Winner FallbackWinner() const override;
  string PublicSummary() const override;

 private:
  void JudgeAccusation(int accuser, int accused);
  void AskToTerminate();
  DecisionRequest ComputerRequest(DecisionKind kind, vector<string> options,
                                  const string& question) const;

  NightResolver resolver_;
  Mood mood_ = SATISFIED;
  int verdict_executions_ = 0;
  int executions_at_last_mission_ = 0;
  bool terminated_ = false;
  // The surviving player The Computer handed the win to, if any.
  int named_winner_ = kNoPlayer;
};
}  // namespace tabletalk

#endif  // SRC_ALPHA_COMPLEX_H_
