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

#ifndef SRC_VOTING_H_
#define SRC_VOTING_H_

#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/types/span.h"
#include "src/agent.h"
#include "src/game_log.pb.h"
#include "src/game_state.h"
#include "src/util.h"

namespace tabletalk {

using std::map;
using std::pair;
using std::string;
using std::vector;

struct NominationResult {
  int nominator = kNoPlayer;
  int nominee = kNoPlayer;
  map<int, int> proposals;  // Target -> number of proposers.
  bool Empty() const { return nominee == kNoPlayer; }
};

// Plurality over (proposer, target) pairs. Ties between targets, and the
// choice of nominator among the winning target's proposers, are uniformly
// random. Pairs with a kNoPlayer target are abstentions.
NominationResult ResolveNominations(absl::Span<const pair<int, int>> proposals,
                                    Rng* rng);

inline bool IsStrictMajority(int approvals, int num_voters) {
  return 2 * approvals > num_voters;
}

// A voter whose ballot may depend on another voter's ballot.
struct VoterSpec {
  int voter = kNoPlayer;
  int depends_on = kNoPlayer;
};

// Groups voters into waves such that every voter comes after the voter it
// depends on. Dependency cycles and dependencies on non-voters are ignored.
// Seat order is kept within a wave.
vector<vector<int>> VotingWaves(absl::Span<const VoterSpec> voters);

// A dependent voter mirrors an approving reference ballot, and casts their
// own ballot when the reference was a rejection.
Ballot ProxyBallot(Ballot reference, Ballot own);

// One public decision: who proposed whom, and how everybody voted.
class GovernmentRecord {
 public:
  GovernmentRecord(int round, int proposer, int target)
      : round_(round), proposer_(proposer), target_(target) {}

  int Round() const { return round_; }
  int Target() const { return target_; }

  // Each voter votes at most once, before the tally.
  absl::Status CastBallot(int voter, Ballot ballot, bool proxied = false);
  Ballot BallotOf(int voter) const;
  int NumBallots() const { return ballots_.size(); }
  int Approvals() const;

  // Computes the outcome, exactly once.
  bool Finalize(int num_eligible_voters);
  bool Passed() const;

  void SetInstantWin() { instant_win_ = true; }
  void SetVetoInvoked() { veto_invoked_ = true; }
  void SetCancelled() { cancelled_ = true; }

  Government ToProto(const GameState& g) const;

 private:
  int round_, proposer_, target_;
  map<int, pair<Ballot, bool>> ballots_;  // Voter -> (ballot, proxied).
  int num_eligible_ = 0;
  bool finalized_ = false;
  bool passed_ = false;
  bool instant_win_ = false;
  bool veto_invoked_ = false;
  bool cancelled_ = false;
};

// Counts consecutive failed governments. Reaching the maximum forces the
// top-deck path exactly once; any enactment resets it.
class ElectionTracker {
 public:
  explicit ElectionTracker(int max_failures) : max_(max_failures) {}

  // Returns true when this failure reaches the maximum. The caller then
  // performs the forced enactment, which resets the tracker.
  bool RecordFailure();
  void RecordEnactment() { value_ = 0; }
  int Value() const { return value_; }
  int Max() const { return max_; }

 private:
  int value_ = 0;
  int max_;
};

enum class GovernmentOutcome {
  kFailed,
  kPassed,
  kCancelled,   // The elected target cancelled their own elimination.
  kVetoed,      // Both parties agreed to discard the outcome.
  kInstantWin,
};

// Post-tally overrides. Any of them may be empty.
struct GovernmentOverrides {
  std::function<bool()> self_cancel;
  std::function<bool()> mutual_veto;
  std::function<bool()> instant_win;  // Supersedes all other outcomes.
};

// Applies the overrides to a finalized record, marking its trigger flags. A
// failed vote is never overridden.
GovernmentOutcome ResolveGovernment(GovernmentRecord* record,
                                    const GovernmentOverrides& overrides);

// Asks for a veto and then for consent. Consent is only asked for when a
// veto was requested.
bool ResolveMutualVeto(DecisionBroker* broker, const DecisionRequest& request,
                       const string& request_option,
                       const DecisionRequest& consent,
                       const string& consent_option);

struct BallotLabels {
  string approve = "YES";
  string reject = "NO";
};

// Runs nominations and ballots against a game state, gathering independent
// decisions concurrently and recording every step.
class PublicVote {
 public:
  PublicVote(GameState* g, DecisionBroker* broker, Rng* rng)
      : g_(g), broker_(broker), rng_(rng) {}

  // Every proposer with at least one legal target names one.
  NominationResult Nominate(
      absl::Span<const int> proposers,
      const std::function<vector<int>(int)>& legal_targets,
      const string& public_state);

  // Collects one ballot per voter, dependents after their references, and
  // finalizes the tally over all voters.
  GovernmentRecord Vote(int proposer, int target,
                        absl::Span<const VoterSpec> voters,
                        const BallotLabels& labels,
                        const string& public_state);

 private:
  GameState* g_;
  DecisionBroker* broker_;
  Rng* rng_;
};
}  // namespace tabletalk

#endif  // SRC_VOTING_H_
