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

#include "src/voting.h"

#include <set>

#include "absl/strings/str_format.h"
#include "ortools/base/logging.h"

namespace tabletalk {

NominationResult ResolveNominations(absl::Span<const pair<int, int>> proposals,
                                    Rng* rng) {
  map<int, vector<int>> proposers_by_target;
  for (const auto& [proposer, target] : proposals) {
    if (target != kNoPlayer) {
      proposers_by_target[target].push_back(proposer);
    }
  }
  NominationResult result;
  if (proposers_by_target.empty()) {
    return result;
  }
  int most = 0;
  vector<int> tied;
  for (const auto& [target, proposers] : proposers_by_target) {
    const int count = proposers.size();
    result.proposals[target] = count;
    if (count > most) {
      most = count;
      tied = {target};
    } else if (count == most) {
      tied.push_back(target);
    }
  }
  result.nominee = PickRandom(tied, rng);
  result.nominator = PickRandom(proposers_by_target[result.nominee], rng);
  return result;
}

vector<vector<int>> VotingWaves(absl::Span<const VoterSpec> voters) {
  std::set<int> voting;
  for (const VoterSpec& v : voters) {
    voting.insert(v.voter);
  }
  map<int, int> reference;
  for (const VoterSpec& v : voters) {
    if (v.depends_on != kNoPlayer && v.depends_on != v.voter &&
        voting.contains(v.depends_on)) {
      reference[v.voter] = v.depends_on;
    }
  }
  vector<vector<int>> waves;
  for (const VoterSpec& v : voters) {
    int depth = 0;
    std::set<int> visited = {v.voter};
    for (auto it = reference.find(v.voter); it != reference.end();
         it = reference.find(it->second)) {
      if (!visited.insert(it->second).second) {
        depth = 0;  // A cycle: everybody on it votes independently.
        break;
      }
      ++depth;
    }
    if (waves.size() <= depth) {
      waves.resize(depth + 1);
    }
    waves[depth].push_back(v.voter);
  }
  return waves;
}

Ballot ProxyBallot(Ballot reference, Ballot own) {
  return reference == APPROVE ? APPROVE : own;
}

absl::Status GovernmentRecord::CastBallot(int voter, Ballot ballot,
                                          bool proxied) {
  if (finalized_) {
    return absl::FailedPreconditionError("The tally is already final");
  }
  if (ballot != APPROVE && ballot != REJECT) {
    return absl::InvalidArgumentError("A ballot is either APPROVE or REJECT");
  }
  if (!ballots_.emplace(voter, std::make_pair(ballot, proxied)).second) {
    return absl::AlreadyExistsError(
        absl::StrFormat("Player %d already voted", voter));
  }
  return absl::OkStatus();
}

Ballot GovernmentRecord::BallotOf(int voter) const {
  const auto& it = ballots_.find(voter);
  CHECK(it != ballots_.end()) << "Player " << voter << " did not vote";
  return it->second.first;
}

int GovernmentRecord::Approvals() const {
  int approvals = 0;
  for (const auto& [voter, ballot] : ballots_) {
    if (ballot.first == APPROVE) {
      ++approvals;
    }
  }
  return approvals;
}

bool GovernmentRecord::Finalize(int num_eligible_voters) {
  CHECK(!finalized_) << "The tally is computed once";
  CHECK_LE(NumBallots(), num_eligible_voters)
      << "More ballots than eligible voters";
  num_eligible_ = num_eligible_voters;
  passed_ = IsStrictMajority(Approvals(), num_eligible_voters);
  finalized_ = true;
  return passed_;
}

bool GovernmentRecord::Passed() const {
  CHECK(finalized_) << "The tally is not final yet";
  return passed_;
}

Government GovernmentRecord::ToProto(const GameState& g) const {
  Government pb;
  pb.set_round(round_);
  pb.set_proposer(g.PlayerName(proposer_));
  pb.set_target(g.PlayerName(target_));
  for (const auto& [voter, ballot] : ballots_) {
    BallotRecord* br = pb.add_ballots();
    br->set_voter(g.PlayerName(voter));
    br->set_ballot(ballot.first);
    br->set_proxied(ballot.second);
  }
  pb.set_approvals(Approvals());
  pb.set_eligible_voters(num_eligible_);
  pb.set_passed(passed_);
  pb.set_instant_win(instant_win_);
  pb.set_veto_invoked(veto_invoked_);
  pb.set_cancelled(cancelled_);
  return pb;
}

bool ElectionTracker::RecordFailure() {
  CHECK_LT(value_, max_) << "A forced enactment should have reset the tracker";
  return ++value_ >= max_;
}

GovernmentOutcome ResolveGovernment(GovernmentRecord* record,
                                    const GovernmentOverrides& overrides) {
  if (!record->Passed()) {
    return GovernmentOutcome::kFailed;
  }
  // Checked first, since it wins regardless of the other two.
  if (overrides.instant_win && overrides.instant_win()) {
    record->SetInstantWin();
    return GovernmentOutcome::kInstantWin;
  }
  if (overrides.self_cancel && overrides.self_cancel()) {
    record->SetCancelled();
    return GovernmentOutcome::kCancelled;
  }
  if (overrides.mutual_veto && overrides.mutual_veto()) {
    record->SetVetoInvoked();
    return GovernmentOutcome::kVetoed;
  }
  return GovernmentOutcome::kPassed;
}

bool ResolveMutualVeto(DecisionBroker* broker, const DecisionRequest& request,
                       const string& request_option,
                       const DecisionRequest& consent,
                       const string& consent_option) {
  if (broker->Choose(request) != request_option) {
    return false;
  }
  return broker->Choose(consent) == consent_option;
}

NominationResult PublicVote::Nominate(
    absl::Span<const int> proposers,
    const std::function<vector<int>(int)>& legal_targets,
    const string& public_state) {
  vector<DecisionRequest> requests;
  vector<int> askers;
  for (int proposer : proposers) {
    CHECK(g_->IsAlive(proposer)) << "Dead players do not nominate";
    const vector<int> targets = legal_targets(proposer);
    if (targets.empty()) {
      continue;
    }
    requests.push_back(g_->NewRequest(proposer, NOMINATE,
                                      g_->PlayerNames(targets),
                                      public_state));
    askers.push_back(proposer);
  }
  if (requests.empty()) {
    return NominationResult();
  }
  const vector<Decision> decisions = broker_->DecideAll(requests);
  vector<pair<int, int>> pairs;
  for (int i = 0; i < askers.size(); ++i) {
    pairs.push_back({askers[i], g_->PlayerIndex(decisions[i].Pick())});
  }
  NominationResult result = ResolveNominations(pairs, rng_);
  Event event;
  Nomination* nomination = event.mutable_nomination();
  nomination->set_nominator(g_->PlayerName(result.nominator));
  nomination->set_nominee(g_->PlayerName(result.nominee));
  for (const auto& [target, count] : result.proposals) {
    (*nomination->mutable_proposals())[g_->PlayerName(target)] = count;
  }
  g_->Record(event);
  return result;
}

GovernmentRecord PublicVote::Vote(int proposer, int target,
                                  absl::Span<const VoterSpec> voters,
                                  const BallotLabels& labels,
                                  const string& public_state) {
  GovernmentRecord record(g_->Round(), proposer, target);
  map<int, int> reference;
  for (const VoterSpec& v : voters) {
    CHECK(g_->IsAlive(v.voter)) << "Dead players do not vote";
    reference[v.voter] = v.depends_on;
  }
  const string question = absl::StrFormat(
      "%s\n%s proposes %s. Vote %s or %s.", public_state,
      g_->PlayerName(proposer), g_->PlayerName(target), labels.approve,
      labels.reject);
  map<int, int> wave_of;
  const vector<vector<int>> waves = VotingWaves(voters);
  for (int w = 0; w < waves.size(); ++w) {
    vector<DecisionRequest> requests;
    for (int voter : waves[w]) {
      requests.push_back(g_->NewRequest(voter, VOTE,
                                        {labels.approve, labels.reject},
                                        question));
    }
    const vector<Decision> decisions = broker_->DecideAll(requests);
    for (int i = 0; i < waves[w].size(); ++i) {
      const int voter = waves[w][i];
      const Ballot own =
          decisions[i].Pick() == labels.approve ? APPROVE : REJECT;
      Ballot ballot = own;
      bool proxied = false;
      const int ref = reference[voter];
      if (ref != kNoPlayer && wave_of.contains(ref) && wave_of[ref] < w) {
        ballot = ProxyBallot(record.BallotOf(ref), own);
        proxied = record.BallotOf(ref) == APPROVE;
      }
      absl::Status status = record.CastBallot(voter, ballot, proxied);
      CHECK(status.ok()) << status;
      wave_of[voter] = w;
      Event event;
      event.mutable_ballot()->set_voter(g_->PlayerName(voter));
      event.mutable_ballot()->set_ballot(ballot);
      event.mutable_ballot()->set_proxied(proxied);
      g_->Record(event);
    }
  }
  record.Finalize(voters.size());
  return record;
}
}  // namespace tabletalk
