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

#include "src/agent.h"

#include <algorithm>
#include <exception>
#include <set>
#include <thread>  // NOLINT [build/c++11]
#include <utility>

#include "absl/random/distributions.h"
#include "absl/strings/str_join.h"
#include "absl/synchronization/notification.h"
#include "ortools/base/logging.h"

namespace tabletalk {

namespace {
vector<string> PickDistinct(const vector<string>& options, int count,
                            Rng* rng) {
  vector<string> pool = options;
  count = std::min<int>(count, pool.size());
  for (int i = 0; i < count; ++i) {
    const int j = i + RandomIndex(pool.size() - i, rng);
    std::swap(pool[i], pool[j]);
  }
  pool.resize(count);
  return pool;
}
}  // namespace

Decision RandomAgent::Decide(const DecisionRequest& request) {
  absl::MutexLock lock(&mu_);
  Decision decision;
  if (request.options.empty()) {
    decision.text = "I have nothing to add yet.";
    return decision;
  }
  const int lo = std::max(request.min_picks, 1);
  const int hi = std::max(lo, request.max_picks);
  decision.picks = PickDistinct(request.options,
                                absl::Uniform<int>(absl::IntervalClosed, rng_,
                                                   lo, hi),
                                &rng_);
  return decision;
}

bool IsLegalDecision(const DecisionRequest& request,
                     const Decision& decision) {
  if (request.options.empty()) {
    return decision.picks.empty();
  }
  const int num_picks = decision.picks.size();
  if (num_picks < request.min_picks || num_picks > request.max_picks) {
    return false;
  }
  std::set<string> seen;
  for (const string& pick : decision.picks) {
    if (std::find(request.options.begin(), request.options.end(), pick) ==
        request.options.end()) {
      return false;
    }
    if (!seen.insert(pick).second) {
      return false;
    }
  }
  return true;
}

// Shared by the coordinating thread and one worker.
struct DecisionBroker::PendingDecision {
  DecisionRequest request;
  shared_ptr<Agent> agent;
  std::thread worker;  // Not joinable when there is no agent to ask.
  absl::Notification done;
  absl::Mutex mu;
  std::optional<Decision> answer ABSL_GUARDED_BY(mu);
};

DecisionBroker::DecisionBroker(vector<shared_ptr<Agent>> seats,
                               shared_ptr<Agent> arbiter, Rng* rng,
                               absl::Duration timeout, Recorder* recorder)
    : seats_(std::move(seats)), arbiter_(std::move(arbiter)), rng_(rng),
      timeout_(timeout), recorder_(recorder) {
  CHECK(rng_ != nullptr);
}

DecisionBroker::~DecisionBroker() {
  if (!stragglers_.empty()) {
    LOG(INFO) << "Waiting for " << stragglers_.size()
              << " late agent(s) to return";
  }
  for (const shared_ptr<PendingDecision>& pending : stragglers_) {
    pending->worker.join();
  }
}

shared_ptr<Agent> DecisionBroker::AgentFor(int player) const {
  if (player == kNoPlayer) {
    return arbiter_;
  }
  CHECK(player >= 0 && player < seats_.size()) << "Invalid player " << player;
  return seats_[player];
}

shared_ptr<DecisionBroker::PendingDecision> DecisionBroker::Launch(
    const DecisionRequest& request) {
  auto pending = std::make_shared<PendingDecision>();
  pending->request = request;
  pending->agent = AgentFor(request.player);
  if (pending->agent == nullptr) {
    pending->done.Notify();
    return pending;
  }
  pending->worker = std::thread([pending] {
    std::optional<Decision> answer;
    try {
      answer = pending->agent->Decide(pending->request);
    } catch (const std::exception& e) {
      LOG(WARNING) << "Agent for " << pending->request.player_name
                   << " failed: " << e.what();
    }
    {
      absl::MutexLock lock(&pending->mu);
      pending->answer = std::move(answer);
    }
    pending->done.Notify();
  });
  return pending;
}

std::optional<Decision> DecisionBroker::Await(PendingDecision* pending,
                                              absl::Time deadline,
                                              FallbackReason* reason) {
  if (!pending->done.WaitForNotificationWithDeadline(deadline)) {
    *reason = DECISION_TIMEOUT;
    return std::nullopt;
  }
  absl::MutexLock lock(&pending->mu);
  if (!pending->answer.has_value()) {
    *reason = AGENT_UNAVAILABLE;
  }
  return pending->answer;
}

void DecisionBroker::Retire(shared_ptr<PendingDecision> pending) {
  if (!pending->worker.joinable()) {
    return;
  }
  if (pending->done.HasBeenNotified()) {
    pending->worker.join();
  } else {
    stragglers_.push_back(std::move(pending));
  }
}

std::optional<Decision> DecisionBroker::CallDirectly(
    const DecisionRequest& request, FallbackReason* reason) {
  shared_ptr<Agent> agent = AgentFor(request.player);
  if (agent == nullptr) {
    *reason = AGENT_UNAVAILABLE;
    return std::nullopt;
  }
  try {
    return agent->Decide(request);
  } catch (const std::exception& e) {
    LOG(WARNING) << "Agent for " << request.player_name << " failed: "
                 << e.what();
    *reason = AGENT_UNAVAILABLE;
    return std::nullopt;
  }
}

Decision DecisionBroker::Decide(const DecisionRequest& request) {
  return DecideAll({request})[0];
}

vector<Decision> DecisionBroker::DecideAll(
    absl::Span<const DecisionRequest> requests) {
  const int n = requests.size();
  vector<std::optional<Decision>> answers(n);
  vector<FallbackReason> reasons(n, FALLBACK_REASON_UNSPECIFIED);
  const bool bounded = timeout_ != absl::InfiniteDuration();
  if (!bounded && n == 1) {
    for (int i = 0; i < n; ++i) {
      answers[i] = CallDirectly(requests[i], &reasons[i]);
    }
  } else {
    vector<shared_ptr<PendingDecision>> pending;
    for (const DecisionRequest& request : requests) {
      pending.push_back(Launch(request));
    }
    const absl::Time deadline = absl::Now() + timeout_;
    for (int i = 0; i < n; ++i) {
      answers[i] = Await(pending[i].get(), deadline, &reasons[i]);
    }
    for (shared_ptr<PendingDecision>& p : pending) {
      Retire(std::move(p));
    }
    // Stragglers from earlier calls that have returned since.
    auto returned = std::partition(
        stragglers_.begin(), stragglers_.end(),
        [](const shared_ptr<PendingDecision>& p) {
          return !p->done.HasBeenNotified();
        });
    for (auto it = returned; it != stragglers_.end(); ++it) {
      (*it)->worker.join();
    }
    stragglers_.erase(returned, stragglers_.end());
  }
  vector<Decision> result;
  for (int i = 0; i < n; ++i) {
    result.push_back(Legalize(requests[i], std::move(answers[i]), reasons[i]));
  }
  return result;
}

Decision DecisionBroker::Legalize(const DecisionRequest& request,
                                  std::optional<Decision> answer,
                                  FallbackReason reason) {
  if (request.options.empty()) {  // Free text is always legal.
    if (answer.has_value()) {
      answer->picks.clear();
      return *answer;
    }
    Decision silence;
    silence.text = "(says nothing)";
    RecordFallback(request, reason, silence);
    return silence;
  }
  if (answer.has_value()) {
    if (IsLegalDecision(request, *answer)) {
      return *answer;
    }
    LOG(WARNING) << request.player_name << " made an illegal "
                 << DecisionKind_Name(request.kind) << " decision: ["
                 << absl::StrJoin(answer->picks, ", ") << "] not in ["
                 << absl::StrJoin(request.options, ", ") << "]";
    reason = ILLEGAL_DECISION;
  }
  Decision chosen;
  Decision fallback;
  fallback.picks = {request.fallback};
  if (reason != ILLEGAL_DECISION && !request.fallback.empty() &&
      IsLegalDecision(request, fallback)) {
    chosen = fallback;
  } else {
    chosen = RandomLegal(request);
  }
  RecordFallback(request, reason, chosen);
  return chosen;
}

Decision DecisionBroker::RandomLegal(const DecisionRequest& request) {
  Decision decision;
  decision.picks = PickDistinct(request.options,
                                std::max(request.min_picks, 1), rng_);
  return decision;
}

void DecisionBroker::RecordFallback(const DecisionRequest& request,
                                    FallbackReason reason,
                                    const Decision& chosen) {
  if (reason != ILLEGAL_DECISION) {
    LOG(WARNING) << "No answer from " << request.player_name << " for "
                 << DecisionKind_Name(request.kind) << ": "
                 << FallbackReason_Name(reason);
  }
  Event event;
  DecisionFallback* fallback = event.mutable_fallback();
  fallback->set_player(request.player_name);
  fallback->set_kind(request.kind);
  fallback->set_reason(reason);
  for (const string& pick : chosen.picks) {
    fallback->add_chosen(pick);
  }
  RecordOrWarn(recorder_, event);
}
}  // namespace tabletalk
