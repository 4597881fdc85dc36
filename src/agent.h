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

#ifndef SRC_AGENT_H_
#define SRC_AGENT_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "src/game_log.pb.h"
#include "src/recorder.h"
#include "src/util.h"

namespace tabletalk {

using std::shared_ptr;
using std::string;
using std::vector;

// A single question to an agent. With empty options the answer is free text
// (table talk); otherwise it must pick between min_picks and max_picks
// distinct options.
struct DecisionRequest {
  DecisionKind kind = DECISION_KIND_UNSPECIFIED;
  int player = kNoPlayer;  // kNoPlayer addresses the arbiter.
  string player_name;
  Role role = ROLE_UNSPECIFIED;
  vector<string> options;
  int min_picks = 1;
  int max_picks = 1;
  string fallback;  // Used on timeout when set; otherwise a random pick.
  string public_state;
  vector<string> private_facts;
};

struct Decision {
  vector<string> picks;
  string text;
  string Pick() const { return picks.empty() ? "" : picks[0]; }
};

// A seat in the game, usually backed by a language model. Decide may take
// long and is called from worker threads, concurrently with other agents.
class Agent {
 public:
  virtual ~Agent() = default;
  virtual Decision Decide(const DecisionRequest& request) = 0;
};

// Picks uniformly among legal options.
class RandomAgent : public Agent {
 public:
  explicit RandomAgent(uint64_t seed) : rng_(seed) {}
  Decision Decide(const DecisionRequest& request) override;

 private:
  absl::Mutex mu_;
  Rng rng_ ABSL_GUARDED_BY(mu_);
};

bool IsLegalDecision(const DecisionRequest& request, const Decision& decision);

// Routes requests to agents and guarantees legal answers. Illegal answers are
// replaced by a uniformly random legal choice; late or missing answers by the
// request's fallback option (or a random legal choice without one). Every
// replacement is logged and recorded. All randomness is drawn on the calling
// thread, in request order.
//
// Agents that miss the deadline keep running on their worker thread. Their
// late answers are dropped, and the destructor waits for them to return.
class DecisionBroker {
 public:
  // `seats` are indexed by player; `arbiter` answers kNoPlayer requests and
  // may be null. An infinite timeout waits for every answer.
  DecisionBroker(vector<shared_ptr<Agent>> seats, shared_ptr<Agent> arbiter,
                 Rng* rng, absl::Duration timeout, Recorder* recorder);
  ~DecisionBroker();

  DecisionBroker(const DecisionBroker&) = delete;
  DecisionBroker& operator=(const DecisionBroker&) = delete;

  Decision Decide(const DecisionRequest& request);
  string Choose(const DecisionRequest& request) {
    return Decide(request).Pick();
  }

  // Issues independent requests concurrently and returns the decisions in
  // request order, once all of them are in or timed out.
  vector<Decision> DecideAll(absl::Span<const DecisionRequest> requests);

  bool HasArbiter() const { return arbiter_ != nullptr; }
  // Workers still running after their deadline passed.
  int NumStragglers() const { return stragglers_.size(); }

 private:
  struct PendingDecision;

  shared_ptr<Agent> AgentFor(int player) const;
  shared_ptr<PendingDecision> Launch(const DecisionRequest& request);
  std::optional<Decision> Await(PendingDecision* pending, absl::Time deadline,
                                FallbackReason* reason);
  // Joins the finished worker, or keeps it for the destructor to join.
  void Retire(shared_ptr<PendingDecision> pending);
  std::optional<Decision> CallDirectly(const DecisionRequest& request,
                                       FallbackReason* reason);
  Decision Legalize(const DecisionRequest& request,
                    std::optional<Decision> answer, FallbackReason reason);
  Decision RandomLegal(const DecisionRequest& request);
  void RecordFallback(const DecisionRequest& request, FallbackReason reason,
                      const Decision& chosen);

  vector<shared_ptr<Agent>> seats_;
  shared_ptr<Agent> arbiter_;
  Rng* rng_;
  absl::Duration timeout_;
  Recorder* recorder_;
  vector<shared_ptr<PendingDecision>> stragglers_;
};
}  // namespace tabletalk

#endif  // SRC_AGENT_H_
