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

#ifndef SRC_SCRIPTED_AGENT_H_
#define SRC_SCRIPTED_AGENT_H_

#include <algorithm>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "src/agent.h"
#include "src/game_log.pb.h"

namespace tabletalk {

using std::string;
using std::vector;

// Test double answering with a script. Safe to call from the broker's worker
// threads; keeps every request it was asked.
class ScriptedAgent : public Agent {
 public:
  using Script = std::function<Decision(const DecisionRequest&)>;

  explicit ScriptedAgent(Script script) : script_(std::move(script)) {}

  Decision Decide(const DecisionRequest& request) override {
    {
      absl::MutexLock lock(&mu_);
      requests_.push_back(request);
    }
    return script_(request);
  }

  vector<DecisionRequest> Requests() const {
    absl::MutexLock lock(&mu_);
    return requests_;
  }

  int NumRequests(DecisionKind kind) const {
    absl::MutexLock lock(&mu_);
    return std::count_if(
        requests_.begin(), requests_.end(),
        [kind](const DecisionRequest& r) { return r.kind == kind; });
  }

 private:
  Script script_;
  mutable absl::Mutex mu_;
  vector<DecisionRequest> requests_ ABSL_GUARDED_BY(mu_);
};

inline Decision Pick(const string& option) {
  return {.picks = {option}};
}

inline Decision Say(const string& text) { return {.text = text}; }

// Picks `preferred` when it is a legal option, and the first option otherwise.
// Free text requests get a fixed line.
inline Decision PickIfLegal(const DecisionRequest& request,
                            const string& preferred) {
  if (request.options.empty()) {
    return Say("No comment.");
  }
  Decision decision;
  if (std::find(request.options.begin(), request.options.end(), preferred) !=
      request.options.end()) {
    decision.picks = {preferred};
  } else {
    decision.picks = {request.options[0]};
  }
  // Tops up with the remaining options, in order, for as long as they last.
  for (const string& option : request.options) {
    if (static_cast<int>(decision.picks.size()) >= request.min_picks) {
      break;
    }
    if (std::find(decision.picks.begin(), decision.picks.end(), option) ==
        decision.picks.end()) {
      decision.picks.push_back(option);
    }
  }
  return decision;
}

// One ScriptedAgent per seat, all running the same script.
inline vector<std::shared_ptr<ScriptedAgent>> ScriptedSeats(
    int n, const ScriptedAgent::Script& script) {
  vector<std::shared_ptr<ScriptedAgent>> seats;
  for (int i = 0; i < n; ++i) {
    seats.push_back(std::make_shared<ScriptedAgent>(script));
  }
  return seats;
}

inline vector<std::shared_ptr<Agent>> AsAgents(
    const vector<std::shared_ptr<ScriptedAgent>>& seats) {
  return vector<std::shared_ptr<Agent>>(seats.begin(), seats.end());
}
}  // namespace tabletalk

#endif  // SRC_SCRIPTED_AGENT_H_
