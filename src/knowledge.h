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

#ifndef SRC_KNOWLEDGE_H_
#define SRC_KNOWLEDGE_H_

#include <string>
#include <vector>

#include "src/game_log.pb.h"

namespace tabletalk {

using std::string;
using std::vector;

// Per-player private memory. Facts are only ever appended: a fabricated fact
// stays in history with reliable = false, and nothing is rewritten later.
class KnowledgeStore {
 public:
  explicit KnowledgeStore(int num_players) : facts_(num_players) {}

  const HiddenFact& Add(int owner, const HiddenFact& fact);
  const vector<HiddenFact>& FactsOf(int owner) const;
  int NumFacts(int owner) const { return FactsOf(owner).size(); }

  // The texts of the owner's last `last_k` facts (all when last_k <= 0), oldest
  // first. This is the only view an agent gets: reliability is never exposed.
  vector<string> FactTexts(int owner, int last_k = 0) const;

 private:
  vector<vector<HiddenFact>> facts_;
};
}  // namespace tabletalk

#endif  // SRC_KNOWLEDGE_H_
