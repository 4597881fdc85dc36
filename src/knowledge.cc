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

#include "src/knowledge.h"

#include <algorithm>

#include "ortools/base/logging.h"

namespace tabletalk {

const HiddenFact& KnowledgeStore::Add(int owner, const HiddenFact& fact) {
  CHECK(owner >= 0 && owner < facts_.size()) << "Invalid owner " << owner;
  facts_[owner].push_back(fact);
  return facts_[owner].back();
}

const vector<HiddenFact>& KnowledgeStore::FactsOf(int owner) const {
  CHECK(owner >= 0 && owner < facts_.size()) << "Invalid owner " << owner;
  return facts_[owner];
}

vector<string> KnowledgeStore::FactTexts(int owner, int last_k) const {
  const vector<HiddenFact>& facts = FactsOf(owner);
  const int start = last_k <= 0 ? 0 : std::max<int>(0, facts.size() - last_k);
  vector<string> result;
  for (int i = start; i < facts.size(); ++i) {
    result.push_back(facts[i].text());
  }
  return result;
}
}  // namespace tabletalk
