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

#ifndef SRC_UTIL_H_
#define SRC_UTIL_H_

#include <algorithm>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "google/protobuf/message.h"

namespace tabletalk {
using google::protobuf::Message;
using std::filesystem::path;
using std::string;
using std::vector;

const int kNoPlayer = -1;  // Used in place of player index.

// All game randomness is drawn from one seeded engine on the coordinating
// thread, so a seed plus the agents' decisions reproduce a game exactly.
using Rng = std::mt19937_64;

// Both files are in text proto format.
absl::Status ReadProtoFromFile(const path& filename, Message* msg);
absl::Status WriteProtoToFile(const Message& msg, const path& filename);

// Uniform in [0, size).
int RandomIndex(int size, Rng* rng);

template <typename T>
const T& PickRandom(const vector<T>& items, Rng* rng) {
  return items[RandomIndex(items.size(), rng)];
}

template <typename T>
void Shuffle(vector<T>* items, Rng* rng) {
  std::shuffle(items->begin(), items->end(), *rng);
}
}  // namespace tabletalk

#endif  // SRC_UTIL_H_
