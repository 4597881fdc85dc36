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

#ifndef SRC_DECK_H_
#define SRC_DECK_H_

#include <algorithm>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/types/span.h"
#include "ortools/base/logging.h"
#include "src/util.h"

namespace tabletalk {

using std::vector;

// A shuffled draw pile with a discard pile. Every card is always in exactly
// one of three places: the draw pile, the discard pile, or dealt out (held by
// the caller), so Total() == DrawSize() + DiscardSize() + NumDealt().
template <typename T>
class Deck {
 public:
  Deck(vector<T> cards, Rng* rng)
      : draw_(std::move(cards)), total_(draw_.size()), rng_(rng) {
    Shuffle(&draw_, rng_);
  }

  // Deals the top `n` cards. When the draw pile runs short, the discard pile
  // is shuffled into it first.
  absl::StatusOr<vector<T>> Draw(int n) {
    absl::Status status = EnsureDrawable(n);
    if (!status.ok()) {
      return status;
    }
    vector<T> result(draw_.end() - n, draw_.end());
    std::reverse(result.begin(), result.end());
    draw_.resize(draw_.size() - n);
    return result;
  }

  // The top `n` cards, without dealing them.
  absl::StatusOr<vector<T>> Peek(int n) {
    absl::Status status = EnsureDrawable(n);
    if (!status.ok()) {
      return status;
    }
    vector<T> result(draw_.end() - n, draw_.end());
    std::reverse(result.begin(), result.end());
    return result;
  }

  // Returns dealt cards.
  void Discard(const T& card) {
    CHECK_LT(DrawSize() + DiscardSize(), total_) << "No card is dealt out";
    discard_.push_back(card);
  }
  void Discard(absl::Span<const T> cards) {
    for (const T& card : cards) {
      Discard(card);
    }
  }

  // Shuffles the discard pile back into the draw pile.
  void ReshuffleDiscards() {
    draw_.insert(draw_.end(), discard_.begin(), discard_.end());
    discard_.clear();
    Shuffle(&draw_, rng_);
  }

  int Total() const { return total_; }
  int DrawSize() const { return draw_.size(); }
  int DiscardSize() const { return discard_.size(); }
  int NumDealt() const { return total_ - DrawSize() - DiscardSize(); }

 private:
  absl::Status EnsureDrawable(int n) {
    if (DrawSize() < n) {
      ReshuffleDiscards();
    }
    if (DrawSize() < n) {
      return absl::ResourceExhaustedError(absl::StrFormat(
          "Cannot draw %d cards, only %d left with %d dealt", n, DrawSize(),
          NumDealt()));
    }
    return absl::OkStatus();
  }

  vector<T> draw_;  // The top of the pile is at the back.
  vector<T> discard_;
  int total_;
  Rng* rng_;
};
}  // namespace tabletalk

#endif  // SRC_DECK_H_
