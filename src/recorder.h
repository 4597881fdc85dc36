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

#ifndef SRC_RECORDER_H_
#define SRC_RECORDER_H_

#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "src/game_log.pb.h"
#include "src/util.h"

namespace tabletalk {

using std::string;
using std::vector;

// Sink for game events. Called synchronously on the coordinating thread after
// every state mutation.
class Recorder {
 public:
  virtual ~Recorder() = default;
  virtual absl::Status Record(const Event& event) = 0;
};

// Accumulates the full game record. When an output file is set, the record is
// rewritten there after every event, so an interrupted game still leaves a
// usable trail.
class GameLogRecorder : public Recorder {
 public:
  GameLogRecorder() = default;
  explicit GameLogRecorder(const path& output) : output_(output) {}

  absl::Status Record(const Event& event) override;
  const GameLog& Log() const { return log_; }

 private:
  path output_;
  GameLog log_;
};

// Writes one line per event to the INFO log.
class LoggingRecorder : public Recorder {
 public:
  absl::Status Record(const Event& event) override;
};

// Forwards every event to all sinks and reports the first failure.
class TeeRecorder : public Recorder {
 public:
  explicit TeeRecorder(vector<Recorder*> sinks) : sinks_(std::move(sinks)) {}
  absl::Status Record(const Event& event) override;

 private:
  vector<Recorder*> sinks_;
};

// Recording failures never stop a game; they are logged instead. A null
// recorder is allowed.
void RecordOrWarn(Recorder* recorder, const Event& event);

// One line summary, e.g. "Night 2 begins", "P3 (Imp) dies: NIGHT_KILL".
string EventSummary(const Event& event);
}  // namespace tabletalk

#endif  // SRC_RECORDER_H_
