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

#include "src/recorder.h"

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "ortools/base/logging.h"
#include "src/roles.h"

namespace tabletalk {

absl::Status GameLogRecorder::Record(const Event& event) {
  switch (event.details_case()) {
    case Event::kGameStart:
      *log_.mutable_setup() = event.game_start();
      break;
    case Event::kVictory:
      *log_.mutable_result() = event.victory();
      break;
    default:
      break;
  }
  *log_.add_events() = event;
  if (output_.empty()) {
    return absl::OkStatus();
  }
  return WriteProtoToFile(log_, output_);
}

absl::Status LoggingRecorder::Record(const Event& event) {
  LOG(INFO) << EventSummary(event);
  return absl::OkStatus();
}

absl::Status TeeRecorder::Record(const Event& event) {
  absl::Status result;
  for (Recorder* sink : sinks_) {
    result.Update(sink->Record(event));
  }
  return result;
}

void RecordOrWarn(Recorder* recorder, const Event& event) {
  if (recorder == nullptr) {
    return;
  }
  absl::Status status = recorder->Record(event);
  if (!status.ok()) {
    LOG(WARNING) << "Failed recording event " << EventSummary(event) << ": "
                 << status;
  }
}

string EventSummary(const Event& event) {
  switch (event.details_case()) {
    case Event::kGameStart: {
      vector<string> players;
      for (const auto& p : event.game_start().players()) {
        players.push_back(absl::StrFormat("%s (%s)", p.name(),
                                          RoleName(p.role())));
      }
      return absl::StrCat(GameKind_Name(event.game_start().kind()),
                          " starts: ", absl::StrJoin(players, ", "));
    }
    case Event::kPhase:
      return absl::StrFormat("%s %d begins",
                             event.phase().is_day() ? "Day" : "Night",
                             event.phase().count());
    case Event::kTableTalk:
      return absl::StrFormat("%s: %s", event.table_talk().speaker(),
                             event.table_talk().text());
    case Event::kRoleAction: {
      const RoleActionRecord& ra = event.role_action();
      return absl::StrFormat("%s (%s) -> %s%s%s", ra.player(),
                             RoleName(ra.role()),
                             absl::StrJoin(ra.targets(), ", "),
                             ra.poisoned() ? " [poisoned]" : "",
                             ra.succeeded() ? "" : " [no effect]");
    }
    case Event::kHiddenFact:
      return absl::StrFormat("%s learns%s: %s", event.hidden_fact().owner(),
                             event.hidden_fact().reliable() ? "" : " (false)",
                             event.hidden_fact().text());
    case Event::kFallback:
      return absl::StrFormat("%s %s fallback for %s: %s",
                             event.fallback().player(),
                             FallbackReason_Name(event.fallback().reason()),
                             DecisionKind_Name(event.fallback().kind()),
                             absl::StrJoin(event.fallback().chosen(), ", "));
    case Event::kNomination:
      return absl::StrFormat("%s nominates %s", event.nomination().nominator(),
                             event.nomination().nominee());
    case Event::kBallot:
      return absl::StrFormat("%s votes %s%s", event.ballot().voter(),
                             Ballot_Name(event.ballot().ballot()),
                             event.ballot().proxied() ? " (proxied)" : "");
    case Event::kGovernment: {
      const Government& gov = event.government();
      return absl::StrFormat(
          "%s -> %s: %d of %d approve, %s%s%s%s", gov.proposer(),
          gov.target(), gov.approvals(), gov.eligible_voters(),
          gov.passed() ? "passed" : "failed",
          gov.instant_win() ? ", instant win" : "",
          gov.veto_invoked() ? ", vetoed" : "",
          gov.cancelled() ? ", cancelled" : "");
    }
    case Event::kElimination:
      return absl::StrFormat("%s (%s) dies: %s", event.elimination().player(),
                             RoleName(event.elimination().role()),
                             DeathCause_Name(event.elimination().cause()));
    case Event::kPolicy:
      return absl::StrFormat("%s enacted%s (Liberal %d, Fascist %d)",
                             Policy_Name(event.policy().policy()),
                             event.policy().top_deck() ? " from the top" : "",
                             event.policy().liberal_policies(),
                             event.policy().fascist_policies());
    case Event::kTracker:
      return absl::StrFormat("Election tracker at %d", event.tracker().value());
    case Event::kExecutivePower:
      return absl::StrFormat(
          "%s uses %s on %s", event.executive_power().president(),
          ExecutivePower_Name(event.executive_power().power()),
          event.executive_power().target());
    case Event::kMission:
      return absl::StrFormat("Mission %d %s (%d sabotaged), mood %s",
                             event.mission().mission(),
                             event.mission().success() ? "succeeded" : "failed",
                             event.mission().sabotage_count(),
                             Mood_Name(event.mission().mood()));
    case Event::kVerdict:
      return absl::StrFormat("The Computer judges %s accused by %s: %s",
                             event.verdict().accused(),
                             event.verdict().accuser(),
                             event.verdict().executed().empty()
                                 ? "no executions"
                                 : absl::StrJoin(event.verdict().executed(),
                                                 ", "));
    case Event::kCardPlay:
      return absl::StrFormat("%s plays %d claiming %s",
                             event.card_play().player(),
                             event.card_play().count(),
                             Card_Name(event.card_play().claimed()));
    case Event::kChallenge: {
      const ChallengeResult& c = event.challenge();
      return absl::StrFormat("%s challenges %s%s: %s, %s pulls the trigger%s",
                             c.challenger(), c.challenged(),
                             c.forced() ? " (forced)" : "",
                             c.was_lie() ? "lie" : "truth", c.penalized(),
                             c.died() ? " and dies" : "");
    }
    case Event::kVictory:
      return absl::StrFormat("%s win%s: %s", TeamName(event.victory().team()),
                             event.victory().forced() ? " (forced)" : "",
                             event.victory().reason());
    default:
      return event.ShortDebugString();
  }
}
}  // namespace tabletalk
