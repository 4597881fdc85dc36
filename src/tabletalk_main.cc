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

#include <chrono>  // NOLINT [build/c++11]
#include <filesystem>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "ortools/base/logging.h"
#include "src/agent.h"
#include "src/game_log.pb.h"
#include "src/games.h"
#include "src/recorder.h"
#include "src/roles.h"
#include "src/util.h"

using std::cout;
using std::chrono::duration;
using std::chrono::steady_clock;
using std::endl;
using std::filesystem::path;
using std::string;

// All files below are in text proto format.
ABSL_FLAG(string, game_config, "", "Game configuration file path.");
ABSL_FLAG(string, game, "secret_hitler",
          "Game to play when no --game_config is given: clocktower_lite, "
          "secret_hitler, mafia_classic, alpha_complex or liars_deck.");
ABSL_FLAG(int, num_games, 1, "Number of games to play.");
ABSL_FLAG(uint64_t, seed, 0, "Seed of the first game; game i uses seed + i.");
ABSL_FLAG(string, output_log, "",
          "Optional game log output file. With several games, the game "
          "number is appended to the file name.");
ABSL_FLAG(int, decision_timeout_ms, 0,
          "Per-decision timeout, overriding the config. 0 means none.");

namespace tabletalk {

namespace {
const char* const kDefaultRoster[] = {"Sarah", "Anika", "Derek", "Emma",
                                      "Noah",  "James", "George"};

GameConfig DefaultConfig(const string& game) {
  GameConfig config;
  GameKind kind;
  CHECK(GameKind_Parse(absl::AsciiStrToUpper(game), &kind))
      << "Unknown game " << game;
  config.set_kind(kind);
  const int num_players = kind == LIARS_DECK ? 4 : std::size(kDefaultRoster);
  for (int i = 0; i < num_players; ++i) {
    PlayerConfig* player = config.add_players();
    player->set_name(kDefaultRoster[i]);
    player->set_model("random");
  }
  return config;
}

path GameLogPath(const path& output, int game, int num_games) {
  if (output.empty() || num_games == 1) {
    return output;
  }
  path result = output;
  result.replace_filename(absl::StrCat(output.stem().string(), "_", game,
                                       output.extension().string()));
  return result;
}

void Run() {
  GameConfig config;
  const path game_config = absl::GetFlag(FLAGS_game_config);
  if (!game_config.empty()) {
    absl::Status status = ReadProtoFromFile(game_config, &config);
    CHECK(status.ok()) << status;
  } else {
    config = DefaultConfig(absl::GetFlag(FLAGS_game));
  }
  if (absl::GetFlag(FLAGS_decision_timeout_ms) > 0) {
    config.set_decision_timeout_ms(absl::GetFlag(FLAGS_decision_timeout_ms));
  }
  const uint64_t seed = absl::GetFlag(FLAGS_seed);
  const int num_games = absl::GetFlag(FLAGS_num_games);
  const path output_log = absl::GetFlag(FLAGS_output_log);
  for (int i = 0; i < num_games; ++i) {
    config.set_seed(seed + i);
    vector<shared_ptr<Agent>> seats;
    for (int p = 0; p < config.players_size(); ++p) {
      seats.push_back(std::make_shared<RandomAgent>(seed + i + p + 1));
    }
    GameLogRecorder game_log(GameLogPath(output_log, i + 1, num_games));
    LoggingRecorder logging;
    TeeRecorder recorder({&logging, &game_log});
    absl::StatusOr<std::unique_ptr<Game>> game =
        NewGame(config, std::move(seats), nullptr, &recorder);
    CHECK(game.ok()) << game.status();

    steady_clock::time_point begin = steady_clock::now();
    const Winner winner = (*game)->Play();
    steady_clock::time_point end = steady_clock::now();

    cout << "Game " << i + 1 << " (" << GameKind_Name(config.kind())
         << ", seed " << config.seed() << "): " << TeamName(winner.team)
         << " win";
    if (!winner.players.empty()) {
      cout << " (" << absl::StrJoin(winner.players, ", ") << ")";
    }
    cout << ", " << winner.reason << (winner.forced ? " [forced]" : "")
         << endl;
    if (!output_log.empty()) {
      cout << "Game log written to "
           << GameLogPath(output_log, i + 1, num_games) << endl;
    }
    cout << "Game time: " << duration<double>(end - begin).count() << "[s]\n";
  }
}
}  // namespace
}  // namespace tabletalk

int main(int argc, char** argv) {
  absl::ParseCommandLine(argc, argv);
  tabletalk::Run();
  return 0;
}
