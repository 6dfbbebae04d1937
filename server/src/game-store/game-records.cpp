// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include "game-records.h"
#include "game-store.h"
#include <algorithm>
#include <array>


const char* str(GameState state) {
  switch (state) {
    case GameState::WaitingForPlayers: return "waiting_for_players";
    case GameState::GameRunning: return "game_running";
    case GameState::GameOver: return "game_over";
    case GameState::LobbyTimeout: return "lobby_timeout";
    case GameState::HostDisconnected: return "host_disconnected";
    default: return "?";
  }
}


std::optional<GameState> parseGameState(const std::string& value) {
  for (auto state : {GameState::WaitingForPlayers, GameState::GameRunning, GameState::GameOver,
      GameState::LobbyTimeout, GameState::HostDisconnected}) {
    if (value == str(state)) {
      return state;
    }
  }
  return std::nullopt;
}


bool isActive(GameState state) {
  return state == GameState::WaitingForPlayers || state == GameState::GameRunning;
}


const char* str(RoundState state) {
  switch (state) {
    case RoundState::OnHold: return "on_hold";
    case RoundState::Playing: return "playing";
    case RoundState::Finished: return "finished";
    default: return "?";
  }
}


void GameSettings::validate() const {
  static constexpr std::array<int, 9> intervals{3, 6, 9, 12, 15, 20, 30, 45, 60};
  static constexpr std::array<int, 4> gridSizes{2, 4, 9, 16};

  if (roundsCount < 1 || roundsCount > 20) {
    throw GameStoreError{GameStoreErrorCode::InvalidArgument, makeString("rounds count %d must be 1..20", roundsCount)};
  }
  if (std::find(intervals.begin(), intervals.end(), cluesInterval) == intervals.end()) {
    throw GameStoreError{GameStoreErrorCode::InvalidArgument, makeString("clues interval %d is not allowed", cluesInterval)};
  }
  if (std::find(gridSizes.begin(), gridSizes.end(), gridSize) == gridSizes.end()) {
    throw GameStoreError{GameStoreErrorCode::InvalidArgument, makeString("grid size %d is not allowed", gridSize)};
  }
}


int calculatePoints(int keywordsShown, int keywordsTotal) {
  if (keywordsTotal <= 0) {
    return 1;
  }
  // integer ceil of shown * 5 / total
  int share = (std::max(0, keywordsShown) * 5 + keywordsTotal - 1) / keywordsTotal;
  return std::max(1, 6 - share);
}
