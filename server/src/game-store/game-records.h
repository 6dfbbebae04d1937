// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#ifndef CLUECAST__GAME_STORE__GAME_RECORDS_H
#define CLUECAST__GAME_STORE__GAME_RECORDS_H

#include "utilities/record-id.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>


using Timestamp = std::chrono::system_clock::time_point;


enum class GameState {
  WaitingForPlayers,
  GameRunning,
  GameOver,
  LobbyTimeout,
  HostDisconnected
};

const char* str(GameState state);
std::optional<GameState> parseGameState(const std::string& value);

// waiting_for_players or game_running
bool isActive(GameState state);


enum class RoundState {
  OnHold,
  Playing,
  Finished
};

const char* str(RoundState state);


struct GameSettings {
  int roundsCount{3};
  int cluesInterval{9};
  int gridSize{9};

  // throws GameStoreError{InvalidArgument}
  void validate() const;
};


struct Game {
  GameId id{};
  UserId hostUserId{};
  GameSettings settings{};
  GameState state{GameState::WaitingForPlayers};
  Timestamp createdAt{};
  std::optional<Timestamp> startedAt{};
};


struct Player {
  PlayerId id{};
  GameId gameId{};
  UserId userId{};
  std::string nickname{};
  std::string avatar{};
  int points{};
  Timestamp joinedAt{};
};


struct RoundSpec {
  WordId targetWordId{};
  std::vector<KeywordId> keywordIds{};
  std::vector<WordId> possibleWordIds{};
  int position{};
};


struct Round {
  RoundId id{};
  GameId gameId{};
  WordId targetWordId{};
  std::vector<KeywordId> keywordIds{};
  std::vector<WordId> possibleWordIds{};
  int position{};
  RoundState state{RoundState::OnHold};
};


struct PickRequest {
  RoundId roundId{};
  PlayerId playerId{};
  WordId wordId{};
  int timeSeconds{};
  int keywordsShown{};
};


struct Pick {
  PickId id{};
  RoundId roundId{};
  PlayerId playerId{};
  WordId wordId{};
  int timeSeconds{};
  int keywordsShown{};
  bool isCorrect{};
  int points{};
  Timestamp createdAt{};
};


struct PickResult {
  Pick pick{};
  bool allPicked{};
};


// max(1, 6 - ceil(shown / total * 5)) for a correct pick
int calculatePoints(int keywordsShown, int keywordsTotal);


#endif
