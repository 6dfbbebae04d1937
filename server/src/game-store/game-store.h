// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#ifndef CLUECAST__GAME_STORE__GAME_STORE_H
#define CLUECAST__GAME_STORE__GAME_STORE_H

#include "./game-records.h"
#include "utilities/logging.h"
#include <optional>
#include <stdexcept>
#include <vector>


enum class GameStoreErrorCode {
  NotFound,
  UniquenessViolation,
  InvalidArgument,
  InvalidState
};

const char* str(GameStoreErrorCode code);


class GameStoreError : public std::runtime_error {
  GameStoreErrorCode code_;
public:
  GameStoreError(GameStoreErrorCode code, const std::string& message)
      : std::runtime_error{message}, code_{code} {}

  [[nodiscard]] GameStoreErrorCode code() const noexcept { return code_; }
};


/*
 * Games, players, rounds and picks.
 *
 * Every operation is atomic with respect to the others. Implementations
 * throw GameStoreError; a missing record from a get-style query is an
 * empty optional, not an error.
 */
class GameStore {
public:
  virtual ~GameStore() = default;

  virtual Game createGame(UserId hostUserId, const GameSettings& settings, Timestamp now) = 0;
  [[nodiscard]] virtual std::optional<Game> getGame(GameId gameId) const = 0;
  virtual Game markGameState(GameId gameId, GameState state) = 0;
  // InvalidState unless the game is still waiting for players
  virtual Game markGameStarted(GameId gameId, Timestamp now) = 0;
  virtual void deleteGame(GameId gameId) = 0;
  [[nodiscard]] virtual std::vector<Game> listGames(GameState state) const = 0;
  [[nodiscard]] virtual int countActiveGames() const = 0;

  virtual Player addPlayer(GameId gameId, UserId userId, const std::string& nickname, const std::string& avatar, Timestamp now) = 0;
  virtual void removePlayer(PlayerId playerId) = 0;
  [[nodiscard]] virtual std::optional<Player> getPlayer(PlayerId playerId) const = 0;
  [[nodiscard]] virtual std::vector<Player> listPlayers(GameId gameId) const = 0;
  [[nodiscard]] virtual std::vector<Player> leaderboard(GameId gameId) const = 0;
  virtual Player addPoints(PlayerId playerId, int points) = 0;

  virtual std::vector<Round> insertRounds(GameId gameId, const std::vector<RoundSpec>& specs) = 0;
  [[nodiscard]] virtual std::optional<Round> getRound(RoundId roundId) const = 0;
  [[nodiscard]] virtual std::vector<Round> listRounds(GameId gameId) const = 0;
  [[nodiscard]] virtual std::optional<Round> currentRound(GameId gameId) const = 0;

  // next on_hold round by position becomes playing; empty when none is left
  virtual std::optional<Round> activateNextRound(GameId gameId) = 0;

  // playing -> finished; false if the round was not playing
  virtual bool finishRound(RoundId roundId) = 0;

  // inserts the pick, credits the player and tells whether every player
  // of the game has now picked, all in one critical section
  virtual PickResult createPick(const PickRequest& request, Timestamp now) = 0;
  [[nodiscard]] virtual bool playersHaveAllPicked(GameId gameId, RoundId roundId) const = 0;
  [[nodiscard]] virtual std::vector<Pick> listPicks(RoundId roundId) const = 0;
};


#endif
