// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#ifndef CLUECAST__GAME_STORE__MEMORY_GAME_STORE_H
#define CLUECAST__GAME_STORE__MEMORY_GAME_STORE_H

#include "./game-store.h"
#include <cstdint>
#include <map>
#include <mutex>


class MemoryGameStore : public GameStore {
  mutable std::mutex mutex_{};
  std::uint64_t lastId_{};
  std::map<GameId, Game> games_{};
  std::map<PlayerId, Player> players_{};
  std::map<RoundId, Round> rounds_{};
  std::map<PickId, Pick> picks_{};

public:
  MemoryGameStore();
  ~MemoryGameStore() override;

  MemoryGameStore(const MemoryGameStore&) = delete;
  MemoryGameStore& operator=(const MemoryGameStore&) = delete;

  Game createGame(UserId hostUserId, const GameSettings& settings, Timestamp now) override;
  [[nodiscard]] std::optional<Game> getGame(GameId gameId) const override;
  Game markGameState(GameId gameId, GameState state) override;
  Game markGameStarted(GameId gameId, Timestamp now) override;
  void deleteGame(GameId gameId) override;
  [[nodiscard]] std::vector<Game> listGames(GameState state) const override;
  [[nodiscard]] int countActiveGames() const override;

  Player addPlayer(GameId gameId, UserId userId, const std::string& nickname, const std::string& avatar, Timestamp now) override;
  void removePlayer(PlayerId playerId) override;
  [[nodiscard]] std::optional<Player> getPlayer(PlayerId playerId) const override;
  [[nodiscard]] std::vector<Player> listPlayers(GameId gameId) const override;
  [[nodiscard]] std::vector<Player> leaderboard(GameId gameId) const override;
  Player addPoints(PlayerId playerId, int points) override;

  std::vector<Round> insertRounds(GameId gameId, const std::vector<RoundSpec>& specs) override;
  [[nodiscard]] std::optional<Round> getRound(RoundId roundId) const override;
  [[nodiscard]] std::vector<Round> listRounds(GameId gameId) const override;
  [[nodiscard]] std::optional<Round> currentRound(GameId gameId) const override;
  std::optional<Round> activateNextRound(GameId gameId) override;
  bool finishRound(RoundId roundId) override;

  PickResult createPick(const PickRequest& request, Timestamp now) override;
  [[nodiscard]] bool playersHaveAllPicked(GameId gameId, RoundId roundId) const override;
  [[nodiscard]] std::vector<Pick> listPicks(RoundId roundId) const override;

private:
  std::uint64_t nextId_mutex() { return ++lastId_; }
  Game& findGame_mutex(GameId gameId);
  Player& findPlayer_mutex(PlayerId playerId);
  Round& findRound_mutex(RoundId roundId);
  [[nodiscard]] std::vector<Round> listRounds_mutex(GameId gameId) const;
  [[nodiscard]] bool playersHaveAllPicked_mutex(GameId gameId, RoundId roundId) const;
};


#endif
