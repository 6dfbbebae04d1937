// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include "memory-game-store.h"
#include <algorithm>
#include <set>


MemoryGameStore::MemoryGameStore() {
  LOG_LIFECYCLE("%p MemoryGameStore +", this);
}


MemoryGameStore::~MemoryGameStore() {
  LOG_LIFECYCLE("%p MemoryGameStore ~", this);
}


Game MemoryGameStore::createGame(UserId hostUserId, const GameSettings& settings, Timestamp now) {
  settings.validate();
  if (!hostUserId) {
    throw GameStoreError{GameStoreErrorCode::InvalidArgument, "game must have a host"};
  }
  std::lock_guard lock{mutex_};
  Game game{};
  game.id = GameId{nextId_mutex()};
  game.hostUserId = hostUserId;
  game.settings = settings;
  game.state = GameState::WaitingForPlayers;
  game.createdAt = now;
  games_[game.id] = game;
  return game;
}


std::optional<Game> MemoryGameStore::getGame(GameId gameId) const {
  std::lock_guard lock{mutex_};
  auto i = games_.find(gameId);
  if (i == games_.end()) {
    return std::nullopt;
  }
  return i->second;
}


Game MemoryGameStore::markGameState(GameId gameId, GameState state) {
  std::lock_guard lock{mutex_};
  auto& game = findGame_mutex(gameId);
  game.state = state;
  return game;
}


Game MemoryGameStore::markGameStarted(GameId gameId, Timestamp now) {
  std::lock_guard lock{mutex_};
  auto& game = findGame_mutex(gameId);
  if (game.state != GameState::WaitingForPlayers) {
    throw GameStoreError{GameStoreErrorCode::InvalidState,
        makeString("game %s can not start in state %s", gameId.str().c_str(), str(game.state))};
  }
  game.state = GameState::GameRunning;
  game.startedAt = now;
  return game;
}


void MemoryGameStore::deleteGame(GameId gameId) {
  std::lock_guard lock{mutex_};
  findGame_mutex(gameId);

  std::set<RoundId> roundIds{};
  for (auto i = rounds_.begin(); i != rounds_.end();) {
    if (i->second.gameId == gameId) {
      roundIds.insert(i->first);
      i = rounds_.erase(i);
    } else {
      ++i;
    }
  }
  for (auto i = picks_.begin(); i != picks_.end();) {
    if (roundIds.count(i->second.roundId) != 0) {
      i = picks_.erase(i);
    } else {
      ++i;
    }
  }
  for (auto i = players_.begin(); i != players_.end();) {
    if (i->second.gameId == gameId) {
      i = players_.erase(i);
    } else {
      ++i;
    }
  }
  games_.erase(gameId);
}


std::vector<Game> MemoryGameStore::listGames(GameState state) const {
  std::lock_guard lock{mutex_};
  std::vector<Game> result{};
  for (const auto& [id, game] : games_) {
    if (game.state == state) {
      result.push_back(game);
    }
  }
  return result;
}


int MemoryGameStore::countActiveGames() const {
  std::lock_guard lock{mutex_};
  return static_cast<int>(std::count_if(games_.begin(), games_.end(), [](const auto& entry) {
    return isActive(entry.second.state);
  }));
}


/***/


Player MemoryGameStore::addPlayer(GameId gameId, UserId userId, const std::string& nickname, const std::string& avatar, Timestamp now) {
  if (nickname.empty() || avatar.empty()) {
    throw GameStoreError{GameStoreErrorCode::InvalidArgument, "player needs a nickname and an avatar"};
  }
  std::lock_guard lock{mutex_};
  findGame_mutex(gameId);
  for (const auto& [id, player] : players_) {
    if (player.gameId != gameId) {
      continue;
    }
    if (player.avatar == avatar) {
      throw GameStoreError{GameStoreErrorCode::UniquenessViolation, "avatar " + avatar + " is taken in game " + gameId.str()};
    }
    if (player.userId == userId) {
      throw GameStoreError{GameStoreErrorCode::UniquenessViolation, "user " + userId.str() + " already joined game " + gameId.str()};
    }
  }
  Player player{};
  player.id = PlayerId{nextId_mutex()};
  player.gameId = gameId;
  player.userId = userId;
  player.nickname = nickname;
  player.avatar = avatar;
  player.joinedAt = now;
  players_[player.id] = player;
  return player;
}


void MemoryGameStore::removePlayer(PlayerId playerId) {
  std::lock_guard lock{mutex_};
  findPlayer_mutex(playerId);
  for (auto i = picks_.begin(); i != picks_.end();) {
    if (i->second.playerId == playerId) {
      i = picks_.erase(i);
    } else {
      ++i;
    }
  }
  players_.erase(playerId);
}


std::optional<Player> MemoryGameStore::getPlayer(PlayerId playerId) const {
  std::lock_guard lock{mutex_};
  auto i = players_.find(playerId);
  if (i == players_.end()) {
    return std::nullopt;
  }
  return i->second;
}


std::vector<Player> MemoryGameStore::listPlayers(GameId gameId) const {
  std::lock_guard lock{mutex_};
  std::vector<Player> result{};
  for (const auto& [id, player] : players_) {
    if (player.gameId == gameId) {
      result.push_back(player);
    }
  }
  return result;
}


std::vector<Player> MemoryGameStore::leaderboard(GameId gameId) const {
  auto result = listPlayers(gameId);
  std::stable_sort(result.begin(), result.end(), [](const Player& a, const Player& b) {
    return a.points > b.points;
  });
  return result;
}


Player MemoryGameStore::addPoints(PlayerId playerId, int points) {
  std::lock_guard lock{mutex_};
  auto& player = findPlayer_mutex(playerId);
  player.points += points;
  return player;
}


/***/


std::vector<Round> MemoryGameStore::insertRounds(GameId gameId, const std::vector<RoundSpec>& specs) {
  std::lock_guard lock{mutex_};
  findGame_mutex(gameId);

  std::set<int> positions{};
  for (const auto& round : listRounds_mutex(gameId)) {
    positions.insert(round.position);
  }
  for (const auto& spec : specs) {
    if (spec.position < 1 || !spec.targetWordId) {
      throw GameStoreError{GameStoreErrorCode::InvalidArgument, makeString("round position %d needs a target word", spec.position)};
    }
    if (!positions.insert(spec.position).second) {
      throw GameStoreError{GameStoreErrorCode::UniquenessViolation, makeString("round position %d is taken in game %s", spec.position, gameId.str().c_str())};
    }
  }

  std::vector<Round> result{};
  for (const auto& spec : specs) {
    Round round{};
    round.id = RoundId{nextId_mutex()};
    round.gameId = gameId;
    round.targetWordId = spec.targetWordId;
    round.keywordIds = spec.keywordIds;
    round.possibleWordIds = spec.possibleWordIds;
    round.position = spec.position;
    round.state = RoundState::OnHold;
    rounds_[round.id] = round;
    result.push_back(round);
  }
  return result;
}


std::optional<Round> MemoryGameStore::getRound(RoundId roundId) const {
  std::lock_guard lock{mutex_};
  auto i = rounds_.find(roundId);
  if (i == rounds_.end()) {
    return std::nullopt;
  }
  return i->second;
}


std::vector<Round> MemoryGameStore::listRounds(GameId gameId) const {
  std::lock_guard lock{mutex_};
  return listRounds_mutex(gameId);
}


std::optional<Round> MemoryGameStore::currentRound(GameId gameId) const {
  std::lock_guard lock{mutex_};
  for (const auto& round : listRounds_mutex(gameId)) {
    if (round.state == RoundState::Playing || round.state == RoundState::OnHold) {
      return round;
    }
  }
  return std::nullopt;
}


std::optional<Round> MemoryGameStore::activateNextRound(GameId gameId) {
  std::lock_guard lock{mutex_};
  findGame_mutex(gameId);
  for (const auto& round : listRounds_mutex(gameId)) {
    if (round.state == RoundState::Playing) {
      throw GameStoreError{GameStoreErrorCode::InvalidState, "round " + round.id.str() + " is still playing"};
    }
  }
  for (const auto& round : listRounds_mutex(gameId)) {
    if (round.state == RoundState::OnHold) {
      auto& stored = rounds_[round.id];
      stored.state = RoundState::Playing;
      return stored;
    }
  }
  return std::nullopt;
}


bool MemoryGameStore::finishRound(RoundId roundId) {
  std::lock_guard lock{mutex_};
  auto& round = findRound_mutex(roundId);
  if (round.state != RoundState::Playing) {
    return false;
  }
  round.state = RoundState::Finished;
  return true;
}


/***/


PickResult MemoryGameStore::createPick(const PickRequest& request, Timestamp now) {
  std::lock_guard lock{mutex_};
  auto& round = findRound_mutex(request.roundId);
  auto& player = findPlayer_mutex(request.playerId);
  if (player.gameId != round.gameId) {
    throw GameStoreError{GameStoreErrorCode::InvalidArgument, "player " + player.id.str() + " is not in the game of round " + round.id.str()};
  }
  if (round.state != RoundState::Playing) {
    throw GameStoreError{GameStoreErrorCode::InvalidState, "round " + round.id.str() + " is " + str(round.state)};
  }
  for (const auto& [id, pick] : picks_) {
    if (pick.roundId == request.roundId && pick.playerId == request.playerId) {
      throw GameStoreError{GameStoreErrorCode::UniquenessViolation, "player " + player.id.str() + " already picked in round " + round.id.str()};
    }
  }

  Pick pick{};
  pick.id = PickId{nextId_mutex()};
  pick.roundId = request.roundId;
  pick.playerId = request.playerId;
  pick.wordId = request.wordId;
  pick.timeSeconds = request.timeSeconds;
  pick.keywordsShown = request.keywordsShown;
  pick.isCorrect = request.wordId == round.targetWordId;
  pick.points = pick.isCorrect ? calculatePoints(request.keywordsShown, static_cast<int>(round.keywordIds.size())) : 0;
  pick.createdAt = now;
  picks_[pick.id] = pick;
  player.points += pick.points;

  return PickResult{pick, playersHaveAllPicked_mutex(round.gameId, round.id)};
}


bool MemoryGameStore::playersHaveAllPicked(GameId gameId, RoundId roundId) const {
  std::lock_guard lock{mutex_};
  return playersHaveAllPicked_mutex(gameId, roundId);
}


std::vector<Pick> MemoryGameStore::listPicks(RoundId roundId) const {
  std::lock_guard lock{mutex_};
  std::vector<Pick> result{};
  for (const auto& [id, pick] : picks_) {
    if (pick.roundId == roundId) {
      result.push_back(pick);
    }
  }
  return result;
}


/***/


Game& MemoryGameStore::findGame_mutex(GameId gameId) {
  auto i = games_.find(gameId);
  if (i == games_.end()) {
    throw GameStoreError{GameStoreErrorCode::NotFound, "game " + gameId.str() + " not found"};
  }
  return i->second;
}


Player& MemoryGameStore::findPlayer_mutex(PlayerId playerId) {
  auto i = players_.find(playerId);
  if (i == players_.end()) {
    throw GameStoreError{GameStoreErrorCode::NotFound, "player " + playerId.str() + " not found"};
  }
  return i->second;
}


Round& MemoryGameStore::findRound_mutex(RoundId roundId) {
  auto i = rounds_.find(roundId);
  if (i == rounds_.end()) {
    throw GameStoreError{GameStoreErrorCode::NotFound, "round " + roundId.str() + " not found"};
  }
  return i->second;
}


std::vector<Round> MemoryGameStore::listRounds_mutex(GameId gameId) const {
  std::vector<Round> result{};
  for (const auto& [id, round] : rounds_) {
    if (round.gameId == gameId) {
      result.push_back(round);
    }
  }
  std::sort(result.begin(), result.end(), [](const Round& a, const Round& b) {
    return a.position < b.position;
  });
  return result;
}


bool MemoryGameStore::playersHaveAllPicked_mutex(GameId gameId, RoundId roundId) const {
  auto playerCount = std::count_if(players_.begin(), players_.end(), [gameId](const auto& entry) {
    return entry.second.gameId == gameId;
  });
  auto pickCount = std::count_if(picks_.begin(), picks_.end(), [roundId](const auto& entry) {
    return entry.second.roundId == roundId;
  });
  return playerCount == pickCount;
}
