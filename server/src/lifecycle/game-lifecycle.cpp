// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include "./game-lifecycle.h"
#include "utilities/logging.h"
#include <stdexcept>
#include <type_traits>


namespace {
  template <typename T, typename F>
  void settlePromise(const Promise<T>& result, F&& action) {
    try {
      if constexpr (std::is_void_v<T>) {
        action();
        result.resolve().done();
      } else {
        result.resolve(action()).done();
      }
    } catch (...) {
      result.reject(std::current_exception()).done();
    }
  }

  GameEvent makeGameEvent(GameEventType type, GameId gameId, RoundId roundId = {}) {
    GameEvent result{};
    result.type = type;
    result.gameId = gameId;
    result.roundId = roundId;
    return result;
  }

  GameStoreError invalidState(const Game& game, const char* request) {
    return GameStoreError{GameStoreErrorCode::InvalidState,
        makeString("can not %s game %s in state %s", request, game.id.str().c_str(), str(game.state))};
  }
}


GameLifecycle::GameLifecycle(std::shared_ptr<Strand_base> strand, GameStore& gameStore, RoundGenerator& roundGenerator,
    EventBus& eventBus, SessionRegistry& sessions, LifecycleTimings timings, WallClock clock) :
    strand_{std::move(strand)},
    gameStore_{gameStore},
    roundGenerator_{roundGenerator},
    eventBus_{eventBus},
    sessions_{sessions},
    timings_{timings},
    clock_{std::move(clock)} {
  LOG_LIFECYCLE("%p GameLifecycle +", this);
  LOG_ASSERT(strand_);
  LOG_ASSERT(clock_);
}


GameLifecycle::~GameLifecycle() {
  LOG_LIFECYCLE("%p GameLifecycle ~", this);
}


void GameLifecycle::setPresenceMonitor(std::shared_ptr<PresenceMonitor> presenceMonitor) {
  presenceMonitor_ = presenceMonitor;
}


void GameLifecycle::startup() {
  LOG_ASSERT(!weak_from_this().expired());
  strand_->setImmediate([weak_ = weak_from_this()]() {
    if (auto this_ = weak_.lock()) {
      this_->startLobbySweep_strand();
    }
  });
}


Promise<Game> GameLifecycle::createGame(UserId hostUserId, GameSettings settings) {
  return post_<Game>([hostUserId, settings](GameLifecycle& self) {
    return self.createGame_strand(hostUserId, settings);
  });
}


Promise<Player> GameLifecycle::joinGame(GameId gameId, UserId userId, std::string nickname, std::string avatar) {
  return post_<Player>([gameId, userId, nickname = std::move(nickname), avatar = std::move(avatar)](GameLifecycle& self) {
    return self.joinGame_strand(gameId, userId, nickname, avatar);
  });
}


Promise<void> GameLifecycle::leaveGame(GameId gameId, PlayerId playerId) {
  return post_<void>([gameId, playerId](GameLifecycle& self) {
    self.leaveGame_strand(gameId, playerId);
  });
}


Promise<void> GameLifecycle::startGame(GameId gameId) {
  return post_<void>([gameId](GameLifecycle& self) {
    self.startGame_strand(gameId);
  });
}


Promise<Pick> GameLifecycle::submitPick(GameId gameId, PlayerId playerId, WordId wordId, int timeSeconds) {
  auto this_ = shared_from_this();
  co_await *strand_;
  if (stopped_) {
    throw std::logic_error("GameLifecycle: shutting down");
  }

  auto round = playingRound_strand(gameId);
  auto snapshot = co_await sessions_.getState(gameId);
  int keywordsShown = snapshot.roundId == round.id ? snapshot.keywordsRevealed : 1;
  co_return submitPick_strand(gameId, round.id, playerId, wordId, timeSeconds, keywordsShown);
}


Promise<void> GameLifecycle::stopGameManually(GameId gameId) {
  return post_<void>([gameId](GameLifecycle& self) {
    self.stopGameManually_strand(gameId);
  });
}


Promise<void> GameLifecycle::cancelGame(GameId gameId) {
  return post_<void>([gameId](GameLifecycle& self) {
    self.cancelGame_strand(gameId);
  });
}


void GameLifecycle::cleanupGameOnHostDisconnect(GameId gameId) {
  strand_->setImmediate([weak_ = weak_from_this(), gameId]() {
    if (auto this_ = weak_.lock()) {
      this_->cleanupGameOnHostDisconnect_strand(gameId);
    }
  });
}


Promise<void> GameLifecycle::shutdown_() {
  auto this_ = shared_from_this();
  co_await *strand_;

  stopped_ = true;
  if (lobbySweepInterval_) {
    clearInterval(*lobbySweepInterval_);
    lobbySweepInterval_ = nullptr;
  }
  for (const auto& [gameId, subscriptionId] : runningGames_) {
    eventBus_.unsubscribe(subscriptionId);
  }
  runningGames_.clear();
}


/***/


template <typename T, typename F>
Promise<T> GameLifecycle::post_(F action) {
  Promise<T> result{};
  strand_->setImmediate([this_ = shared_from_this(), result, action = std::move(action)]() {
    settlePromise(result, [&]() {
      if (this_->stopped_) {
        throw std::logic_error("GameLifecycle: shutting down");
      }
      return action(*this_);
    });
  });
  return result;
}


Game GameLifecycle::createGame_strand(UserId hostUserId, const GameSettings& settings) {
  auto game = gameStore_.createGame(hostUserId, settings, clock_());
  LOG_I("GameLifecycle: game %s created by user %s", game.id.str().c_str(), hostUserId.str().c_str());
  if (auto presenceMonitor = presenceMonitor_.lock()) {
    presenceMonitor->monitorGameHost(game.id);
  }
  publishGameCount();
  return game;
}


Player GameLifecycle::joinGame_strand(GameId gameId, UserId userId, const std::string& nickname, const std::string& avatar) {
  auto game = requireGame(gameId);
  if (game.state != GameState::WaitingForPlayers) {
    throw invalidState(game, "join");
  }
  auto player = gameStore_.addPlayer(gameId, userId, nickname, avatar, clock_());
  publishGameEvent(GameEventType::PlayerJoined, gameId, {}, player.id);
  return player;
}


void GameLifecycle::leaveGame_strand(GameId gameId, PlayerId playerId) {
  auto game = requireGame(gameId);
  if (game.state != GameState::WaitingForPlayers) {
    throw invalidState(game, "leave");
  }
  auto player = gameStore_.getPlayer(playerId);
  if (!player || player->gameId != gameId) {
    throw GameStoreError{GameStoreErrorCode::NotFound,
        makeString("player %s is not in game %s", playerId.str().c_str(), gameId.str().c_str())};
  }
  gameStore_.removePlayer(playerId);
  publishGameEvent(GameEventType::PlayerLeft, gameId, {}, playerId);
}


void GameLifecycle::startGame_strand(GameId gameId) {
  auto game = requireGame(gameId);
  if (game.state != GameState::WaitingForPlayers) {
    throw invalidState(game, "start");
  }
  if (gameStore_.listPlayers(gameId).empty()) {
    throw GameStoreError{GameStoreErrorCode::InvalidState,
        makeString("game %s has no players", gameId.str().c_str())};
  }

  auto rounds = roundGenerator_.generate(game.settings);
  game = gameStore_.markGameStarted(gameId, clock_());
  gameStore_.insertRounds(gameId, rounds);
  LOG_I("GameLifecycle: game %s started with %zu rounds", gameId.str().c_str(), rounds.size());

  auto weak_ = weak_from_this();
  runningGames_[gameId] = eventBus_.subscribe(gameTopic(gameId), strand_, [weak_](const std::string&, const GameEvent& event) {
    if (auto this_ = weak_.lock()) {
      this_->onGameEvent_strand(event);
    }
  });

  publishGameEvent(GameEventType::GameStarted, gameId);
  publishGameCount();

  if (auto round = gameStore_.activateNextRound(gameId)) {
    startRound_strand(game, *round);
  } else {
    finishGame_strand(gameId);
  }
}


Round GameLifecycle::playingRound_strand(GameId gameId) const {
  auto game = requireGame(gameId);
  if (game.state != GameState::GameRunning) {
    throw invalidState(game, "pick in");
  }
  auto round = gameStore_.currentRound(gameId);
  if (!round || round->state != RoundState::Playing) {
    throw GameStoreError{GameStoreErrorCode::InvalidState,
        makeString("game %s has no round playing", gameId.str().c_str())};
  }
  return *round;
}


Pick GameLifecycle::submitPick_strand(GameId gameId, RoundId roundId, PlayerId playerId, WordId wordId, int timeSeconds, int keywordsShown) {
  auto result = gameStore_.createPick(PickRequest{roundId, playerId, wordId, timeSeconds, keywordsShown}, clock_());

  auto event = makeGameEvent(GameEventType::PickSubmitted, gameId, roundId);
  event.playerId = playerId;
  event.isCorrect = result.pick.isCorrect;
  event.points = result.pick.points;
  eventBus_.publish(gameTopic(gameId), event);

  if (result.allPicked) {
    LOG_D("GameLifecycle: all players picked in round %s", roundId.str().c_str());
    finishRound_strand(gameId, roundId);
  }
  return result.pick;
}


void GameLifecycle::stopGameManually_strand(GameId gameId) {
  requireGame(gameId);
  releaseGame_strand(gameId);
  gameStore_.markGameState(gameId, GameState::GameOver);
  LOG_I("GameLifecycle: game %s stopped by host", gameId.str().c_str());
  publishGameEvent(GameEventType::GameStoppedByHost, gameId);
  publishGameCount();
}


void GameLifecycle::cancelGame_strand(GameId gameId) {
  auto game = requireGame(gameId);
  if (game.state != GameState::WaitingForPlayers) {
    throw invalidState(game, "cancel");
  }
  gameStore_.deleteGame(gameId);
  releaseGame_strand(gameId);
  LOG_I("GameLifecycle: game %s cancelled", gameId.str().c_str());
  publishGameEvent(GameEventType::GameCancelled, gameId);
  publishGameCount();
}


/***/


void GameLifecycle::onGameEvent_strand(const GameEvent& event) {
  if (stopped_ || event.type != GameEventType::RoundTimeout) {
    return;
  }
  finishRound_strand(event.gameId, event.roundId);
}


void GameLifecycle::finishRound_strand(GameId gameId, RoundId roundId) {
  if (!gameStore_.finishRound(roundId)) {
    LOG_D("GameLifecycle: round %s already finished", roundId.str().c_str());
    return;
  }
  sessions_.pauseTimer(gameId);

  auto event = makeGameEvent(GameEventType::RoundFinished, gameId, roundId);
  if (auto round = gameStore_.getRound(roundId)) {
    event.position = round->position;
  }
  eventBus_.publish(gameTopic(gameId), event);

  auto weak_ = weak_from_this();
  strand_->setTimeout([weak_, gameId]() {
    if (auto this_ = weak_.lock()) {
      this_->advanceRound_strand(gameId);
    }
  }, static_cast<double>(timings_.roundAdvanceDelay.count()));
}


void GameLifecycle::advanceRound_strand(GameId gameId) {
  if (stopped_) {
    return;
  }
  auto game = gameStore_.getGame(gameId);
  if (!game || game->state != GameState::GameRunning) {
    LOG_D("GameLifecycle: game %s ended before next round", gameId.str().c_str());
    return;
  }
  if (auto round = gameStore_.activateNextRound(gameId)) {
    startRound_strand(*game, *round);
  } else {
    finishGame_strand(gameId);
  }
}


void GameLifecycle::startRound_strand(const Game& game, const Round& round) {
  sessions_.startRoundTimer(game.id, round.id, game.settings.cluesInterval);
  auto event = makeGameEvent(GameEventType::RoundStarted, game.id, round.id);
  event.position = round.position;
  eventBus_.publish(gameTopic(game.id), event);
}


void GameLifecycle::finishGame_strand(GameId gameId) {
  gameStore_.markGameState(gameId, GameState::GameOver);
  releaseGame_strand(gameId);
  LOG_I("GameLifecycle: game %s over", gameId.str().c_str());
  publishGameEvent(GameEventType::GameOver, gameId);
  publishGameCount();
}


void GameLifecycle::cleanupGameOnHostDisconnect_strand(GameId gameId) {
  if (stopped_) {
    return;
  }
  auto game = gameStore_.getGame(gameId);
  if (!game || !isActive(game->state)) {
    LOG_D("GameLifecycle: game %s needs no cleanup", gameId.str().c_str());
    return;
  }

  LOG_I("GameLifecycle: game %s ended, host disconnected", gameId.str().c_str());
  releaseGame_strand(gameId);
  gameStore_.markGameState(gameId, GameState::HostDisconnected);
  publishGameEvent(GameEventType::HostDisconnected, gameId);
  publishGameCount();
}


// drops the timer, the event subscription and the host monitoring of an ended game
void GameLifecycle::releaseGame_strand(GameId gameId) {
  auto i = runningGames_.find(gameId);
  if (i != runningGames_.end()) {
    eventBus_.unsubscribe(i->second);
    runningGames_.erase(i);
  }
  sessions_.stopGameSession(gameId).done();
  if (auto presenceMonitor = presenceMonitor_.lock()) {
    presenceMonitor->unmonitorGameHost(gameId);
  }
}


void GameLifecycle::startLobbySweep_strand() {
  if (stopped_ || lobbySweepInterval_) {
    return;
  }
  auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(timings_.lobbySweepInterval);
  lobbySweepInterval_ = strand_->setInterval([weak_ = weak_from_this()]() {
    if (auto this_ = weak_.lock()) {
      this_->sweepLobbies_strand();
    }
  }, static_cast<double>(delay.count()));
}


void GameLifecycle::sweepLobbies_strand() {
  if (stopped_) {
    return;
  }
  const auto now = clock_();
  int count = 0;
  for (const auto& game : gameStore_.listGames(GameState::WaitingForPlayers)) {
    if (now - game.createdAt < timings_.lobbyTimeout) {
      continue;
    }
    gameStore_.markGameState(game.id, GameState::LobbyTimeout);
    releaseGame_strand(game.id);
    LOG_I("GameLifecycle: game %s lobby timed out", game.id.str().c_str());
    publishGameEvent(GameEventType::LobbyTimeout, game.id);
    ++count;
  }
  if (count != 0) {
    publishGameCount();
  }
}


Game GameLifecycle::requireGame(GameId gameId) const {
  auto game = gameStore_.getGame(gameId);
  if (!game) {
    throw GameStoreError{GameStoreErrorCode::NotFound, makeString("game %s not found", gameId.str().c_str())};
  }
  return *game;
}


void GameLifecycle::publishGameEvent(GameEventType type, GameId gameId, RoundId roundId, PlayerId playerId) {
  auto event = makeGameEvent(type, gameId, roundId);
  event.playerId = playerId;
  eventBus_.publish(gameTopic(gameId), event);
}


void GameLifecycle::publishGameCount() {
  eventBus_.publish(ActiveGamesTopic, GameEvent::gameCountChanged(gameStore_.countActiveGames()));
}
