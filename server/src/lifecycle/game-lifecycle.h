// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#ifndef CLUECAST__LIFECYCLE__GAME_LIFECYCLE_H
#define CLUECAST__LIFECYCLE__GAME_LIFECYCLE_H

#include "./round-generator.h"
#include "async/shutdownable.h"
#include "async/strand.h"
#include "event-bus/event-bus.h"
#include "game-store/game-store.h"
#include "session/session-registry.h"
#include "supervision/presence-monitor.h"
#include <chrono>
#include <functional>
#include <memory>
#include <unordered_map>


struct LifecycleTimings {
  std::chrono::milliseconds roundAdvanceDelay{3000};
  std::chrono::seconds lobbyTimeout{15 * 60};
  std::chrono::seconds lobbySweepInterval{5 * 60};
};

using WallClock = std::function<Timestamp()>;


/*
 * Moves games through their states: lobby, rounds, game over.
 *
 * All operations run on the lifecycle strand and report through the
 * returned promise, rejected with GameStoreError on a refused request.
 * A round finishes either when every player has picked or when its
 * session publishes round_timeout, whichever comes first; the next round
 * starts roundAdvanceDelay later.
 */
class GameLifecycle :
    public Shutdownable,
    public GameCleanup,
    public std::enable_shared_from_this<GameLifecycle> {
  const std::shared_ptr<Strand_base> strand_;
  GameStore& gameStore_;
  RoundGenerator& roundGenerator_;
  EventBus& eventBus_;
  SessionRegistry& sessions_;
  const LifecycleTimings timings_;
  const WallClock clock_;

  std::weak_ptr<PresenceMonitor> presenceMonitor_{};
  std::shared_ptr<IntervalObject> lobbySweepInterval_{}; // strand
  std::unordered_map<GameId, SubscriptionId> runningGames_{}; // strand
  bool stopped_{}; // strand

public:
  GameLifecycle(std::shared_ptr<Strand_base> strand, GameStore& gameStore, RoundGenerator& roundGenerator,
      EventBus& eventBus, SessionRegistry& sessions, LifecycleTimings timings = {},
      WallClock clock = std::chrono::system_clock::now);
  ~GameLifecycle() override;

  GameLifecycle(const GameLifecycle&) = delete;
  GameLifecycle& operator=(const GameLifecycle&) = delete;

  // must be called before startup()
  void setPresenceMonitor(std::shared_ptr<PresenceMonitor> presenceMonitor);
  void startup();

  [[nodiscard]] Promise<Game> createGame(UserId hostUserId, GameSettings settings);
  [[nodiscard]] Promise<Player> joinGame(GameId gameId, UserId userId, std::string nickname, std::string avatar);
  [[nodiscard]] Promise<void> leaveGame(GameId gameId, PlayerId playerId);
  [[nodiscard]] Promise<void> startGame(GameId gameId);

  // keywords shown are read from the game's session
  [[nodiscard]] Promise<Pick> submitPick(GameId gameId, PlayerId playerId, WordId wordId, int timeSeconds);

  [[nodiscard]] Promise<void> stopGameManually(GameId gameId);
  [[nodiscard]] Promise<void> cancelGame(GameId gameId);

  // posted to the lifecycle strand, so it never interleaves with a transition
  void cleanupGameOnHostDisconnect(GameId gameId) override;

protected: // Shutdownable
  [[nodiscard]] Promise<void> shutdown_() override;

private:
  template <typename T, typename F>
  Promise<T> post_(F action);

  Game createGame_strand(UserId hostUserId, const GameSettings& settings);
  Player joinGame_strand(GameId gameId, UserId userId, const std::string& nickname, const std::string& avatar);
  void leaveGame_strand(GameId gameId, PlayerId playerId);
  void startGame_strand(GameId gameId);
  Round playingRound_strand(GameId gameId) const;
  Pick submitPick_strand(GameId gameId, RoundId roundId, PlayerId playerId, WordId wordId, int timeSeconds, int keywordsShown);
  void stopGameManually_strand(GameId gameId);
  void cancelGame_strand(GameId gameId);

  void onGameEvent_strand(const GameEvent& event);
  void finishRound_strand(GameId gameId, RoundId roundId);
  void advanceRound_strand(GameId gameId);
  void startRound_strand(const Game& game, const Round& round);
  void finishGame_strand(GameId gameId);
  void cleanupGameOnHostDisconnect_strand(GameId gameId);
  void releaseGame_strand(GameId gameId);
  void startLobbySweep_strand();
  void sweepLobbies_strand();

  Game requireGame(GameId gameId) const;
  void publishGameEvent(GameEventType type, GameId gameId, RoundId roundId = {}, PlayerId playerId = {});
  void publishGameCount();
};


#endif
