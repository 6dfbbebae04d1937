// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#ifndef CLUECAST__SESSION__SESSION_PROCESS_H
#define CLUECAST__SESSION__SESSION_PROCESS_H

#include "async/shutdownable.h"
#include "async/strand.h"
#include "event-bus/event-bus.h"
#include "game-store/game-store.h"
#include <chrono>
#include <memory>
#include <stdexcept>


enum class SessionTimerState { Idle, Playing };

const char* str(SessionTimerState state);


struct SessionSnapshot {
  GameId gameId{};
  RoundId roundId{};
  int cluesInterval{};
  int elapsedSeconds{};
  int keywordsRevealed{};
  int keywordsTotal{};
  SessionTimerState roundState{SessionTimerState::Idle};
  bool timeoutScheduled{};
  bool paused{};
  int runGeneration{};
};


class SessionNotRunning : public std::runtime_error {
public:
  explicit SessionNotRunning(GameId gameId) :
      std::runtime_error{"no session process for game " + gameId.str()} {}
};


/*
 * Round timer of one game.
 *
 * All state lives on the strand; the public methods only post messages.
 * Every tick and timeout message carries the round id and the run
 * generation it was scheduled for. A fresh start or a stop begins a new
 * generation, and messages of an older one are discarded on arrival, so
 * a restarted or stopped timer never needs to chase its pending callbacks.
 * Resuming a paused round keeps its generation.
 */
class SessionProcess :
    public Shutdownable,
    public std::enable_shared_from_this<SessionProcess> {
  const GameId gameId_;
  const std::shared_ptr<Strand_base> strand_;
  GameStore& gameStore_;
  EventBus& eventBus_;
  const std::chrono::milliseconds tickInterval_;

  RoundId roundId_{};
  int cluesInterval_{};
  int elapsedSeconds_{};
  int keywordsRevealed_{};
  int keywordsTotal_{};
  SessionTimerState timerState_{SessionTimerState::Idle};
  bool timeoutScheduled_{};
  bool paused_{};
  bool stopped_{};
  int runGeneration_{};
  std::shared_ptr<TimeoutObject> tickTimeout_{};

public:
  SessionProcess(GameId gameId, std::shared_ptr<Strand_base> strand, GameStore& gameStore, EventBus& eventBus,
      std::chrono::milliseconds tickInterval = std::chrono::milliseconds{1000});
  ~SessionProcess() override;

  SessionProcess(const SessionProcess&) = delete;
  SessionProcess& operator=(const SessionProcess&) = delete;

  [[nodiscard]] GameId getGameId() const noexcept { return gameId_; }
  [[nodiscard]] const std::shared_ptr<Strand_base>& getStrand() const noexcept { return strand_; }

  // throws std::invalid_argument for a zero round id or an interval below 1
  void startRoundTimer(RoundId roundId, int cluesInterval);
  void stopRoundTimer();
  void pauseTimer();
  [[nodiscard]] Promise<SessionSnapshot> getState();

  // mailbox entry points of the tagged timer messages
  void postTick(RoundId roundId, int runGeneration);
  void postRoundTimeout(RoundId roundId, int runGeneration);

protected: // Shutdownable
  [[nodiscard]] Promise<void> shutdown_() override;

private:
  void startRoundTimer_strand(RoundId roundId, int cluesInterval);
  void stopRoundTimer_strand();
  void pauseTimer_strand();
  void tick_strand(RoundId roundId, int runGeneration);
  void roundTimeout_strand(RoundId roundId, int runGeneration);
  [[nodiscard]] bool isStale_strand(RoundId roundId, int runGeneration) const;

  void scheduleTick_strand();
  void cancelTick_strand();
  void publishProgress_strand();
  [[nodiscard]] SessionSnapshot makeSnapshot_strand() const;
};


#endif
