// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include "./session-process.h"
#include "utilities/logging.h"


const char* str(SessionTimerState state) {
  switch (state) {
    case SessionTimerState::Idle: return "idle";
    case SessionTimerState::Playing: return "playing";
    default: return "?";
  }
}


SessionProcess::SessionProcess(GameId gameId, std::shared_ptr<Strand_base> strand, GameStore& gameStore, EventBus& eventBus,
    std::chrono::milliseconds tickInterval) :
    gameId_{gameId},
    strand_{std::move(strand)},
    gameStore_{gameStore},
    eventBus_{eventBus},
    tickInterval_{tickInterval} {
  LOG_LIFECYCLE("%p SessionProcess + %s", this, gameId_.str().c_str());
  LOG_ASSERT(strand_);
}


SessionProcess::~SessionProcess() {
  LOG_LIFECYCLE("%p SessionProcess ~ %s", this, gameId_.str().c_str());
}


void SessionProcess::startRoundTimer(RoundId roundId, int cluesInterval) {
  if (!roundId) {
    throw std::invalid_argument("startRoundTimer: missing round id");
  }
  if (cluesInterval < 1) {
    throw std::invalid_argument(makeString("startRoundTimer: clues interval %d is below 1", cluesInterval));
  }
  auto weak_ = weak_from_this();
  strand_->setImmediate([weak_, roundId, cluesInterval]() {
    if (auto this_ = weak_.lock()) {
      this_->startRoundTimer_strand(roundId, cluesInterval);
    }
  });
}


void SessionProcess::stopRoundTimer() {
  auto weak_ = weak_from_this();
  strand_->setImmediate([weak_]() {
    if (auto this_ = weak_.lock()) {
      this_->stopRoundTimer_strand();
    }
  });
}


void SessionProcess::pauseTimer() {
  auto weak_ = weak_from_this();
  strand_->setImmediate([weak_]() {
    if (auto this_ = weak_.lock()) {
      this_->pauseTimer_strand();
    }
  });
}


Promise<SessionSnapshot> SessionProcess::getState() {
  Promise<SessionSnapshot> result{};
  auto weak_ = weak_from_this();
  auto gameId = gameId_;
  strand_->setImmediate([weak_, gameId, result]() {
    if (auto this_ = weak_.lock()) {
      result.resolve(this_->makeSnapshot_strand()).done();
    } else {
      result.reject(SessionNotRunning{gameId}).done();
    }
  });
  return result;
}


void SessionProcess::postTick(RoundId roundId, int runGeneration) {
  auto weak_ = weak_from_this();
  strand_->setImmediate([weak_, roundId, runGeneration]() {
    if (auto this_ = weak_.lock()) {
      this_->tick_strand(roundId, runGeneration);
    }
  });
}


void SessionProcess::postRoundTimeout(RoundId roundId, int runGeneration) {
  auto weak_ = weak_from_this();
  strand_->setImmediate([weak_, roundId, runGeneration]() {
    if (auto this_ = weak_.lock()) {
      this_->roundTimeout_strand(roundId, runGeneration);
    }
  });
}


Promise<void> SessionProcess::shutdown_() {
  auto this_ = shared_from_this();
  co_await *strand_;

  stopped_ = true;
  ++runGeneration_;
  cancelTick_strand();
  timerState_ = SessionTimerState::Idle;
  LOG_D("SessionProcess %s: shut down", gameId_.str().c_str());
}


/***/


void SessionProcess::startRoundTimer_strand(RoundId roundId, int cluesInterval) {
  if (stopped_) {
    LOG_W("SessionProcess %s: start of round %s after shutdown", gameId_.str().c_str(), roundId.str().c_str());
    return;
  }

  if (roundId == roundId_ && paused_ && timerState_ == SessionTimerState::Playing) {
    paused_ = false;
    LOG_D("SessionProcess %s: resume round %s at %ds", gameId_.str().c_str(), roundId.str().c_str(), elapsedSeconds_);
    publishProgress_strand();
    scheduleTick_strand();
    return;
  }

  cancelTick_strand();
  ++runGeneration_;

  auto round = gameStore_.getRound(roundId);
  if (!round) {
    LOG_E("SessionProcess %s: round %s not found", gameId_.str().c_str(), roundId.str().c_str());
    roundId_ = RoundId::None;
    timerState_ = SessionTimerState::Idle;
    elapsedSeconds_ = 0;
    return;
  }

  roundId_ = roundId;
  cluesInterval_ = cluesInterval;
  elapsedSeconds_ = 0;
  keywordsRevealed_ = 1;
  keywordsTotal_ = static_cast<int>(round->keywordIds.size());
  timerState_ = SessionTimerState::Playing;
  timeoutScheduled_ = false;
  paused_ = false;

  LOG_D("SessionProcess %s: start round %s, %d keywords every %ds",
      gameId_.str().c_str(), roundId.str().c_str(), keywordsTotal_, cluesInterval_);
  publishProgress_strand();
  scheduleTick_strand();
}


void SessionProcess::stopRoundTimer_strand() {
  cancelTick_strand();
  ++runGeneration_;
  timerState_ = SessionTimerState::Idle;
  elapsedSeconds_ = 0;
}


void SessionProcess::pauseTimer_strand() {
  cancelTick_strand();
  paused_ = true;
}


void SessionProcess::tick_strand(RoundId roundId, int runGeneration) {
  if (isStale_strand(roundId, runGeneration) || timerState_ == SessionTimerState::Idle || paused_) {
    LOG_D("SessionProcess %s: stale tick for round %s", gameId_.str().c_str(), roundId.str().c_str());
    return;
  }

  ++elapsedSeconds_;
  if (elapsedSeconds_ % cluesInterval_ == 0 && keywordsRevealed_ < keywordsTotal_) {
    ++keywordsRevealed_;
  }
  publishProgress_strand();

  if (!timeoutScheduled_
      && keywordsRevealed_ >= keywordsTotal_
      && elapsedSeconds_ >= keywordsTotal_ * cluesInterval_) {
    timeoutScheduled_ = true;
    postRoundTimeout(roundId, runGeneration);
  }

  scheduleTick_strand();
}


void SessionProcess::roundTimeout_strand(RoundId roundId, int runGeneration) {
  if (isStale_strand(roundId, runGeneration)) {
    LOG_D("SessionProcess %s: stale timeout for round %s", gameId_.str().c_str(), roundId.str().c_str());
    return;
  }
  LOG_D("SessionProcess %s: round %s timed out", gameId_.str().c_str(), roundId.str().c_str());
  eventBus_.publish(gameTopic(gameId_), GameEvent::roundTimeout(gameId_, roundId));
}


bool SessionProcess::isStale_strand(RoundId roundId, int runGeneration) const {
  return stopped_ || roundId != roundId_ || runGeneration != runGeneration_;
}


void SessionProcess::scheduleTick_strand() {
  cancelTick_strand();
  auto weak_ = weak_from_this();
  auto roundId = roundId_;
  auto runGeneration = runGeneration_;
  tickTimeout_ = strand_->setTimeout([weak_, roundId, runGeneration]() {
    if (auto this_ = weak_.lock()) {
      this_->tick_strand(roundId, runGeneration);
    }
  }, static_cast<double>(tickInterval_.count()));
}


void SessionProcess::cancelTick_strand() {
  if (tickTimeout_) {
    clearTimeout(*tickTimeout_);
    tickTimeout_ = nullptr;
  }
}


void SessionProcess::publishProgress_strand() {
  eventBus_.publish(gameTopic(gameId_), GameEvent::keywordRevealed(gameId_, roundId_, keywordsRevealed_, elapsedSeconds_));
}


SessionSnapshot SessionProcess::makeSnapshot_strand() const {
  SessionSnapshot result{};
  result.gameId = gameId_;
  result.roundId = roundId_;
  result.cluesInterval = cluesInterval_;
  result.elapsedSeconds = elapsedSeconds_;
  result.keywordsRevealed = keywordsRevealed_;
  result.keywordsTotal = keywordsTotal_;
  result.roundState = timerState_;
  result.timeoutScheduled = timeoutScheduled_;
  result.paused = paused_;
  result.runGeneration = runGeneration_;
  return result;
}
