// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#ifndef CLUECAST__SESSION__SESSION_REGISTRY_H
#define CLUECAST__SESSION__SESSION_REGISTRY_H

#include "./session-process.h"
#include <mutex>
#include <unordered_map>


/*
 * Game id to session process. A process is created on first use and
 * shut down and forgotten when its game ends.
 */
class SessionRegistry : public Shutdownable {
  GameStore& gameStore_;
  EventBus& eventBus_;
  const StrandFactory strandFactory_;
  const std::chrono::milliseconds tickInterval_;
  mutable std::mutex mutex_{};
  std::unordered_map<GameId, std::shared_ptr<SessionProcess>> sessions_{};

public:
  SessionRegistry(GameStore& gameStore, EventBus& eventBus, StrandFactory strandFactory,
      std::chrono::milliseconds tickInterval = std::chrono::milliseconds{1000});
  ~SessionRegistry() override;

  SessionRegistry(const SessionRegistry&) = delete;
  SessionRegistry& operator=(const SessionRegistry&) = delete;

  std::shared_ptr<SessionProcess> ensureSession(GameId gameId);
  [[nodiscard]] std::shared_ptr<SessionProcess> find(GameId gameId) const;

  // ensures the process and starts the round timer on it
  void startRoundTimer(GameId gameId, RoundId roundId, int cluesInterval);
  // false if the game has no process
  bool stopRoundTimer(GameId gameId);
  bool pauseTimer(GameId gameId);

  // rejected with SessionNotRunning if the game has no process
  [[nodiscard]] Promise<SessionSnapshot> getState(GameId gameId) const;

  // removes the process and shuts it down; fulfilled at once if there is none
  [[nodiscard]] Promise<void> stopGameSession(GameId gameId);

  [[nodiscard]] std::size_t size() const;

protected: // Shutdownable
  [[nodiscard]] Promise<void> shutdown_() override;
};


#endif
