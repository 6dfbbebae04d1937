// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#ifndef CLUECAST__SUPERVISION__PRESENCE_MONITOR_H
#define CLUECAST__SUPERVISION__PRESENCE_MONITOR_H

#include "async/shutdownable.h"
#include "async/strand.h"
#include "event-bus/event-bus.h"
#include "event-bus/presence.h"
#include "game-store/game-store.h"
#include <chrono>
#include <mutex>
#include <unordered_map>


class GameCleanup {
public:
  virtual ~GameCleanup() = default;

  // ends a game whose host is gone, possibly after returning;
  // a no-op for a missing or ended game
  virtual void cleanupGameOnHostDisconnect(GameId gameId) = 0;
};


/*
 * Watches the host topic of every monitored game.
 *
 * A leave schedules a re-check after the debounce window. Only if the
 * host topic is still empty then, and the game is still waiting or
 * running, the game is unmonitored and handed to GameCleanup. A leave
 * followed by a join within the window is a reload, not a disconnect.
 */
class PresenceMonitor :
    public Shutdownable,
    public std::enable_shared_from_this<PresenceMonitor> {
  const std::shared_ptr<Strand_base> strand_;
  GameStore& gameStore_;
  EventBus& eventBus_;
  PresenceTracker& presence_;
  GameCleanup& gameCleanup_;
  const std::chrono::milliseconds debounce_;

  mutable std::mutex mutex_{};
  std::unordered_map<GameId, SubscriptionId> monitoredGames_{}; // mutex_
  bool stopped_{}; // strand

public:
  PresenceMonitor(std::shared_ptr<Strand_base> strand, GameStore& gameStore, EventBus& eventBus,
      PresenceTracker& presence, GameCleanup& gameCleanup,
      std::chrono::milliseconds debounce = std::chrono::milliseconds{2000});
  ~PresenceMonitor() override;

  PresenceMonitor(const PresenceMonitor&) = delete;
  PresenceMonitor& operator=(const PresenceMonitor&) = delete;

  // idempotent
  void monitorGameHost(GameId gameId);
  // called when a game ends; also drops a pending re-check
  void unmonitorGameHost(GameId gameId);

  [[nodiscard]] bool isMonitored_safe(GameId gameId) const;
  [[nodiscard]] std::size_t monitoredCount_safe() const;

protected: // Shutdownable
  [[nodiscard]] Promise<void> shutdown_() override;

private:
  void monitorGameHost_strand(GameId gameId);
  void onPresenceDiff_strand(GameId gameId, const GameEvent& event);
  void checkHostDisconnect_strand(GameId gameId);
  void unmonitor_strand(GameId gameId);
};


#endif
