// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include "./presence-monitor.h"
#include "utilities/logging.h"


PresenceMonitor::PresenceMonitor(std::shared_ptr<Strand_base> strand, GameStore& gameStore, EventBus& eventBus,
    PresenceTracker& presence, GameCleanup& gameCleanup, std::chrono::milliseconds debounce) :
    strand_{std::move(strand)},
    gameStore_{gameStore},
    eventBus_{eventBus},
    presence_{presence},
    gameCleanup_{gameCleanup},
    debounce_{debounce} {
  LOG_LIFECYCLE("%p PresenceMonitor +", this);
  LOG_ASSERT(strand_);
}


PresenceMonitor::~PresenceMonitor() {
  LOG_LIFECYCLE("%p PresenceMonitor ~", this);
}


void PresenceMonitor::monitorGameHost(GameId gameId) {
  auto weak_ = weak_from_this();
  strand_->setImmediate([weak_, gameId]() {
    if (auto this_ = weak_.lock()) {
      this_->monitorGameHost_strand(gameId);
    }
  });
}


void PresenceMonitor::unmonitorGameHost(GameId gameId) {
  auto weak_ = weak_from_this();
  strand_->setImmediate([weak_, gameId]() {
    if (auto this_ = weak_.lock()) {
      this_->unmonitor_strand(gameId);
    }
  });
}


bool PresenceMonitor::isMonitored_safe(GameId gameId) const {
  std::lock_guard lock{mutex_};
  return monitoredGames_.find(gameId) != monitoredGames_.end();
}


std::size_t PresenceMonitor::monitoredCount_safe() const {
  std::lock_guard lock{mutex_};
  return monitoredGames_.size();
}


Promise<void> PresenceMonitor::shutdown_() {
  auto this_ = shared_from_this();
  co_await *strand_;

  stopped_ = true;
  std::unordered_map<GameId, SubscriptionId> monitoredGames{};
  {
    std::lock_guard lock{mutex_};
    std::swap(monitoredGames, monitoredGames_);
  }
  for (const auto& [gameId, subscriptionId] : monitoredGames) {
    eventBus_.unsubscribe(subscriptionId);
  }
}


/***/


void PresenceMonitor::monitorGameHost_strand(GameId gameId) {
  if (stopped_) {
    return;
  }
  std::lock_guard lock{mutex_};
  if (monitoredGames_.find(gameId) != monitoredGames_.end()) {
    return;
  }
  auto weak_ = weak_from_this();
  monitoredGames_[gameId] = eventBus_.subscribe(hostTopic(gameId), strand_, [weak_, gameId](const std::string&, const GameEvent& event) {
    if (auto this_ = weak_.lock()) {
      this_->onPresenceDiff_strand(gameId, event);
    }
  });
  LOG_D("PresenceMonitor: monitoring host of game %s", gameId.str().c_str());
}


void PresenceMonitor::onPresenceDiff_strand(GameId gameId, const GameEvent& event) {
  if (stopped_ || event.type != GameEventType::PresenceDiff || event.leaves.empty()) {
    return;
  }
  LOG_D("PresenceMonitor: host left game %s, check in %lldms", gameId.str().c_str(), static_cast<long long>(debounce_.count()));
  auto weak_ = weak_from_this();
  strand_->setTimeout([weak_, gameId]() {
    if (auto this_ = weak_.lock()) {
      this_->checkHostDisconnect_strand(gameId);
    }
  }, static_cast<double>(debounce_.count()));
}


void PresenceMonitor::checkHostDisconnect_strand(GameId gameId) {
  if (stopped_ || !isMonitored_safe(gameId)) {
    return;
  }
  if (!presence_.isEmpty(hostTopic(gameId))) {
    LOG_D("PresenceMonitor: host of game %s is back", gameId.str().c_str());
    return;
  }
  auto game = gameStore_.getGame(gameId);
  if (!game || !isActive(game->state)) {
    LOG_D("PresenceMonitor: game %s no longer needs a host", gameId.str().c_str());
    return;
  }

  LOG_I("PresenceMonitor: host disconnected from game %s, cleaning up", gameId.str().c_str());
  unmonitor_strand(gameId);
  gameCleanup_.cleanupGameOnHostDisconnect(gameId);
}


void PresenceMonitor::unmonitor_strand(GameId gameId) {
  SubscriptionId subscriptionId{};
  {
    std::lock_guard lock{mutex_};
    auto i = monitoredGames_.find(gameId);
    if (i == monitoredGames_.end()) {
      return;
    }
    subscriptionId = i->second;
    monitoredGames_.erase(i);
  }
  eventBus_.unsubscribe(subscriptionId);
  LOG_D("PresenceMonitor: stopped monitoring host of game %s", gameId.str().c_str());
}
