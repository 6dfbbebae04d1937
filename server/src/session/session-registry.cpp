// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include "./session-registry.h"
#include "utilities/logging.h"


SessionRegistry::SessionRegistry(GameStore& gameStore, EventBus& eventBus, StrandFactory strandFactory,
    std::chrono::milliseconds tickInterval) :
    gameStore_{gameStore},
    eventBus_{eventBus},
    strandFactory_{std::move(strandFactory)},
    tickInterval_{tickInterval} {
  LOG_LIFECYCLE("%p SessionRegistry +", this);
  LOG_ASSERT(strandFactory_);
}


SessionRegistry::~SessionRegistry() {
  LOG_LIFECYCLE("%p SessionRegistry ~", this);
  std::lock_guard lock{mutex_};
  LOG_ASSERT(sessions_.empty());
}


std::shared_ptr<SessionProcess> SessionRegistry::ensureSession(GameId gameId) {
  std::lock_guard lock{mutex_};
  auto i = sessions_.find(gameId);
  if (i != sessions_.end()) {
    return i->second;
  }
  if (shutdownStarted()) {
    throw std::logic_error("SessionRegistry: shutting down");
  }
  auto label = "session:" + gameId.str();
  auto session = std::make_shared<SessionProcess>(gameId, strandFactory_(label.c_str()), gameStore_, eventBus_, tickInterval_);
  sessions_[gameId] = session;
  LOG_D("SessionRegistry: started session for game %s (%zu running)", gameId.str().c_str(), sessions_.size());
  return session;
}


std::shared_ptr<SessionProcess> SessionRegistry::find(GameId gameId) const {
  std::lock_guard lock{mutex_};
  auto i = sessions_.find(gameId);
  return i != sessions_.end() ? i->second : nullptr;
}


void SessionRegistry::startRoundTimer(GameId gameId, RoundId roundId, int cluesInterval) {
  ensureSession(gameId)->startRoundTimer(roundId, cluesInterval);
}


bool SessionRegistry::stopRoundTimer(GameId gameId) {
  if (auto session = find(gameId)) {
    session->stopRoundTimer();
    return true;
  }
  return false;
}


bool SessionRegistry::pauseTimer(GameId gameId) {
  if (auto session = find(gameId)) {
    session->pauseTimer();
    return true;
  }
  return false;
}


Promise<SessionSnapshot> SessionRegistry::getState(GameId gameId) const {
  if (auto session = find(gameId)) {
    return session->getState();
  }
  return Promise<SessionSnapshot>{}.reject(SessionNotRunning{gameId});
}


Promise<void> SessionRegistry::stopGameSession(GameId gameId) {
  std::shared_ptr<SessionProcess> session{};
  {
    std::lock_guard lock{mutex_};
    auto i = sessions_.find(gameId);
    if (i == sessions_.end()) {
      return Promise<void>{}.resolve();
    }
    session = std::move(i->second);
    sessions_.erase(i);
  }
  LOG_D("SessionRegistry: stopping session for game %s", gameId.str().c_str());
  return session->shutdown();
}


std::size_t SessionRegistry::size() const {
  std::lock_guard lock{mutex_};
  return sessions_.size();
}


Promise<void> SessionRegistry::shutdown_() {
  std::vector<std::shared_ptr<SessionProcess>> sessions{};
  {
    std::lock_guard lock{mutex_};
    for (auto& [gameId, session] : sessions_) {
      sessions.push_back(std::move(session));
    }
    sessions_.clear();
  }
  std::vector<Promise<void>> promises{};
  for (auto& session : sessions) {
    promises.push_back(session->shutdown());
  }
  co_await PromiseUtils::all(promises);
  LOG_D("SessionRegistry: %zu sessions stopped", sessions.size());
}
