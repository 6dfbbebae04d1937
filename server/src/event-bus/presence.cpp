// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include "./presence.h"
#include "utilities/logging.h"
#include <algorithm>


PresenceTracker::PresenceTracker(EventBus& eventBus) :
    eventBus_{eventBus} {
  LOG_LIFECYCLE("%p PresenceTracker +", this);
}


PresenceTracker::~PresenceTracker() {
  LOG_LIFECYCLE("%p PresenceTracker ~", this);
}


bool PresenceTracker::track(const std::string& topic, const std::string& key, const std::string& connectionId) {
  std::lock_guard lock{mutex_};
  auto& entries = topics_[topic];
  auto i = std::find_if(entries.begin(), entries.end(), [&connectionId](const PresenceEntry& entry) {
    return entry.connectionId == connectionId;
  });
  if (i != entries.end()) {
    return false;
  }
  PresenceEntry entry{key, connectionId};
  entries.push_back(entry);
  LOG_D("PresenceTracker: %s join %s (%s)", topic.c_str(), key.c_str(), connectionId.c_str());
  publishDiff_mutex(topic, {entry}, {});
  return true;
}


bool PresenceTracker::untrack(const std::string& topic, const std::string& connectionId) {
  std::lock_guard lock{mutex_};
  auto t = topics_.find(topic);
  if (t == topics_.end()) {
    return false;
  }
  auto& entries = t->second;
  auto i = std::find_if(entries.begin(), entries.end(), [&connectionId](const PresenceEntry& entry) {
    return entry.connectionId == connectionId;
  });
  if (i == entries.end()) {
    return false;
  }
  PresenceEntry entry = *i;
  entries.erase(i);
  if (entries.empty()) {
    topics_.erase(t);
  }
  LOG_D("PresenceTracker: %s leave %s (%s)", topic.c_str(), entry.key.c_str(), connectionId.c_str());
  publishDiff_mutex(topic, {}, {entry});
  return true;
}


void PresenceTracker::untrackConnection(const std::string& connectionId) {
  std::lock_guard lock{mutex_};
  for (auto t = topics_.begin(); t != topics_.end();) {
    auto& entries = t->second;
    std::vector<PresenceEntry> leaves{};
    for (auto i = entries.begin(); i != entries.end();) {
      if (i->connectionId == connectionId) {
        leaves.push_back(*i);
        i = entries.erase(i);
      } else {
        ++i;
      }
    }
    std::string topic = t->first;
    if (entries.empty()) {
      t = topics_.erase(t);
    } else {
      ++t;
    }
    if (!leaves.empty()) {
      publishDiff_mutex(topic, {}, std::move(leaves));
    }
  }
}


std::vector<PresenceEntry> PresenceTracker::list(const std::string& topic) const {
  std::lock_guard lock{mutex_};
  auto i = topics_.find(topic);
  if (i == topics_.end()) {
    return {};
  }
  return i->second;
}


bool PresenceTracker::isEmpty(const std::string& topic) const {
  std::lock_guard lock{mutex_};
  return topics_.find(topic) == topics_.end();
}


void PresenceTracker::publishDiff_mutex(const std::string& topic, std::vector<PresenceEntry> joins, std::vector<PresenceEntry> leaves) {
  GameEvent event{};
  event.type = GameEventType::PresenceDiff;
  event.gameId = parseGameTopic(topic).value_or(GameId::None);
  event.joins = std::move(joins);
  event.leaves = std::move(leaves);
  eventBus_.publish(topic, event);
}
