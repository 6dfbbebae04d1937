// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#ifndef CLUECAST__EVENT_BUS__PRESENCE_H
#define CLUECAST__EVENT_BUS__PRESENCE_H

#include "./event-bus.h"
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>


/*
 * Live connections attached to topics. Every change is published on the
 * topic itself as a presence_diff event with its joins and leaves.
 */
class PresenceTracker {
  EventBus& eventBus_;
  mutable std::mutex mutex_{};
  std::unordered_map<std::string, std::vector<PresenceEntry>> topics_{};

public:
  explicit PresenceTracker(EventBus& eventBus);
  ~PresenceTracker();

  PresenceTracker(const PresenceTracker&) = delete;
  PresenceTracker& operator=(const PresenceTracker&) = delete;

  // false if the connection is already tracked on the topic
  bool track(const std::string& topic, const std::string& key, const std::string& connectionId);
  bool untrack(const std::string& topic, const std::string& connectionId);
  // removes the connection from every topic, one diff per topic
  void untrackConnection(const std::string& connectionId);

  [[nodiscard]] std::vector<PresenceEntry> list(const std::string& topic) const;
  [[nodiscard]] bool isEmpty(const std::string& topic) const;

private:
  void publishDiff_mutex(const std::string& topic, std::vector<PresenceEntry> joins, std::vector<PresenceEntry> leaves);
};


#endif
