// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#ifndef CLUECAST__EVENT_BUS__EVENT_BUS_H
#define CLUECAST__EVENT_BUS__EVENT_BUS_H

#include "./game-event.h"
#include "async/strand.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>


using EventHandler = std::function<void(const std::string& topic, const GameEvent& event)>;
using SubscriptionId = std::uint64_t;


/*
 * Topic based publish/subscribe.
 *
 * publish() never runs a handler inline; each subscriber receives the
 * event through its own strand, in publish order. After unsubscribe()
 * returns, events already queued for the subscription are dropped.
 */
class EventBus {
  struct Subscriber {
    SubscriptionId id{};
    std::string topic{};
    std::weak_ptr<Strand_base> strand{};
    EventHandler handler{};
    std::atomic_bool active{true};
  };

  mutable std::mutex mutex_{};
  SubscriptionId lastId_{};
  std::unordered_map<std::string, std::vector<std::shared_ptr<Subscriber>>> topics_{};
  std::unordered_map<SubscriptionId, std::shared_ptr<Subscriber>> subscriptions_{};

public:
  EventBus();
  ~EventBus();

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  SubscriptionId subscribe(const std::string& topic, const std::shared_ptr<Strand_base>& strand, EventHandler handler);
  void unsubscribe(SubscriptionId subscriptionId);

  void publish(const std::string& topic, const GameEvent& event);

  [[nodiscard]] std::size_t subscriberCount(const std::string& topic) const;
};


#endif
