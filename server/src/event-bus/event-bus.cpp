// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include "./event-bus.h"
#include "utilities/logging.h"
#include <algorithm>


EventBus::EventBus() {
  LOG_LIFECYCLE("%p EventBus +", this);
}


EventBus::~EventBus() {
  LOG_LIFECYCLE("%p EventBus ~", this);
}


SubscriptionId EventBus::subscribe(const std::string& topic, const std::shared_ptr<Strand_base>& strand, EventHandler handler) {
  LOG_ASSERT(strand);
  LOG_ASSERT(handler);

  auto subscriber = std::make_shared<Subscriber>();
  subscriber->topic = topic;
  subscriber->strand = strand;
  subscriber->handler = std::move(handler);

  std::lock_guard lock{mutex_};
  subscriber->id = ++lastId_;
  topics_[topic].push_back(subscriber);
  subscriptions_[subscriber->id] = subscriber;
  return subscriber->id;
}


void EventBus::unsubscribe(SubscriptionId subscriptionId) {
  std::lock_guard lock{mutex_};
  auto i = subscriptions_.find(subscriptionId);
  if (i == subscriptions_.end()) {
    return;
  }
  auto subscriber = i->second;
  subscriber->active = false;
  subscriptions_.erase(i);

  auto& subscribers = topics_[subscriber->topic];
  subscribers.erase(std::remove(subscribers.begin(), subscribers.end(), subscriber), subscribers.end());
  if (subscribers.empty()) {
    topics_.erase(subscriber->topic);
  }
}


void EventBus::publish(const std::string& topic, const GameEvent& event) {
  std::lock_guard lock{mutex_};
  auto i = topics_.find(topic);
  if (i == topics_.end()) {
    LOG_X("EventBus: %s %s, no subscribers", topic.c_str(), str(event.type));
    return;
  }
  for (const auto& subscriber : i->second) {
    auto strand = subscriber->strand.lock();
    if (!strand) {
      LOG_W("EventBus: %s subscription %llu has no strand", topic.c_str(), static_cast<unsigned long long>(subscriber->id));
      continue;
    }
    strand->setImmediate([subscriber, topic, event]() {
      if (subscriber->active) {
        subscriber->handler(topic, event);
      }
    });
  }
}


std::size_t EventBus::subscriberCount(const std::string& topic) const {
  std::lock_guard lock{mutex_};
  auto i = topics_.find(topic);
  return i != topics_.end() ? i->second.size() : 0;
}
