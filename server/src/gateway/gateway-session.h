// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#ifndef CLUECAST__GATEWAY__GATEWAY_SESSION_H
#define CLUECAST__GATEWAY__GATEWAY_SESSION_H

#include "./gateway-protocol.h"
#include "async/shutdownable.h"
#include "async/strand.h"
#include "event-bus/event-bus.h"
#include "event-bus/presence.h"
#include "lifecycle/game-lifecycle.h"
#include "session/session-registry.h"
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>


struct GatewayServices {
  EventBus& eventBus;
  PresenceTracker& presence;
  GameLifecycle& lifecycle;
  SessionRegistry& sessions;
};


/*
 * One client connection, independent of the transport.
 *
 * Commands are received as text on the session strand and answered
 * with one reply each. Subscribed bus events are delivered through the
 * same strand. Shutting the session down drops its subscriptions and
 * its presence on every topic.
 */
class GatewaySession :
    public Shutdownable,
    public std::enable_shared_from_this<GatewaySession> {
protected:
  const std::shared_ptr<Strand_base> strand_;

private:
  GatewayServices services_;
  const std::string connectionId_;
  std::unordered_map<std::string, SubscriptionId> subscriptions_{}; // strand
  bool closed_{}; // strand

public:
  GatewaySession(GatewayServices services, std::shared_ptr<Strand_base> strand, std::string connectionId);
  ~GatewaySession() override;

  GatewaySession(const GatewaySession&) = delete;
  GatewaySession& operator=(const GatewaySession&) = delete;

  [[nodiscard]] const std::string& getConnectionId() const noexcept { return connectionId_; }
  [[nodiscard]] Strand_base& getStrand() const { return *strand_; }

protected: // Shutdownable
  [[nodiscard]] Promise<void> shutdown_() override;

protected:
  void receiveText_strand(const std::string& text);
  void sendText_strand(const std::string& text);
  void close_strand();

  virtual void sendTextImpl_strand(const std::string& text) = 0;

private:
  void dispatchCommand_strand(const GatewayCommand& command);
  void subscribe_strand(const std::string& topic);
  void unsubscribe_strand(const std::string& topic);

  template <typename T>
  void reply_strand(Promise<T> promise, std::function<std::string(const T&)> format);
  void reply_strand(Promise<void> promise);
};


#endif
