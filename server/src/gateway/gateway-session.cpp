// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include "./gateway-session.h"
#include "utilities/logging.h"


GatewaySession::GatewaySession(GatewayServices services, std::shared_ptr<Strand_base> strand, std::string connectionId) :
    strand_{std::move(strand)},
    services_{services},
    connectionId_{std::move(connectionId)} {
  LOG_LIFECYCLE("%p GatewaySession + %s", this, connectionId_.c_str());
  LOG_ASSERT(strand_);
}


GatewaySession::~GatewaySession() {
  LOG_LIFECYCLE("%p GatewaySession ~", this);
}


Promise<void> GatewaySession::shutdown_() {
  auto this_ = shared_from_this();
  co_await *strand_;
  close_strand();
}


/***/


void GatewaySession::receiveText_strand(const std::string& text) {
  LOG_ASSERT(strand_->isCurrent());
  if (closed_) {
    return;
  }

  GatewayCommand command{};
  try {
    command = parseGatewayCommand(text);
  } catch (const ProtocolError&) {
    sendText_strand(formatRejection(std::current_exception()));
    return;
  }
  LOG_D("GatewaySession %s: %s", connectionId_.c_str(), str(command.type));
  dispatchCommand_strand(command);
}


void GatewaySession::sendText_strand(const std::string& text) {
  LOG_ASSERT(strand_->isCurrent());
  if (!closed_) {
    sendTextImpl_strand(text);
  }
}


void GatewaySession::close_strand() {
  if (closed_) {
    return;
  }
  closed_ = true;
  for (const auto& [topic, subscriptionId] : subscriptions_) {
    services_.eventBus.unsubscribe(subscriptionId);
  }
  subscriptions_.clear();
  services_.presence.untrackConnection(connectionId_);
  LOG_D("GatewaySession %s: closed", connectionId_.c_str());
}


void GatewaySession::dispatchCommand_strand(const GatewayCommand& command) {
  switch (command.type) {
    case GatewayCommandType::Subscribe:
      subscribe_strand(command.topic);
      sendText_strand("ok");
      break;

    case GatewayCommandType::Unsubscribe:
      unsubscribe_strand(command.topic);
      sendText_strand("ok");
      break;

    case GatewayCommandType::Track:
      if (services_.presence.track(command.topic, command.key, connectionId_)) {
        sendText_strand("ok");
      } else {
        sendText_strand("error invalid_state already tracked on " + command.topic);
      }
      break;

    case GatewayCommandType::Untrack:
      if (services_.presence.untrack(command.topic, connectionId_)) {
        sendText_strand("ok");
      } else {
        sendText_strand("error not_found not tracked on " + command.topic);
      }
      break;

    case GatewayCommandType::Create:
      reply_strand<Game>(services_.lifecycle.createGame(command.userId, command.settings), [](const Game& game) {
        return "ok game " + game.id.str();
      });
      break;

    case GatewayCommandType::Join:
      reply_strand<Player>(services_.lifecycle.joinGame(command.gameId, command.userId, command.nickname, command.avatar), [](const Player& player) {
        return "ok player " + player.id.str();
      });
      break;

    case GatewayCommandType::Leave:
      reply_strand(services_.lifecycle.leaveGame(command.gameId, command.playerId));
      break;

    case GatewayCommandType::Start:
      reply_strand(services_.lifecycle.startGame(command.gameId));
      break;

    case GatewayCommandType::Pick:
      reply_strand<Pick>(services_.lifecycle.submitPick(command.gameId, command.playerId, command.wordId, command.timeSeconds), [](const Pick& pick) {
        return makeString("ok pick %s correct=%d points=%d", pick.id.str().c_str(), pick.isCorrect ? 1 : 0, pick.points);
      });
      break;

    case GatewayCommandType::Stop:
      reply_strand(services_.lifecycle.stopGameManually(command.gameId));
      break;

    case GatewayCommandType::Cancel:
      reply_strand(services_.lifecycle.cancelGame(command.gameId));
      break;

    case GatewayCommandType::State:
      reply_strand<SessionSnapshot>(services_.sessions.getState(command.gameId), [](const SessionSnapshot& snapshot) {
        return formatSessionSnapshot(snapshot);
      });
      break;
  }
}


void GatewaySession::subscribe_strand(const std::string& topic) {
  if (subscriptions_.find(topic) != subscriptions_.end()) {
    return;
  }
  auto weak_ = weak_from_this();
  subscriptions_[topic] = services_.eventBus.subscribe(topic, strand_, [weak_](const std::string& eventTopic, const GameEvent& event) {
    if (auto this_ = weak_.lock()) {
      this_->sendText_strand(formatGatewayEvent(eventTopic, event));
    }
  });
}


void GatewaySession::unsubscribe_strand(const std::string& topic) {
  auto i = subscriptions_.find(topic);
  if (i != subscriptions_.end()) {
    services_.eventBus.unsubscribe(i->second);
    subscriptions_.erase(i);
  }
}


template <typename T>
void GatewaySession::reply_strand(Promise<T> promise, std::function<std::string(const T&)> format) {
  auto weak_ = weak_from_this();
  promise.then(strand_, [weak_, format = std::move(format)](const T& value) {
    if (auto this_ = weak_.lock()) {
      this_->sendText_strand(format(value));
    }
  }, [weak_](const std::exception_ptr& reason) {
    if (auto this_ = weak_.lock()) {
      this_->sendText_strand(formatRejection(reason));
    }
  }).done();
}


void GatewaySession::reply_strand(Promise<void> promise) {
  auto weak_ = weak_from_this();
  promise.then(strand_, [weak_]() {
    if (auto this_ = weak_.lock()) {
      this_->sendText_strand("ok");
    }
  }, [weak_](const std::exception_ptr& reason) {
    if (auto this_ = weak_.lock()) {
      this_->sendText_strand(formatRejection(reason));
    }
  }).done();
}
