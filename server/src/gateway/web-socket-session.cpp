// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include "./web-socket-session.h"
#include "./web-socket-endpoint.h"
#include "utilities/logging.h"

#include <boost/asio/buffer.hpp>
#include <boost/asio.hpp>

#define LOG_TRACE(format, ...)          LOG_X(format, ##__VA_ARGS__)


WebSocketSession::WebSocketSession(std::shared_ptr<boost::asio::io_context> ioc, WebSocketEndpoint& endpoint, socket socket,
    GatewayServices services, std::string connectionId) :
    GatewaySession{services, std::make_shared<Strand_Asio>(ioc->get_executor(), "WebSocketSession"), std::move(connectionId)},
    endpoint_{std::static_pointer_cast<WebSocketEndpoint>(endpoint.shared_from_this())},
    ioc_{std::move(ioc)},
    stream_{std::move(socket)},
    pingTimer_{*ioc_, std::chrono::steady_clock::time_point::max()}
{
  LOG_LIFECYCLE("%p WebSocketSession +", this);
  stream_.text(true);
}


WebSocketSession::~WebSocketSession() {
  LOG_LIFECYCLE("%p WebSocketSession ~", this);
}


Promise<void> WebSocketSession::shutdown_() {
  LOG_LIFECYCLE("%p WebSocketSession Shutdown", this);

  auto this_ = shared_this();
  co_await *strand_;

  error_code ec;
  pingTimer_.cancel(ec);
  if (ec) {
    logError(ec, "cancel");
  }

  if (auto endpoint = endpoint_.lock()) {
    endpoint->removeConnection_safe(this);
  }
  endpoint_.reset();

  if (stream_.is_open()) {
    Promise<void> deferred{};
    stream_.async_close({}, boost::asio::bind_executor(getAsioStrand(), [strand = getStrand_(), deferred](auto ec) {
      Strand_Asio::SetCurrent current{strand};
      if (ec) {
        logError(ec, "async_close");
      }
      if (deferred.isPending()) {
        deferred.resolve().done();
      }
    }));
    strand_->setTimeout([deferred]() {
      if (deferred.isPending()) {
        deferred.resolve().done();
      }
    }, ShutdownTimeoutMilliseconds);
    co_await deferred;
  }

  closeSocket_strand();
  co_await GatewaySession::shutdown_();
}


void WebSocketSession::closeSocket_strand() {
  if (stream_.next_layer().is_open()) {
    error_code ec;
    stream_.next_layer().shutdown(socket::shutdown_both, ec);
    if (ec) {
      logError(ec, "shutdown");
    }
    stream_.next_layer().close(ec);
    if (ec) {
      logError(ec, "close");
    }
  }
}


void WebSocketSession::onTimer(error_code ec) {
  if (ec && (ec != boost::asio::error::operation_aborted || shutdownStarted()))
    return shutdownStarted() ? logError(ec, "timer") : onError(ec, "timer");

  if (std::chrono::steady_clock::now() >= pingTimer_.expiry()) {
    if (stream_.is_open() && pingState_ == 0) {
      pingState_ = 1;
      pingTimer_.expires_after(PingTimeout);

      stream_.async_ping({}, boost::asio::bind_executor(getAsioStrand(), [weak_ = weak_from_this()](auto ec) {
        if (auto this_ = std::static_pointer_cast<WebSocketSession>(weak_.lock())) {
          Strand_Asio::SetCurrent current{this_->getStrand_()};
          this_->onPing(ec);
        }
      }));
    } else {
      // no pong within the timeout, the pending read fails and shuts us down
      stream_.next_layer().shutdown(socket::shutdown_both, ec);
      return logError(ec, "shutdown");
    }
  }

  pingTimer_.async_wait(boost::asio::bind_executor(getAsioStrand(), [weak_ = weak_from_this()](auto ec) {
    if (auto this_ = std::static_pointer_cast<WebSocketSession>(weak_.lock())) {
      Strand_Asio::SetCurrent current{this_->getStrand_()};
      this_->onTimer(ec);
    }
  }));
}


void WebSocketSession::activity() {
  LOG_ASSERT(getStrand().isCurrent());

  pingState_ = 0;
  pingTimer_.expires_after(PingTimeout);
}


void WebSocketSession::onPing(error_code ec) {
  LOG_ASSERT(getStrand().isCurrent());

  if (endpoint_.expired() || ec)
    return onError(ec, "ping");

  if (pingState_ == 1) {
    pingState_ = 2;
  }
}


void WebSocketSession::setControlCallback() {
  stream_.control_callback([weak_ = weak_from_this()](boost::beast::websocket::frame_type, boost::beast::string_view) {
    if (auto this_ = std::static_pointer_cast<WebSocketSession>(weak_.lock())) {
      Strand_Asio::SetCurrent current{this_->getStrand_()};
      this_->activity();
    }
  });
}


void WebSocketSession::doAccept() {
  LOG_TRACE("WebSocketSession %p doAccept", this);
  setControlCallback();
  onTimer({});
  pingTimer_.expires_after(PingTimeout);

  stream_.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.insert(boost::beast::http::field::sec_websocket_protocol, "cluecast");
  }));
  auto handler = boost::asio::bind_executor(getAsioStrand(), [this_ = shared_this()](auto ec) {
    Strand_Asio::SetCurrent current{this_->getStrand_()};
    this_->onAccept(ec);
  });
  stream_.async_accept(std::move(handler));
}


void WebSocketSession::onAccept(error_code ec) {
  LOG_ASSERT(getStrand().isCurrent());

  if (endpoint_.expired() || ec) {
    return onError(ec, "async_accept");
  }

  LOG_D("WebSocketSession %s: accepted", getConnectionId().c_str());
  doRead();
}


void WebSocketSession::doRead() {
  LOG_ASSERT(getStrand().isCurrent());

  auto handler = boost::asio::bind_executor(getAsioStrand(), [weak_ = weak_from_this()](auto ec, auto n) {
    if (auto this_ = std::static_pointer_cast<WebSocketSession>(weak_.lock())) {
      Strand_Asio::SetCurrent current{this_->getStrand_()};
      this_->onRead(ec, n);
    }
  });
  stream_.async_read(readBuffer_, std::move(handler));
}


void WebSocketSession::onRead(error_code ec, std::size_t) {
  LOG_ASSERT(getStrand().isCurrent());

  if (endpoint_.expired() || ec) {
    return onError(ec, "async_read");
  }

  activity();

  auto text = boost::beast::buffers_to_string(readBuffer_.data());
  readBuffer_.consume(readBuffer_.size());

  if (stream_.got_text()) {
    receiveText_strand(text);
  } else {
    sendText_strand("error bad_request binary frames are not supported");
  }
  doRead();
}


void WebSocketSession::doWrite(const std::string& text) {
  LOG_ASSERT(getStrand().isCurrent());

  std::lock_guard lock{writeMutex_};
  writeQueue_.push_back(text);
  tryWrite();
}


void WebSocketSession::tryWrite() {
  LOG_ASSERT(getStrand().isCurrent());

  // NOTE: requires writeMutex_ lock
  if (writeBuffer_.empty() && !writeQueue_.empty()) {
    writeBuffer_ = std::move(writeQueue_.front());
    writeQueue_.erase(writeQueue_.begin());

    auto handler = boost::asio::bind_executor(getAsioStrand(), [weak_ = weak_from_this()](auto ec, auto n) {
      if (auto this_ = std::static_pointer_cast<WebSocketSession>(weak_.lock())) {
        Strand_Asio::SetCurrent current{this_->getStrand_()};
        this_->onWrite(ec, n);
      }
    });
    stream_.async_write(boost::asio::buffer(writeBuffer_), std::move(handler));
  }
}


void WebSocketSession::onWrite(error_code ec, std::size_t) {
  LOG_ASSERT(getStrand().isCurrent());

  if (endpoint_.expired() || ec) {
    return onError(ec, "async_write");
  }

  std::lock_guard lock{writeMutex_};
  writeBuffer_.clear();
  tryWrite();
}


void WebSocketSession::onError(error_code ec, const char* op) {
  LOG_ASSERT(getStrand().isCurrent());

  if (!shutdownStarted()) {
    if (!endpoint_.expired() && ec != boost::asio::error::operation_aborted) {
      logError(ec, op);
    }

    stream_.next_layer().close(ec);
    if (ec) {
      logError(ec, "close");
    }

    auto this_ = shared_from_this();
    shutdown().onReject([this_](const std::exception_ptr& reason) {
      LOG_REJECTION(reason);
    }).done();
  } else {
    logError(ec, op);
  }
}


void WebSocketSession::logError(error_code ec, const char* op) {
  if (isExpectedError(ec)) {
    LOG_D("WebSocketSession %s: %s (%s)", op, ec.message().c_str(), ec.category().name());
  } else {
    LOG_E("WebSocketSession %s: %s (%s)", op, ec.message().c_str(), ec.category().name());
  }
}


bool WebSocketSession::isExpectedError(error_code ec) {
  return ec == boost::system::errc::success
      || ec == boost::system::errc::operation_canceled
      || ec == boost::asio::error::eof
      || ec == boost::asio::error::connection_reset
      || ec == boost::beast::websocket::error::closed;
}


/***/


void WebSocketSession::sendTextImpl_strand(const std::string& text) {
  doWrite(text);
}
