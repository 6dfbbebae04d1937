// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#ifndef CLUECAST__GATEWAY__WEB_SOCKET_SESSION_H
#define CLUECAST__GATEWAY__WEB_SOCKET_SESSION_H

#include "./gateway-session.h"
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <mutex>
#include <string>
#include <vector>

class WebSocketEndpoint;


class WebSocketSession : public GatewaySession {
  friend class WebSocketEndpoint;

  using error_code = boost::system::error_code;
  using socket = boost::asio::ip::tcp::socket;
  using stream = boost::beast::websocket::stream<socket>;

  static constexpr std::chrono::duration PingTimeout = std::chrono::seconds(15);
  static constexpr int ShutdownTimeoutMilliseconds = 2500;

  std::weak_ptr<WebSocketEndpoint> endpoint_{};
  std::shared_ptr<boost::asio::io_context> ioc_{};
  stream stream_;
  boost::beast::flat_buffer readBuffer_{};
  std::string writeBuffer_{};
  std::vector<std::string> writeQueue_{};
  std::mutex writeMutex_{};
  boost::asio::steady_timer pingTimer_;
  char pingState_ = 0;

public:
  WebSocketSession(std::shared_ptr<boost::asio::io_context> ioc, WebSocketEndpoint& endpoint, socket socket,
      GatewayServices services, std::string connectionId);
  ~WebSocketSession() override;

  [[nodiscard]] std::shared_ptr<Strand_Asio> getStrand_() const {
    return std::static_pointer_cast<Strand_Asio>(strand_);
  }

  [[nodiscard]] auto getAsioStrand() const {
    return getStrand_()->strand_;
  }

protected: // Shutdownable
  [[nodiscard]] Promise<void> shutdown_() override;

public:
  void onTimer(error_code ec);
  void activity();
  void onPing(error_code ec);
  void setControlCallback();

  void doAccept();
  void onAccept(error_code ec);

  void doRead();
  void onRead(error_code ec, std::size_t bytes_transferred);

  void doWrite(const std::string& text);
  void tryWrite();
  void onWrite(error_code ec, std::size_t bytes_transferred);

  void onError(error_code ec, const char* op);
  static void logError(error_code ec, const char* op);
  static bool isExpectedError(error_code ec);

protected:
  void sendTextImpl_strand(const std::string& text) override;

private:
  [[nodiscard]] std::shared_ptr<WebSocketSession> shared_this() {
    return std::static_pointer_cast<WebSocketSession>(shared_from_this());
  }
  void closeSocket_strand();
};


#endif
