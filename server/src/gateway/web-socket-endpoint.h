// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#ifndef CLUECAST__GATEWAY__WEB_SOCKET_ENDPOINT_H
#define CLUECAST__GATEWAY__WEB_SOCKET_ENDPOINT_H

#include "./gateway-session.h"
#include "async/shutdownable.h"
#include <boost/asio/ip/tcp.hpp>
#include <memory>
#include <mutex>
#include <vector>

class WebSocketSession;


/*
 * Accepts WebSocket connections and gives each one its own
 * WebSocketSession, identified by a connection id unique to the process.
 */
class WebSocketEndpoint :
    public Shutdownable,
    public std::enable_shared_from_this<WebSocketEndpoint> {
  friend class WebSocketSession;

  using acceptor = boost::asio::ip::tcp::acceptor;
  using socket = boost::asio::ip::tcp::socket;

  std::shared_ptr<boost::asio::io_context> ioc_;
  GatewayServices services_;
  acceptor acceptor_;
  socket socket_;

  std::vector<std::shared_ptr<WebSocketSession>> sessions_{};
  int connectionCounter_{};
  std::mutex mutex_{};

public:
  WebSocketEndpoint(std::shared_ptr<boost::asio::io_context> ioc, GatewayServices services);
  ~WebSocketEndpoint() override;

  // returns the bound port, or 0 if listening failed
  unsigned short startup_safe(unsigned short port = 0);

protected: // Shutdownable
  [[nodiscard]] Promise<void> shutdown_() override;

private:
  void doAccept_safe();
  void onAccept_safe(boost::system::error_code ec);

  static void logError(boost::system::error_code ec, const char* op);

  void removeConnection_safe(WebSocketSession* session);
};


#endif
