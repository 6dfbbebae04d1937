// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include "async/strand.h"
#include "event-bus/event-bus.h"
#include "event-bus/presence.h"
#include "game-store/memory-game-store.h"
#include "game-store/memory-word-catalog.h"
#include "gateway/web-socket-endpoint.h"
#include "lifecycle/game-lifecycle.h"
#include "lifecycle/round-generator.h"
#include "session/session-registry.h"
#include "supervision/presence-monitor.h"
#include "utilities/logging.h"
#include "utilities/server-config.h"
#include <iostream>
#include <vector>

#define BOOST_TEST_MODULE cluecast server
#define BOOST_TEST_NO_MAIN
#include <boost/test/included/unit_test.hpp>


namespace {
  // shuts the services down one at a time, in the given order
  Promise<void> shutdownInOrder(std::vector<Shutdownable*> services) {
    for (auto service : services) {
      co_await service->shutdown().onReject([](const std::exception_ptr& reason) {
        LOG_W("cluecast: shutdown continues after failure: %s", ReasonString(reason).c_str());
      });
    }
  }
}


int main(int argc, char *argv[]) {
  ServerConfig config{};
  try {
    config = ServerConfig::parse(argc, argv);
  } catch (const std::invalid_argument& e) {
    std::cerr << "cluecast: " << e.what() << "\n";
    return 2;
  }

  if (!config.runsServer()) {
    return ::boost::unit_test::unit_test_main(&init_unit_test_suite, argc, argv);
  }

  setLogLevel(config.logLevel);

  MemoryWordCatalog catalog{};
  if (!config.wordsPath.empty()) {
    try {
      catalog.loadFile(config.wordsPath);
    } catch (const std::exception& e) {
      LOG_E("cluecast: cannot load words from %s: %s", config.wordsPath.c_str(), e.what());
      return 1;
    }
  }

  MemoryGameStore gameStore{};
  EventBus eventBus{};
  PresenceTracker presence{eventBus};
  SessionRegistry sessions{gameStore, eventBus, [](const char* label) -> std::shared_ptr<Strand_base> {
    return Strand::makeStrand(label);
  }, config.tickInterval};
  RoundGenerator roundGenerator{catalog};

  LifecycleTimings timings{};
  timings.roundAdvanceDelay = config.roundAdvanceDelay;
  timings.lobbyTimeout = config.lobbyTimeout;
  timings.lobbySweepInterval = config.lobbySweepInterval;

  auto lifecycle = std::make_shared<GameLifecycle>(Strand::makeStrand("GameLifecycle"),
      gameStore, roundGenerator, eventBus, sessions, timings);
  auto presenceMonitor = std::make_shared<PresenceMonitor>(Strand::makeStrand("PresenceMonitor"),
      gameStore, eventBus, presence, *lifecycle, config.hostDisconnectDebounce);
  lifecycle->setPresenceMonitor(presenceMonitor);
  lifecycle->startup();

  auto endpoint = std::make_shared<WebSocketEndpoint>(Strand::io_context(),
      GatewayServices{eventBus, presence, *lifecycle, sessions});

  std::vector<Shutdownable*> services{endpoint.get(), lifecycle.get(), presenceMonitor.get(), &sessions};
  auto stopServer = [services]() {
    shutdownInOrder(services).then(std::shared_ptr<Strand_base>{}, []() {
      Strand::stop();
    }).done();
  };

  int status = 0;
  if (endpoint->startup_safe(static_cast<unsigned short>(config.port)) == 0) {
    LOG_E("cluecast: cannot listen on port %d", config.port);
    status = 1;
    stopServer();
  }

  boost::asio::signal_set signals{*Strand::io_context()};
  signals.add(SIGHUP);
  signals.add(SIGINT);
  signals.add(SIGQUIT);
  signals.add(SIGTERM);
  signals.async_wait([stopServer](const boost::system::error_code& error, int signal_number) {
    if (error) {
      return;
    }
    LOG_I("cluecast: signal %d, shutting down", signal_number);
    stopServer();
  });

  Strand::runUntilStopped(config.threads);
  LOG_I("cluecast: done");

  return status;
}
