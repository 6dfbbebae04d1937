// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#ifndef CLUECAST__UTILITIES__SERVER_CONFIG_H
#define CLUECAST__UTILITIES__SERVER_CONFIG_H

#include "./logging.h"
#include <chrono>
#include <string>


/*
 * Server settings, from --name=value command line options.
 * Options that are not recognized are left for Boost.Test.
 */
struct ServerConfig {
  int port{};
  int threads{1};
  std::chrono::milliseconds tickInterval{1000};
  std::chrono::milliseconds hostDisconnectDebounce{2000};
  std::chrono::milliseconds roundAdvanceDelay{3000};
  std::chrono::seconds lobbyTimeout{15 * 60};
  std::chrono::seconds lobbySweepInterval{5 * 60};
  std::string wordsPath{};
  LogLevel logLevel{LogLevel::Info};

  // throws std::invalid_argument on a malformed value
  static ServerConfig parse(int argc, const char* const* argv);

  [[nodiscard]] bool runsServer() const noexcept { return port != 0; }
};


#endif
