// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include "server-config.h"
#include <cerrno>
#include <cstdlib>
#include <stdexcept>


namespace {
  long parseNumber(const std::string& name, const std::string& value, long min, long max) {
    if (value.empty()) {
      throw std::invalid_argument(name + ": missing value");
    }
    char* end = nullptr;
    errno = 0;
    long result = std::strtol(value.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE) {
      throw std::invalid_argument(name + ": not a number: " + value);
    }
    if (result < min || result > max) {
      throw std::invalid_argument(makeString("%s: %ld is out of range %ld..%ld", name.c_str(), result, min, max));
    }
    return result;
  }
}


ServerConfig ServerConfig::parse(int argc, const char* const* argv) {
  ServerConfig result{};
  for (int i = 1; i < argc; ++i) {
    std::string arg{argv[i]};
    auto equals = arg.find('=');
    if (arg.compare(0, 2, "--") != 0 || equals == std::string::npos) {
      continue;
    }
    auto name = arg.substr(0, equals);
    auto value = arg.substr(equals + 1);
    if (name == "--port") {
      result.port = static_cast<int>(parseNumber(name, value, 1, 65535));
    } else if (name == "--threads") {
      result.threads = static_cast<int>(parseNumber(name, value, 1, 256));
    } else if (name == "--tick-ms") {
      result.tickInterval = std::chrono::milliseconds{parseNumber(name, value, 1, 60000)};
    } else if (name == "--host-debounce-ms") {
      result.hostDisconnectDebounce = std::chrono::milliseconds{parseNumber(name, value, 0, 600000)};
    } else if (name == "--round-advance-delay-ms") {
      result.roundAdvanceDelay = std::chrono::milliseconds{parseNumber(name, value, 0, 600000)};
    } else if (name == "--lobby-timeout-s") {
      result.lobbyTimeout = std::chrono::seconds{parseNumber(name, value, 1, 86400)};
    } else if (name == "--lobby-sweep-s") {
      result.lobbySweepInterval = std::chrono::seconds{parseNumber(name, value, 1, 86400)};
    } else if (name == "--words") {
      if (value.empty()) {
        throw std::invalid_argument("--words: missing value");
      }
      result.wordsPath = value;
    } else if (name == "--log-level") {
      result.logLevel = parseLogLevel(value.c_str());
    }
  }
  return result;
}
