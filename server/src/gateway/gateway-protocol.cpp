// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include "./gateway-protocol.h"
#include "game-store/game-store.h"
#include "utilities/logging.h"
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <vector>


namespace {
  struct CommandSyntax {
    const char* name;
    GatewayCommandType type;
    std::size_t arguments;
  };

  const CommandSyntax commandSyntax[] = {
      {"subscribe", GatewayCommandType::Subscribe, 1},
      {"unsubscribe", GatewayCommandType::Unsubscribe, 1},
      {"track", GatewayCommandType::Track, 2},
      {"untrack", GatewayCommandType::Untrack, 1},
      {"create", GatewayCommandType::Create, 4},
      {"join", GatewayCommandType::Join, 4},
      {"leave", GatewayCommandType::Leave, 2},
      {"start", GatewayCommandType::Start, 1},
      {"pick", GatewayCommandType::Pick, 4},
      {"stop", GatewayCommandType::Stop, 1},
      {"cancel", GatewayCommandType::Cancel, 1},
      {"state", GatewayCommandType::State, 1}
  };

  std::vector<std::string> splitTokens(const std::string& text) {
    std::vector<std::string> result{};
    std::istringstream is{text};
    std::string token{};
    while (is >> token) {
      result.push_back(token);
    }
    return result;
  }

  template <typename Id>
  Id parseId(const std::string& value, const char* name) {
    auto result = Id::parse(value);
    if (!result) {
      throw ProtocolError{makeString("invalid %s '%s'", name, value.c_str())};
    }
    return *result;
  }

  int parseInt(const std::string& value, const char* name) {
    char* end = nullptr;
    errno = 0;
    auto result = std::strtol(value.c_str(), &end, 10);
    if (value.empty() || *end != '\0' || errno != 0 || result < 0 || result > 1000000) {
      throw ProtocolError{makeString("invalid %s '%s'", name, value.c_str())};
    }
    return static_cast<int>(result);
  }

  std::string parseTopic(const std::string& value) {
    if (value != ActiveGamesTopic && !parseGameTopic(value)) {
      throw ProtocolError{makeString("unknown topic '%s'", value.c_str())};
    }
    return value;
  }

  void appendEntries(std::ostringstream& os, const char* name, const std::vector<PresenceEntry>& entries) {
    os << ' ' << name << '=';
    for (std::size_t i = 0; i < entries.size(); ++i) {
      if (i != 0) {
        os << ',';
      }
      os << entries[i].key << '@' << entries[i].connectionId;
    }
  }
}


const char* str(GatewayCommandType type) {
  for (const auto& syntax : commandSyntax) {
    if (syntax.type == type) {
      return syntax.name;
    }
  }
  return "?";
}


GatewayCommand parseGatewayCommand(const std::string& text) {
  auto tokens = splitTokens(text);
  if (tokens.empty()) {
    throw ProtocolError{"empty command"};
  }

  const CommandSyntax* syntax = nullptr;
  for (const auto& s : commandSyntax) {
    if (tokens[0] == s.name) {
      syntax = &s;
      break;
    }
  }
  if (!syntax) {
    throw ProtocolError{makeString("unknown command '%s'", tokens[0].c_str())};
  }
  if (tokens.size() != syntax->arguments + 1) {
    throw ProtocolError{makeString("%s takes %zu arguments", syntax->name, syntax->arguments)};
  }

  GatewayCommand result{};
  result.type = syntax->type;
  switch (syntax->type) {
    case GatewayCommandType::Subscribe:
    case GatewayCommandType::Unsubscribe:
    case GatewayCommandType::Untrack:
      result.topic = parseTopic(tokens[1]);
      break;
    case GatewayCommandType::Track:
      result.topic = parseTopic(tokens[1]);
      result.key = tokens[2];
      break;
    case GatewayCommandType::Create:
      result.userId = parseId<UserId>(tokens[1], "user");
      result.settings.roundsCount = parseInt(tokens[2], "rounds");
      result.settings.cluesInterval = parseInt(tokens[3], "interval");
      result.settings.gridSize = parseInt(tokens[4], "grid");
      break;
    case GatewayCommandType::Join:
      result.gameId = parseId<GameId>(tokens[1], "game");
      result.userId = parseId<UserId>(tokens[2], "user");
      result.nickname = tokens[3];
      result.avatar = tokens[4];
      break;
    case GatewayCommandType::Leave:
      result.gameId = parseId<GameId>(tokens[1], "game");
      result.playerId = parseId<PlayerId>(tokens[2], "player");
      break;
    case GatewayCommandType::Pick:
      result.gameId = parseId<GameId>(tokens[1], "game");
      result.playerId = parseId<PlayerId>(tokens[2], "player");
      result.wordId = parseId<WordId>(tokens[3], "word");
      result.timeSeconds = parseInt(tokens[4], "seconds");
      break;
    case GatewayCommandType::Start:
    case GatewayCommandType::Stop:
    case GatewayCommandType::Cancel:
    case GatewayCommandType::State:
      result.gameId = parseId<GameId>(tokens[1], "game");
      break;
  }
  return result;
}


std::string formatGatewayEvent(const std::string& topic, const GameEvent& event) {
  std::ostringstream os{};
  os << "event " << topic << ' ' << str(event.type);
  if (event.type == GameEventType::GameCountChanged) {
    os << " active=" << event.activeGames;
    return os.str();
  }

  os << " game=" << event.gameId;
  switch (event.type) {
    case GameEventType::KeywordRevealed:
      os << " round=" << event.roundId << " revealed=" << event.revealCount << " elapsed=" << event.elapsedSeconds;
      break;
    case GameEventType::RoundTimeout:
      os << " round=" << event.roundId;
      break;
    case GameEventType::RoundStarted:
    case GameEventType::RoundFinished:
      os << " round=" << event.roundId << " position=" << event.position;
      break;
    case GameEventType::PickSubmitted:
      os << " round=" << event.roundId << " player=" << event.playerId
          << " correct=" << (event.isCorrect ? 1 : 0) << " points=" << event.points;
      break;
    case GameEventType::PlayerJoined:
    case GameEventType::PlayerLeft:
      os << " player=" << event.playerId;
      break;
    case GameEventType::PresenceDiff:
      appendEntries(os, "joins", event.joins);
      appendEntries(os, "leaves", event.leaves);
      break;
    default:
      break;
  }
  return os.str();
}


std::string formatSessionSnapshot(const SessionSnapshot& snapshot) {
  std::ostringstream os{};
  os << "ok state round=" << snapshot.roundId
      << " elapsed=" << snapshot.elapsedSeconds
      << " revealed=" << snapshot.keywordsRevealed
      << " total=" << snapshot.keywordsTotal
      << " paused=" << (snapshot.paused ? 1 : 0);
  return os.str();
}


std::string formatRejection(const std::exception_ptr& reason) {
  if (!reason) {
    return "error internal rejected";
  }
  try {
    std::rethrow_exception(reason);
  } catch (const GameStoreError& e) {
    return makeString("error %s %s", str(e.code()), e.what());
  } catch (const SessionNotRunning& e) {
    return makeString("error not_running %s", e.what());
  } catch (const ProtocolError& e) {
    return makeString("error bad_request %s", e.what());
  } catch (const std::exception& e) {
    LOG_E("Gateway: unexpected rejection: %s", e.what());
    return makeString("error internal %s", e.what());
  }
}
