// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#ifndef CLUECAST__EVENT_BUS__GAME_EVENT_H
#define CLUECAST__EVENT_BUS__GAME_EVENT_H

#include "utilities/record-id.h"
#include <optional>
#include <string>
#include <vector>


enum class GameEventType {
  KeywordRevealed,
  RoundTimeout,
  GameStarted,
  RoundStarted,
  RoundFinished,
  PickSubmitted,
  GameOver,
  PlayerJoined,
  PlayerLeft,
  HostDisconnected,
  GameStoppedByHost,
  GameCancelled,
  LobbyTimeout,
  PresenceDiff,
  GameCountChanged
};

const char* str(GameEventType type);


struct PresenceEntry {
  std::string key{};
  std::string connectionId{};

  bool operator==(const PresenceEntry& other) const {
    return key == other.key && connectionId == other.connectionId;
  }
};


/*
 * Message carried by the event bus. Fields that do not apply to the
 * event type are left at their defaults.
 */
struct GameEvent {
  GameEventType type{};
  GameId gameId{};
  RoundId roundId{};
  PlayerId playerId{};
  int revealCount{};
  int elapsedSeconds{};
  int position{};
  int points{};
  bool isCorrect{};
  int activeGames{};
  std::vector<PresenceEntry> joins{};
  std::vector<PresenceEntry> leaves{};

  static GameEvent keywordRevealed(GameId gameId, RoundId roundId, int revealCount, int elapsedSeconds);
  static GameEvent roundTimeout(GameId gameId, RoundId roundId);
  static GameEvent gameCountChanged(int activeGames);
};


extern const char* const ActiveGamesTopic;

// "game:<id>"
std::string gameTopic(GameId gameId);
// "game:<id>:host"
std::string hostTopic(GameId gameId);
// "game:<id>:players"
std::string playersTopic(GameId gameId);

// game id of any "game:<id>..." topic
std::optional<GameId> parseGameTopic(const std::string& topic);


#endif
