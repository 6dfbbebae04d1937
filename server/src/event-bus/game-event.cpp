// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include "game-event.h"


const char* const ActiveGamesTopic = "active_games";


const char* str(GameEventType type) {
  switch (type) {
    case GameEventType::KeywordRevealed: return "keyword_revealed";
    case GameEventType::RoundTimeout: return "round_timeout";
    case GameEventType::GameStarted: return "game_started";
    case GameEventType::RoundStarted: return "round_started";
    case GameEventType::RoundFinished: return "round_finished";
    case GameEventType::PickSubmitted: return "pick_submitted";
    case GameEventType::GameOver: return "game_over";
    case GameEventType::PlayerJoined: return "player_joined";
    case GameEventType::PlayerLeft: return "player_left";
    case GameEventType::HostDisconnected: return "host_disconnected";
    case GameEventType::GameStoppedByHost: return "game_stopped_by_host";
    case GameEventType::GameCancelled: return "game_cancelled";
    case GameEventType::LobbyTimeout: return "lobby_timeout";
    case GameEventType::PresenceDiff: return "presence_diff";
    case GameEventType::GameCountChanged: return "game_count_changed";
    default: return "?";
  }
}


GameEvent GameEvent::keywordRevealed(GameId gameId, RoundId roundId, int revealCount, int elapsedSeconds) {
  GameEvent result{};
  result.type = GameEventType::KeywordRevealed;
  result.gameId = gameId;
  result.roundId = roundId;
  result.revealCount = revealCount;
  result.elapsedSeconds = elapsedSeconds;
  return result;
}


GameEvent GameEvent::roundTimeout(GameId gameId, RoundId roundId) {
  GameEvent result{};
  result.type = GameEventType::RoundTimeout;
  result.gameId = gameId;
  result.roundId = roundId;
  return result;
}


GameEvent GameEvent::gameCountChanged(int activeGames) {
  GameEvent result{};
  result.type = GameEventType::GameCountChanged;
  result.activeGames = activeGames;
  return result;
}


std::string gameTopic(GameId gameId) {
  return "game:" + gameId.str();
}


std::string hostTopic(GameId gameId) {
  return gameTopic(gameId) + ":host";
}


std::string playersTopic(GameId gameId) {
  return gameTopic(gameId) + ":players";
}


std::optional<GameId> parseGameTopic(const std::string& topic) {
  static const std::string prefix{"game:"};
  if (topic.compare(0, prefix.size(), prefix) != 0) {
    return std::nullopt;
  }
  auto end = topic.find(':', prefix.size());
  return GameId::parse(topic.substr(prefix.size(), end == std::string::npos ? std::string::npos : end - prefix.size()));
}
