// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#ifndef CLUECAST__GATEWAY__GATEWAY_PROTOCOL_H
#define CLUECAST__GATEWAY__GATEWAY_PROTOCOL_H

#include "event-bus/game-event.h"
#include "game-store/game-records.h"
#include "session/session-process.h"
#include <exception>
#include <stdexcept>
#include <string>


/*
 * Text frames, one command per frame, tokens separated by spaces:
 *
 *   subscribe <topic>                     unsubscribe <topic>
 *   track <topic> <key>                   untrack <topic>
 *   create <host> <rounds> <interval> <grid>
 *   join <game> <user> <nickname> <avatar>
 *   leave <game> <player>
 *   start <game>      stop <game>         cancel <game>
 *   pick <game> <player> <word> <seconds>
 *   state <game>
 *
 * Replies are "ok ..." or "error <code> <message>". Bus events are pushed
 * as "event <topic> <name> key=value ...".
 */
enum class GatewayCommandType {
  Subscribe,
  Unsubscribe,
  Track,
  Untrack,
  Create,
  Join,
  Leave,
  Start,
  Pick,
  Stop,
  Cancel,
  State
};

const char* str(GatewayCommandType type);


struct GatewayCommand {
  GatewayCommandType type{};
  std::string topic{};
  std::string key{};
  GameId gameId{};
  UserId userId{};
  PlayerId playerId{};
  WordId wordId{};
  GameSettings settings{};
  std::string nickname{};
  std::string avatar{};
  int timeSeconds{};
};


class ProtocolError : public std::runtime_error {
public:
  explicit ProtocolError(const std::string& message) : std::runtime_error{message} {}
};


// throws ProtocolError
GatewayCommand parseGatewayCommand(const std::string& text);

std::string formatGatewayEvent(const std::string& topic, const GameEvent& event);
std::string formatSessionSnapshot(const SessionSnapshot& snapshot);

// "error <code> <message>", with the code taken from the exception type
std::string formatRejection(const std::exception_ptr& reason);


#endif
