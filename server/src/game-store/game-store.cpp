// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include "game-store.h"


const char* str(GameStoreErrorCode code) {
  switch (code) {
    case GameStoreErrorCode::NotFound: return "not_found";
    case GameStoreErrorCode::UniquenessViolation: return "uniqueness_violation";
    case GameStoreErrorCode::InvalidArgument: return "invalid_argument";
    case GameStoreErrorCode::InvalidState: return "invalid_state";
    default: return "?";
  }
}
