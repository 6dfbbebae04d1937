// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#ifndef CLUECAST__LIFECYCLE__ROUND_GENERATOR_H
#define CLUECAST__LIFECYCLE__ROUND_GENERATOR_H

#include "game-store/game-records.h"
#include "game-store/word-catalog.h"
#include <random>
#include <vector>


/*
 * Draws the rounds of a game from the word catalog.
 *
 * Target words have at least 3 keywords and are never repeated within a
 * game. Each round shows up to 5 of the target's keywords, in random
 * order, and a grid of the target and gridSize - 1 other words.
 */
class RoundGenerator {
  const WordCatalog& catalog_;
  std::mt19937 rng_;

public:
  static constexpr std::size_t MinimumTargetKeywords = 3;
  static constexpr std::size_t MaximumRoundKeywords = 5;

  explicit RoundGenerator(const WordCatalog& catalog, std::mt19937::result_type seed = std::random_device{}());

  // throws GameStoreError{InvalidArgument} if the catalog is too small
  std::vector<RoundSpec> generate(const GameSettings& settings);
};


#endif
