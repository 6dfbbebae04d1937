// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include "./round-generator.h"
#include "game-store/game-store.h"
#include "utilities/logging.h"
#include <algorithm>
#include <iterator>


RoundGenerator::RoundGenerator(const WordCatalog& catalog, std::mt19937::result_type seed) :
    catalog_{catalog},
    rng_{seed} {
}


std::vector<RoundSpec> RoundGenerator::generate(const GameSettings& settings) {
  settings.validate();

  const auto roundsCount = static_cast<std::size_t>(settings.roundsCount);
  const auto gridSize = static_cast<std::size_t>(settings.gridSize);

  auto targets = catalog_.wordsWithKeywords(MinimumTargetKeywords);
  if (targets.size() < roundsCount) {
    throw GameStoreError{GameStoreErrorCode::InvalidArgument,
        makeString("not enough words with %zu keywords for %zu rounds", MinimumTargetKeywords, roundsCount)};
  }

  const auto pool = catalog_.wordsWithKeywords(1);
  if (pool.size() < gridSize) {
    throw GameStoreError{GameStoreErrorCode::InvalidArgument,
        makeString("not enough words for a grid of %zu", gridSize)};
  }

  std::shuffle(targets.begin(), targets.end(), rng_);
  targets.resize(roundsCount);

  std::vector<RoundSpec> result{};
  result.reserve(roundsCount);
  int position = 0;
  for (auto target : targets) {
    RoundSpec spec{};
    spec.targetWordId = target;
    spec.position = ++position;

    spec.keywordIds = catalog_.keywordsOf(target);
    std::shuffle(spec.keywordIds.begin(), spec.keywordIds.end(), rng_);
    if (spec.keywordIds.size() > MaximumRoundKeywords) {
      spec.keywordIds.resize(MaximumRoundKeywords);
    }

    std::vector<WordId> distractors{};
    std::copy_if(pool.begin(), pool.end(), std::back_inserter(distractors), [target](WordId wordId) {
      return wordId != target;
    });
    std::shuffle(distractors.begin(), distractors.end(), rng_);
    distractors.resize(gridSize - 1);

    spec.possibleWordIds = std::move(distractors);
    spec.possibleWordIds.push_back(target);
    std::shuffle(spec.possibleWordIds.begin(), spec.possibleWordIds.end(), rng_);

    result.push_back(std::move(spec));
  }

  LOG_D("RoundGenerator: %zu rounds from %zu words", result.size(), pool.size());
  return result;
}
