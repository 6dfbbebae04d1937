// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#ifndef CLUECAST__GAME_STORE__WORD_CATALOG_H
#define CLUECAST__GAME_STORE__WORD_CATALOG_H

#include "utilities/record-id.h"
#include <cstddef>
#include <vector>


// Read-only source of words and their keyword clues.
class WordCatalog {
public:
  virtual ~WordCatalog() = default;

  [[nodiscard]] virtual std::vector<WordId> wordsWithKeywords(std::size_t minimumCount) const = 0;
  [[nodiscard]] virtual std::vector<KeywordId> keywordsOf(WordId wordId) const = 0;
};


#endif
