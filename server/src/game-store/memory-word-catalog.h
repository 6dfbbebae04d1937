// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#ifndef CLUECAST__GAME_STORE__MEMORY_WORD_CATALOG_H
#define CLUECAST__GAME_STORE__MEMORY_WORD_CATALOG_H

#include "./word-catalog.h"
#include <istream>
#include <map>
#include <string>


/*
 * Word catalog held in memory.
 *
 * The text format has one word per line, the word id followed by its
 * comma separated keyword ids:
 *
 *   # comment
 *   17 101,102,103
 */
class MemoryWordCatalog : public WordCatalog {
  std::map<WordId, std::vector<KeywordId>> words_{};

public:
  void addWord(WordId wordId, std::vector<KeywordId> keywordIds);

  // throws std::invalid_argument with the line number of a malformed line
  void load(std::istream& input);
  void loadFile(const std::string& path);

  [[nodiscard]] std::size_t size() const noexcept { return words_.size(); }

  [[nodiscard]] std::vector<WordId> wordsWithKeywords(std::size_t minimumCount) const override;
  [[nodiscard]] std::vector<KeywordId> keywordsOf(WordId wordId) const override;
};


#endif
