// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include "memory-word-catalog.h"
#include "utilities/logging.h"
#include <fstream>
#include <sstream>
#include <stdexcept>


void MemoryWordCatalog::addWord(WordId wordId, std::vector<KeywordId> keywordIds) {
  if (!wordId) {
    throw std::invalid_argument("word id must not be zero");
  }
  words_[wordId] = std::move(keywordIds);
}


void MemoryWordCatalog::load(std::istream& input) {
  std::string line{};
  int lineNumber = 0;
  while (std::getline(input, line)) {
    ++lineNumber;
    auto start = line.find_first_not_of(" \t\r");
    if (start == std::string::npos || line[start] == '#') {
      continue;
    }

    std::istringstream fields{line.substr(start)};
    std::string word{};
    std::string keywords{};
    fields >> word >> keywords;
    auto wordId = WordId::parse(word);
    if (!wordId) {
      throw std::invalid_argument(makeString("line %d: bad word id '%s'", lineNumber, word.c_str()));
    }

    std::vector<KeywordId> keywordIds{};
    std::istringstream list{keywords};
    std::string keyword{};
    while (std::getline(list, keyword, ',')) {
      auto keywordId = KeywordId::parse(keyword);
      if (!keywordId) {
        throw std::invalid_argument(makeString("line %d: bad keyword id '%s'", lineNumber, keyword.c_str()));
      }
      keywordIds.push_back(*keywordId);
    }
    addWord(*wordId, std::move(keywordIds));
  }
}


void MemoryWordCatalog::loadFile(const std::string& path) {
  std::ifstream input{path};
  if (!input) {
    throw std::invalid_argument("can not open word file " + path);
  }
  load(input);
  LOG_I("MemoryWordCatalog: %zu words from %s", words_.size(), path.c_str());
}


std::vector<WordId> MemoryWordCatalog::wordsWithKeywords(std::size_t minimumCount) const {
  std::vector<WordId> result{};
  for (const auto& [wordId, keywordIds] : words_) {
    if (keywordIds.size() >= minimumCount) {
      result.push_back(wordId);
    }
  }
  return result;
}


std::vector<KeywordId> MemoryWordCatalog::keywordsOf(WordId wordId) const {
  auto i = words_.find(wordId);
  if (i == words_.end()) {
    return {};
  }
  return i->second;
}
