#pragma once

/**
 * TraceKey - Vocabulary Source
 *
 * Reads (word, count) pairs from a tab separated unigram file, one
 * "word<TAB>count" per line. Static frequency = count / total, where total
 * is either supplied by the caller or the sum of all counts read.
 */

#include <string>
#include <utility>
#include <vector>

namespace tracekey {

struct VocabularyEntry {
  std::string word;
  double frequency = 0;

  VocabularyEntry() = default;
  VocabularyEntry(std::string w, double f) : word(std::move(w)), frequency(f) {}
};

// Parse a unigram count file. Words with non-alphabetic characters are
// skipped and the rest lowercased. total <= 0 means "sum of counts".
// Returns false if the file cannot be opened or yields no words.
bool readVocabularyFile(const std::string &path,
                        std::vector<VocabularyEntry> &entries,
                        double total = 0);

// Read a corpus total (a single number) from path
bool readCorpusTotal(const std::string &path, double &total);

} // namespace tracekey
