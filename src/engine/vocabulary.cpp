/**
 * TraceKey - Vocabulary Source Implementation
 */

#include "vocabulary.h"
#include "language_model.h"
#include "log.h"

#include <cctype>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace tracekey {

namespace {

bool isAlphaWord(const std::string &word) {
  if (word.empty())
    return false;
  for (char c : word) {
    if (!std::isalpha(static_cast<unsigned char>(c)))
      return false;
  }
  return true;
}

} // namespace

bool readVocabularyFile(const std::string &path,
                        std::vector<VocabularyEntry> &entries, double total) {
  std::ifstream file(path);
  if (!file.is_open()) {
    TKLOG(Error) << "Vocabulary not found: " << path;
    return false;
  }

  std::vector<std::pair<std::string, double>> counts;
  double sum = 0;
  std::string line;
  int lineNo = 0;

  while (std::getline(file, line)) {
    ++lineNo;
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
      line.pop_back();
    }
    if (line.empty())
      continue;

    size_t tab = line.find('\t');
    if (tab == std::string::npos) {
      TKLOG(Warn) << path << ":" << lineNo << ": missing tab separator";
      continue;
    }

    std::string word = line.substr(0, tab);
    if (!isAlphaWord(word))
      continue;

    double count = 0;
    try {
      count = std::stod(line.substr(tab + 1));
    } catch (const std::exception &e) {
      TKLOG(Warn) << path << ":" << lineNo << ": bad count for '" << word
                  << "' (" << e.what() << ")";
      continue;
    }
    if (count < 0)
      continue;

    counts.emplace_back(normalizeWord(word), count);
    sum += count;
  }

  if (total <= 0)
    total = sum;

  entries.reserve(entries.size() + counts.size());
  for (auto &[word, count] : counts) {
    entries.emplace_back(std::move(word), total > 0 ? count / total : 0.0);
  }

  TKLOG(Info) << "Read " << counts.size() << " words from " << path;
  return !counts.empty();
}

bool readCorpusTotal(const std::string &path, double &total) {
  std::ifstream file(path);
  if (!file.is_open()) {
    TKLOG(Error) << "Corpus total not found: " << path;
    return false;
  }
  if (!(file >> total) || total <= 0) {
    TKLOG(Error) << "Bad corpus total in " << path;
    return false;
  }
  return true;
}

} // namespace tracekey
