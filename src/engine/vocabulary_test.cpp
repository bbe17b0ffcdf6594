/**
 * Vocabulary Reader Test Utility
 */

#include "vocabulary.h"
#include "test_harness.h"

#include <cstdio>
#include <fstream>
#include <unistd.h>

using namespace tracekey;

namespace {

std::string writeTemp(const std::string &name, const std::string &contents) {
  std::string path =
      "/tmp/tracekey_vocab_" + std::to_string(getpid()) + "_" + name;
  std::ofstream out(path);
  out << contents;
  return path;
}

} // namespace

TEST(entryOwnsItsWord) {
  std::string word = "hello";
  VocabularyEntry entry(word, 0.25);
  word[0] = 'j';
  ASSERT_EQ(entry.word, "hello");
  ASSERT_EQ(entry.frequency, 0.25);
}

TEST(frequenciesFromCountSum) {
  std::string path = writeTemp("sum", "the\t60\n"
                                      "Cat\t30\n"
                                      "dog\t10\n");
  std::vector<VocabularyEntry> entries;
  ASSERT_TRUE(readVocabularyFile(path, entries));
  ASSERT_EQ(entries.size(), 3u);
  ASSERT_EQ(entries[1].word, "cat");
  ASSERT_NEAR(entries[0].frequency, 0.6, 1e-12);
  ASSERT_NEAR(entries[1].frequency, 0.3, 1e-12);
  ASSERT_NEAR(entries[2].frequency, 0.1, 1e-12);
  std::remove(path.c_str());
}

TEST(frequenciesFromCorpusTotal) {
  std::string path = writeTemp("total", "the\t50\nof\t25\n");
  std::string totalPath = writeTemp("total_n", "1000\n");

  double total = 0;
  ASSERT_TRUE(readCorpusTotal(totalPath, total));
  ASSERT_EQ(total, 1000.0);

  std::vector<VocabularyEntry> entries;
  ASSERT_TRUE(readVocabularyFile(path, entries, total));
  ASSERT_NEAR(entries[0].frequency, 0.05, 1e-12);
  ASSERT_NEAR(entries[1].frequency, 0.025, 1e-12);
  std::remove(path.c_str());
  std::remove(totalPath.c_str());
}

TEST(skipsMalformedLines) {
  std::string path = writeTemp("bad", "good\t3\r\n"
                                      "don't\t5\n"
                                      "nocount\n"
                                      "bad\tx\n"
                                      "negative\t-4\n"
                                      "\n"
                                      "fine\t1\n");
  std::vector<VocabularyEntry> entries;
  ASSERT_TRUE(readVocabularyFile(path, entries));
  ASSERT_EQ(entries.size(), 2u);
  ASSERT_EQ(entries[0].word, "good");
  ASSERT_EQ(entries[1].word, "fine");
  ASSERT_NEAR(entries[0].frequency, 0.75, 1e-12);
  std::remove(path.c_str());
}

TEST(missingOrEmptyFile) {
  std::vector<VocabularyEntry> entries;
  ASSERT_FALSE(readVocabularyFile("/nonexistent/tracekey/vocab.tsv", entries));

  std::string path = writeTemp("empty", "1984\t10\n");
  ASSERT_FALSE(readVocabularyFile(path, entries));
  ASSERT_TRUE(entries.empty());
  std::remove(path.c_str());

  double total = 0;
  std::string zero = writeTemp("zero", "0\n");
  ASSERT_FALSE(readCorpusTotal(zero, total));
  std::remove(zero.c_str());
}

int main() { return runAllTests("Vocabulary"); }
