#pragma once

#include "WordEntry.h"

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace tracekey::lexicon {

struct TrieNode {
    // Children are indices into the trie's node arena
    std::map<char, int32_t> children;
    // Index into words_/values_ when this node terminates a word, else -1
    int32_t terminal = -1;

    bool isTerminal() const { return terminal >= 0; }
};

// A stored word together with its edit cost against a query
struct Match {
    std::string word;
    int cost = 0;

    Match() = default;
    Match(std::string w, int c) : word(std::move(w)), cost(c) {}
};

class Trie {
public:
    Trie();

    // Insert or overwrite. A word is recorded once in words() no matter how
    // often it is set.
    void set(const std::string& word, const WordEntry& value);

    // nullptr when word is not stored
    const WordEntry* get(const std::string& word) const;
    WordEntry* get(const std::string& word);

    bool contains(const std::string& word) const { return get(word) != nullptr; }

    // Words with Levenshtein distance <= maxCost to query
    std::vector<Match> searchCorrection(const std::string& query, int maxCost) const;

    // Completions of every prefix within maxCost of query. Each word carries
    // the cost of its cheapest matching prefix, not its own distance.
    std::vector<Match> searchPrediction(const std::string& query, int maxCost) const;

    // All words in insertion order
    const std::vector<std::string>& words() const { return words_; }
    const WordEntry& valueAt(size_t index) const { return values_[index]; }
    WordEntry& valueAt(size_t index) { return values_[index]; }

    size_t size() const { return words_.size(); }
    bool empty() const { return words_.empty(); }
    void clear();

    const std::vector<TrieNode>& nodes() const { return nodes_; }

private:
    // (node, last DP cell) pairs collected by the fuzzy walk
    using Hit = std::pair<int32_t, int>;

    int32_t find(const std::string& word) const;

    void searchRecursive(int32_t node, char letter, const std::string& query,
                         const std::vector<int>& previousRow, int maxCost,
                         std::vector<Hit>& hits) const;
    std::vector<Hit> fuzzyWalk(const std::string& query, int maxCost) const;

    std::vector<TrieNode> nodes_;
    std::vector<std::string> words_;
    std::vector<WordEntry> values_;
};

// Levenshtein distance with unit insert/delete/substitute costs
int editDistance(const std::string& a, const std::string& b);

} // namespace tracekey::lexicon
