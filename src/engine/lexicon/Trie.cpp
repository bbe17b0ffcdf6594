#include "Trie.h"
#include <algorithm>
#include <numeric>

namespace tracekey::lexicon {

Trie::Trie() {
  // Initialize root node
  nodes_.emplace_back();
}

void Trie::clear() {
  nodes_.clear();
  nodes_.emplace_back();
  words_.clear();
  values_.clear();
}

void Trie::set(const std::string &word, const WordEntry &value) {
  if (word.empty())
    return; // The root never terminates a word

  int32_t curr = 0; // Root index
  for (char c : word) {
    auto it = nodes_[curr].children.find(c);
    if (it == nodes_[curr].children.end()) {
      int32_t child = static_cast<int32_t>(nodes_.size());
      nodes_[curr].children.emplace(c, child);
      nodes_.emplace_back();
      curr = child;
    } else {
      curr = it->second;
    }
  }

  TrieNode &node = nodes_[curr];
  if (node.isTerminal()) {
    values_[node.terminal] = value;
    return;
  }
  node.terminal = static_cast<int32_t>(words_.size());
  words_.push_back(word);
  values_.push_back(value);
}

int32_t Trie::find(const std::string &word) const {
  int32_t curr = 0;
  for (char c : word) {
    auto it = nodes_[curr].children.find(c);
    if (it == nodes_[curr].children.end()) {
      return -1;
    }
    curr = it->second;
  }
  return nodes_[curr].terminal;
}

const WordEntry *Trie::get(const std::string &word) const {
  int32_t idx = find(word);
  return idx < 0 ? nullptr : &values_[idx];
}

WordEntry *Trie::get(const std::string &word) {
  int32_t idx = find(word);
  return idx < 0 ? nullptr : &values_[idx];
}

// ============================================================================
// Fuzzy Search
// ============================================================================

// Each trie edge extends the Levenshtein row of its parent by one letter. A
// subtree is abandoned once every cell of the row exceeds maxCost, since no
// extension can bring the distance back down.
void Trie::searchRecursive(int32_t node, char letter, const std::string &query,
                           const std::vector<int> &previousRow, int maxCost,
                           std::vector<Hit> &hits) const {
  size_t columns = query.size() + 1;
  std::vector<int> currentRow(columns);
  currentRow[0] = previousRow[0] + 1;

  for (size_t col = 1; col < columns; ++col) {
    int insertCost = currentRow[col - 1] + 1;
    int deleteCost = previousRow[col] + 1;
    int replaceCost =
        previousRow[col - 1] + (query[col - 1] == letter ? 0 : 1);
    currentRow[col] = std::min({insertCost, deleteCost, replaceCost});
  }

  if (currentRow.back() <= maxCost) {
    hits.emplace_back(node, currentRow.back());
  }

  if (*std::min_element(currentRow.begin(), currentRow.end()) <= maxCost) {
    for (const auto &[c, child] : nodes_[node].children) {
      searchRecursive(child, c, query, currentRow, maxCost, hits);
    }
  }
}

std::vector<Trie::Hit> Trie::fuzzyWalk(const std::string &query,
                                       int maxCost) const {
  std::vector<Hit> hits;
  if (maxCost < 0)
    return hits;

  std::vector<int> firstRow(query.size() + 1);
  std::iota(firstRow.begin(), firstRow.end(), 0);

  for (const auto &[c, child] : nodes_[0].children) {
    searchRecursive(child, c, query, firstRow, maxCost, hits);
  }
  return hits;
}

std::vector<Match> Trie::searchCorrection(const std::string &query,
                                          int maxCost) const {
  std::vector<std::pair<int32_t, int>> found;
  for (const auto &[node, cost] : fuzzyWalk(query, maxCost)) {
    if (nodes_[node].isTerminal()) {
      found.emplace_back(nodes_[node].terminal, cost);
    }
  }
  std::sort(found.begin(), found.end());

  std::vector<Match> results;
  results.reserve(found.size());
  for (const auto &[idx, cost] : found) {
    results.emplace_back(words_[idx], cost);
  }
  return results;
}

std::vector<Match> Trie::searchPrediction(const std::string &query,
                                          int maxCost) const {
  // terminal index -> cheapest prefix cost
  std::map<int32_t, int> best;

  std::vector<int32_t> stack;
  for (const auto &[root, cost] : fuzzyWalk(query, maxCost)) {
    stack.push_back(root);
    while (!stack.empty()) {
      int32_t n = stack.back();
      stack.pop_back();

      const TrieNode &node = nodes_[n];
      if (node.isTerminal()) {
        auto it = best.find(node.terminal);
        if (it == best.end()) {
          best.emplace(node.terminal, cost);
        } else if (it->second > cost) {
          it->second = cost;
        }
      }
      for (const auto &[c, child] : node.children) {
        stack.push_back(child);
      }
    }
  }

  std::vector<Match> results;
  results.reserve(best.size());
  for (const auto &[idx, cost] : best) {
    results.emplace_back(words_[idx], cost);
  }
  return results;
}

// ============================================================================
// Edit Distance
// ============================================================================

int editDistance(const std::string &a, const std::string &b) {
  size_t n = a.size();
  size_t m = b.size();

  std::vector<int> prev(m + 1);
  std::vector<int> curr(m + 1);
  std::iota(prev.begin(), prev.end(), 0);

  for (size_t i = 1; i <= n; ++i) {
    curr[0] = static_cast<int>(i);
    for (size_t j = 1; j <= m; ++j) {
      int cost = a[i - 1] == b[j - 1] ? 0 : 1;
      curr[j] = std::min({curr[j - 1] + 1, prev[j] + 1, prev[j - 1] + cost});
    }
    std::swap(prev, curr);
  }

  return prev[m];
}

} // namespace tracekey::lexicon
