/**
 * TraceKey - Keyboard Geometry Implementation
 */

#include "geometry.h"

#include <algorithm>
#include <cctype>
#include <limits>

namespace tracekey {

// ============================================================================
// Key Layout
// ============================================================================

KeyLayout KeyLayout::qwerty() {
  // 720px base window, rows centered horizontally
  const double keyW = 52.0;
  const double keyH = 42.0;
  const double spacing = 6.0;
  const double keyPitch = keyW + spacing; // 58px per key
  const double windowW = 720.0;
  const double rowSpacing = keyH + spacing;

  KeyLayout layout(keyW, keyH);

  // Row 0: QWERTYUIOP + 1.5u backspace
  double row0Width = 10 * keyPitch + 1.5 * keyW;
  double row0StartX = (windowW - row0Width) / 2.0;
  const char *row0 = "qwertyuiop";
  for (int i = 0; i < 10; i++) {
    layout.setKeyCenter(row0[i], Point(row0StartX + i * keyPitch + keyW / 2.0,
                                       keyH / 2.0));
  }

  // Row 1: ASDFGHJKL + 1.5u enter
  double row1Width = 9 * keyPitch + 1.5 * keyW;
  double row1StartX = (windowW - row1Width) / 2.0;
  const char *row1 = "asdfghjkl";
  for (int i = 0; i < 9; i++) {
    layout.setKeyCenter(row1[i], Point(row1StartX + i * keyPitch + keyW / 2.0,
                                       rowSpacing + keyH / 2.0));
  }

  // Row 2: 1.5u shift + ZXCVBNM + , + .
  double row2Width = 1.5 * keyW + 7 * keyPitch + 2 * keyPitch;
  double row2StartX = (windowW - row2Width) / 2.0;
  double row2LettersX = row2StartX + 1.5 * keyW + spacing;
  const char *row2 = "zxcvbnm";
  for (int i = 0; i < 7; i++) {
    layout.setKeyCenter(row2[i],
                        Point(row2LettersX + i * keyPitch + keyW / 2.0,
                              2 * rowSpacing + keyH / 2.0));
  }

  return layout;
}

void KeyLayout::setKeyCenter(char c, const Point &center) {
  centers_[static_cast<char>(std::tolower(static_cast<unsigned char>(c)))] =
      center;
}

const Point *KeyLayout::keyCenter(char c) const {
  auto it = centers_.find(
      static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (it != centers_.end()) {
    return &it->second;
  }
  return nullptr;
}

// ============================================================================
// Path Utilities
// ============================================================================

std::optional<Path> keyboardPath(const std::string &word,
                                 const KeyLayout &layout) {
  Path path;
  path.reserve(word.size());
  for (char c : word) {
    if (!std::isalpha(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
    const Point *center = layout.keyCenter(c);
    if (!center) {
      return std::nullopt;
    }
    path.push_back(*center);
  }
  if (path.empty()) {
    return std::nullopt;
  }
  return path;
}

double pathLength(const Path &path) {
  double len = 0;
  for (size_t i = 1; i < path.size(); i++) {
    len += path[i - 1].distanceTo(path[i]);
  }
  return len;
}

Path resample(const Path &path, int n) {
  if (path.empty() || n <= 0) {
    return {};
  }
  if (path.size() == 1 || n == 1) {
    return Path(n, path.front());
  }

  // cumulative arc length at each original point
  std::vector<double> cumulative(path.size(), 0.0);
  for (size_t i = 1; i < path.size(); i++) {
    cumulative[i] = cumulative[i - 1] + path[i - 1].distanceTo(path[i]);
  }
  double total = cumulative.back();
  if (total < 1e-9) {
    return Path(n, path.front());
  }

  Path result;
  result.reserve(n);
  for (int k = 0; k < n; k++) {
    double target = std::min(k * total / (n - 1), total);

    // first segment whose end reaches the target arc length
    size_t i = static_cast<size_t>(
        std::lower_bound(cumulative.begin() + 1, cumulative.end(), target) -
        (cumulative.begin() + 1));
    if (i >= path.size() - 1) {
      i = path.size() - 2;
    }

    double segLen = cumulative[i + 1] - cumulative[i];
    double t = segLen > 0 ? (target - cumulative[i]) / segLen : 0.0;
    t = std::max(0.0, std::min(1.0, t));

    result.emplace_back(path[i].x + t * (path[i + 1].x - path[i].x),
                        path[i].y + t * (path[i + 1].y - path[i].y));
  }
  return result;
}

double meanPointDistance(const Path &a, const Path &b) {
  if (a.size() != b.size() || a.empty()) {
    return std::numeric_limits<double>::max();
  }

  double sum = 0;
  for (size_t i = 0; i < a.size(); i++) {
    sum += a[i].distanceTo(b[i]);
  }
  return sum / a.size();
}

} // namespace tracekey
