#pragma once

/**
 * TraceKey - Keyboard Geometry
 *
 * Key-center layout, per-word keyboard paths and arc-length resampling.
 * A word path connects the centers of its letters in order; gestures and
 * word paths are compared after both are resampled to the same point count.
 */

#include <cmath>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tracekey {

// ============================================================================
// Geometry Types
// ============================================================================
struct Point {
  double x = 0;
  double y = 0;

  Point() = default;
  Point(double x_, double y_) : x(x_), y(y_) {}

  double distanceSquaredTo(const Point &other) const {
    double dx = x - other.x;
    double dy = y - other.y;
    return dx * dx + dy * dy;
  }

  double distanceTo(const Point &other) const {
    return std::sqrt(distanceSquaredTo(other));
  }

  bool operator==(const Point &o) const { return x == o.x && y == o.y; }
  bool operator!=(const Point &o) const { return !(*this == o); }
};

using Path = std::vector<Point>;

// ============================================================================
// Key Layout
// ============================================================================

// Character -> key center mapping of the active layout. Only lowercase
// letters are addressable; the layout itself is computed by the caller.
class KeyLayout {
public:
  KeyLayout() = default;
  KeyLayout(double keyWidth, double keyHeight)
      : keyWidth_(keyWidth), keyHeight_(keyHeight) {}

  // Default QWERTY geometry (52x42 keys, 6px gaps, centered rows)
  static KeyLayout qwerty();

  void setKeyCenter(char c, const Point &center);

  // nullptr when the layout has no key for c
  const Point *keyCenter(char c) const;

  double keyWidth() const { return keyWidth_; }
  double keyHeight() const { return keyHeight_; }
  void setKeySize(double width, double height) {
    keyWidth_ = width;
    keyHeight_ = height;
  }

  size_t size() const { return centers_.size(); }
  bool empty() const { return centers_.empty(); }

  bool operator==(const KeyLayout &other) const {
    return keyWidth_ == other.keyWidth_ && keyHeight_ == other.keyHeight_ &&
           centers_ == other.centers_;
  }
  bool operator!=(const KeyLayout &other) const { return !(*this == other); }

private:
  double keyWidth_ = 0;
  double keyHeight_ = 0;
  std::unordered_map<char, Point> centers_;
};

// ============================================================================
// Path Utilities
// ============================================================================

// Key centers of each letter of word, in order. Empty optional when a
// character has no key in the layout (word is not gesture-eligible).
std::optional<Path> keyboardPath(const std::string &word,
                                 const KeyLayout &layout);

// Sum of consecutive Euclidean segment lengths
double pathLength(const Path &path);

// Exactly n points evenly spaced by arc length along path
Path resample(const Path &path, int n);

// Mean per-point distance between two equally sized paths
double meanPointDistance(const Path &a, const Path &b);

} // namespace tracekey
