#pragma once

/**
 * TraceKey - Settings System
 *
 * Tunable ranking constants, stored as key=value lines.
 * File location: $XDG_CONFIG_HOME/tracekey/settings.conf
 */

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace tracekey {

// ============================================================================
// Settings Structure
// ============================================================================

struct Settings {
  // === Language model interpolation ===
  double bigramWeight = 0.4;
  double unigramWeight = 0.1;
  double staticWeight = 0.5;

  // === Scoring ===
  // score = exp(-gestureDistance / gestureDecay) * p(word | prev)
  double gestureDecay = 2.0;
  // score = editDecayBase ^ editCost * p(word | prev)
  double editDecayBase = 0.001;
  int correctionMaxCost = 2;
  int predictionMaxCost = 2;

  // === Gesture pre-filter ===
  // Word path length must lie in [min, max] x gesture length
  double minLengthRatio = 0.8;
  double maxLengthRatio = 1.4;

  // === Candidate bar ===
  int displayCount = 6;
  // Typed words shorter than this get no predictions
  int minPredictionPrefix = 4;

  // === Session seed ===
  std::string seedWord = "the";
  int seedCount = 1;

  bool operator==(const Settings &other) const {
    return bigramWeight == other.bigramWeight &&
           unigramWeight == other.unigramWeight &&
           staticWeight == other.staticWeight &&
           gestureDecay == other.gestureDecay &&
           editDecayBase == other.editDecayBase &&
           correctionMaxCost == other.correctionMaxCost &&
           predictionMaxCost == other.predictionMaxCost &&
           minLengthRatio == other.minLengthRatio &&
           maxLengthRatio == other.maxLengthRatio &&
           displayCount == other.displayCount &&
           minPredictionPrefix == other.minPredictionPrefix &&
           seedWord == other.seedWord && seedCount == other.seedCount;
  }

  bool operator!=(const Settings &other) const { return !(*this == other); }
};

// Copy of s with every value moved inside the range where the ranking
// formulas stay meaningful (e.g. gestureDecay > 0)
Settings clampSettings(Settings s);

// ============================================================================
// Settings Manager
// ============================================================================

class SettingsManager {
public:
  static SettingsManager &instance();

  // Load from the default path. A missing file leaves defaults in place.
  bool load();
  // Load from an explicit path; later saves go to the same file
  bool load(const std::string &path);

  bool save();

  Settings get() const;

  // Update settings, persist them and notify listeners
  void set(const Settings &newSettings);

  // Update a single setting by its file key, clamped to a sane range.
  // Returns false for unknown keys or unparsable values.
  bool setSingle(const std::string &key, const std::string &value);

  using ChangeCallback = std::function<void(const Settings &)>;
  void onChanged(ChangeCallback callback);

  std::string getSettingsPath() const;
  std::string getConfigDir() const;

private:
  SettingsManager() = default;
  SettingsManager(const SettingsManager &) = delete;
  SettingsManager &operator=(const SettingsManager &) = delete;

  bool ensureConfigDir() const;

  mutable std::mutex mutex_;
  Settings settings_;
  std::string path_; // empty = default path
  std::vector<ChangeCallback> callbacks_;
};

} // namespace tracekey
