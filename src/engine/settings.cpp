/**
 * TraceKey - Settings Implementation
 *
 * Uses simple key=value format for persistence.
 */

#include "settings.h"
#include "log.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <sys/stat.h>

namespace tracekey {

namespace {

// Assign one parsed key. Returns false for unknown keys; std::stod/std::stoi
// throw on malformed values.
bool assign(Settings &s, const std::string &key, const std::string &value) {
  if (key == "bigram_weight") {
    s.bigramWeight = std::stod(value);
  } else if (key == "unigram_weight") {
    s.unigramWeight = std::stod(value);
  } else if (key == "static_weight") {
    s.staticWeight = std::stod(value);
  } else if (key == "gesture_decay") {
    s.gestureDecay = std::stod(value);
  } else if (key == "edit_decay_base") {
    s.editDecayBase = std::stod(value);
  } else if (key == "correction_max_cost") {
    s.correctionMaxCost = std::stoi(value);
  } else if (key == "prediction_max_cost") {
    s.predictionMaxCost = std::stoi(value);
  } else if (key == "min_length_ratio") {
    s.minLengthRatio = std::stod(value);
  } else if (key == "max_length_ratio") {
    s.maxLengthRatio = std::stod(value);
  } else if (key == "display_count") {
    s.displayCount = std::stoi(value);
  } else if (key == "min_prediction_prefix") {
    s.minPredictionPrefix = std::stoi(value);
  } else if (key == "seed_word") {
    s.seedWord = value;
  } else if (key == "seed_count") {
    s.seedCount = std::stoi(value);
  } else {
    return false;
  }
  return true;
}

std::string trim(const std::string &s) {
  size_t b = s.find_first_not_of(" \t\r");
  if (b == std::string::npos)
    return "";
  size_t e = s.find_last_not_of(" \t\r");
  return s.substr(b, e - b + 1);
}

} // namespace

Settings clampSettings(Settings s) {
  s.bigramWeight = std::clamp(s.bigramWeight, 0.0, 1.0);
  s.unigramWeight = std::clamp(s.unigramWeight, 0.0, 1.0);
  s.staticWeight = std::clamp(s.staticWeight, 0.0, 1.0);
  s.gestureDecay = std::clamp(s.gestureDecay, 0.1, 1000.0);
  s.editDecayBase = std::clamp(s.editDecayBase, 1e-9, 1.0);
  s.correctionMaxCost = std::clamp(s.correctionMaxCost, 0, 4);
  s.predictionMaxCost = std::clamp(s.predictionMaxCost, 0, 4);
  s.minLengthRatio = std::clamp(s.minLengthRatio, 0.0, 1.0);
  s.maxLengthRatio = std::clamp(s.maxLengthRatio, 1.0, 10.0);
  s.displayCount = std::clamp(s.displayCount, 1, 32);
  s.minPredictionPrefix = std::clamp(s.minPredictionPrefix, 0, 32);
  s.seedCount = std::clamp(s.seedCount, 0, 1000000);
  return s;
}

// ============================================================================
// Singleton Access
// ============================================================================

SettingsManager &SettingsManager::instance() {
  static SettingsManager instance;
  return instance;
}

// ============================================================================
// Path Resolution
// ============================================================================

std::string SettingsManager::getConfigDir() const {
  const char *xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
  if (xdgConfigHome && *xdgConfigHome) {
    return std::string(xdgConfigHome) + "/tracekey";
  }
  const char *home = std::getenv("HOME");
  if (home && *home) {
    return std::string(home) + "/.config/tracekey";
  }
  return "/tmp/tracekey";
}

std::string SettingsManager::getSettingsPath() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return path_.empty() ? getConfigDir() + "/settings.conf" : path_;
}

bool SettingsManager::ensureConfigDir() const {
  std::string dir = getConfigDir();
  struct stat st;

  if (stat(dir.c_str(), &st) == 0) {
    return S_ISDIR(st.st_mode);
  }

  // Create parent directory first if needed (for ~/.config case)
  std::string parent = dir.substr(0, dir.find_last_of('/'));
  if (!parent.empty() && stat(parent.c_str(), &st) != 0) {
    mkdir(parent.c_str(), 0755);
  }

  return mkdir(dir.c_str(), 0755) == 0;
}

// ============================================================================
// Load/Save Operations
// ============================================================================

bool SettingsManager::load() { return load(getConfigDir() + "/settings.conf"); }

bool SettingsManager::load(const std::string &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  path_ = path;

  std::ifstream file(path);
  if (!file.is_open()) {
    // No settings file yet - use defaults
    TKLOG(Debug) << "No settings at " << path << ", using defaults";
    return true;
  }

  Settings newSettings;
  std::string line;
  int lineNo = 0;

  while (std::getline(file, line)) {
    ++lineNo;
    if (line.empty() || line[0] == '#')
      continue;

    auto eq = line.find('=');
    if (eq == std::string::npos)
      continue;

    std::string key = trim(line.substr(0, eq));
    std::string value = trim(line.substr(eq + 1));

    try {
      if (!assign(newSettings, key, value)) {
        TKLOG(Warn) << path << ":" << lineNo << ": unknown key '" << key
                    << "'";
      }
    } catch (const std::exception &e) {
      TKLOG(Warn) << path << ":" << lineNo << ": bad value for '" << key
                  << "': " << value << " (" << e.what() << ")";
    }
  }

  settings_ = clampSettings(newSettings);
  TKLOG(Info) << "Settings loaded from " << path;
  return true;
}

bool SettingsManager::save() {
  std::lock_guard<std::mutex> lock(mutex_);

  bool defaultLocation =
      path_.empty() || path_.rfind(getConfigDir() + "/", 0) == 0;
  if (defaultLocation && !ensureConfigDir()) {
    TKLOG(Error) << "Cannot create config dir " << getConfigDir();
    return false;
  }

  std::string path = path_.empty() ? getConfigDir() + "/settings.conf" : path_;
  std::ofstream file(path);
  if (!file.is_open()) {
    TKLOG(Error) << "Cannot write settings to " << path;
    return false;
  }

  file << "# TraceKey Settings\n\n";

  file << "# Language model\n";
  file << "bigram_weight=" << settings_.bigramWeight << "\n";
  file << "unigram_weight=" << settings_.unigramWeight << "\n";
  file << "static_weight=" << settings_.staticWeight << "\n\n";

  file << "# Scoring\n";
  file << "gesture_decay=" << settings_.gestureDecay << "\n";
  file << "edit_decay_base=" << settings_.editDecayBase << "\n";
  file << "correction_max_cost=" << settings_.correctionMaxCost << "\n";
  file << "prediction_max_cost=" << settings_.predictionMaxCost << "\n\n";

  file << "# Gesture pre-filter\n";
  file << "min_length_ratio=" << settings_.minLengthRatio << "\n";
  file << "max_length_ratio=" << settings_.maxLengthRatio << "\n\n";

  file << "# Candidate bar\n";
  file << "display_count=" << settings_.displayCount << "\n";
  file << "min_prediction_prefix=" << settings_.minPredictionPrefix << "\n\n";

  file << "# Session seed\n";
  file << "seed_word=" << settings_.seedWord << "\n";
  file << "seed_count=" << settings_.seedCount << "\n";

  return file.good();
}

// ============================================================================
// Get/Set Operations
// ============================================================================

Settings SettingsManager::get() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return settings_;
}

void SettingsManager::set(const Settings &newSettings) {
  bool changed = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (settings_ != newSettings) {
      settings_ = newSettings;
      changed = true;
    }
  }

  if (changed) {
    if (!save()) {
      TKLOG(Warn) << "Settings changed but could not be saved";
    }
    // Listeners run outside the lock
    for (auto &cb : callbacks_) {
      cb(newSettings);
    }
  }
}

bool SettingsManager::setSingle(const std::string &key,
                                const std::string &value) {
  Settings current = get();

  try {
    if (!assign(current, key, value)) {
      TKLOG(Warn) << "Unknown setting: " << key;
      return false;
    }
  } catch (const std::exception &e) {
    TKLOG(Warn) << "Bad value for " << key << ": " << value << " ("
                << e.what() << ")";
    return false;
  }

  set(clampSettings(current));
  return true;
}

void SettingsManager::onChanged(ChangeCallback callback) {
  callbacks_.push_back(std::move(callback));
}

} // namespace tracekey
