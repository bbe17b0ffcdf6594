#include "engine.h"
#include "settings.h"
#include "vocabulary.h"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace tracekey;

static void usage() {
  std::cerr << "Usage: tracekeyctl [--settings FILE] [--total FILE] "
               "<vocabulary.tsv> <command> [...]\n"
            << "Commands:\n"
            << "  lookup <word>\n"
            << "  correct <typed> [previous]\n"
            << "  predict <typed> [previous]\n"
            << "  next [previous]\n"
            << "  gesture <x,y> <x,y> [...]\n"
            << "  trace <word> [samples]   score the ideal path of <word>"
            << std::endl;
}

static void printCandidates(const std::vector<Candidate> &candidates) {
  if (candidates.empty()) {
    std::cout << "(no candidates)" << std::endl;
    return;
  }
  for (size_t i = 0; i < candidates.size(); ++i) {
    std::cout << std::setw(2) << i << "  " << std::left << std::setw(16)
              << candidates[i].word << std::right << std::scientific
              << std::setprecision(4) << candidates[i].score
              << std::defaultfloat << std::endl;
  }
}

static bool parsePoint(const std::string &s, Point &out) {
  size_t comma = s.find(',');
  if (comma == std::string::npos)
    return false;
  char *endX = nullptr;
  char *endY = nullptr;
  std::string xs = s.substr(0, comma);
  std::string ys = s.substr(comma + 1);
  out.x = std::strtod(xs.c_str(), &endX);
  out.y = std::strtod(ys.c_str(), &endY);
  return !xs.empty() && !ys.empty() && *endX == '\0' && *endY == '\0';
}

int main(int argc, char *argv[]) {
  int arg = 1;
  std::string settingsPath;
  std::string totalPath;

  while (arg < argc && std::string(argv[arg]).rfind("--", 0) == 0) {
    std::string opt = argv[arg];
    if (arg + 1 >= argc) {
      usage();
      return 2;
    }
    if (opt == "--settings") {
      settingsPath = argv[arg + 1];
    } else if (opt == "--total") {
      totalPath = argv[arg + 1];
    } else {
      std::cerr << "Unknown option: " << opt << std::endl;
      usage();
      return 2;
    }
    arg += 2;
  }

  if (argc - arg < 2) {
    usage();
    return 1;
  }

  auto &settingsManager = SettingsManager::instance();
  bool settingsOk = settingsPath.empty() ? settingsManager.load()
                                         : settingsManager.load(settingsPath);
  if (!settingsOk) {
    std::cerr << "Failed to load settings" << std::endl;
    return 1;
  }
  Settings settings = settingsManager.get();

  double total = 0;
  if (!totalPath.empty() && !readCorpusTotal(totalPath, total)) {
    std::cerr << "Failed to read corpus total: " << totalPath << std::endl;
    return 1;
  }

  std::vector<VocabularyEntry> entries;
  if (!readVocabularyFile(argv[arg], entries, total)) {
    std::cerr << "Failed to read vocabulary: " << argv[arg] << std::endl;
    return 1;
  }

  Engine engine(settings);
  engine.loadVocabulary(entries);

  std::string cmd = argv[arg + 1];
  int rest = arg + 2;
  std::vector<Candidate> candidates;

  if (cmd == "lookup") {
    if (rest >= argc) {
      usage();
      return 2;
    }
    const lexicon::WordEntry *entry = engine.lookup(argv[rest]);
    if (!entry) {
      std::cout << argv[rest] << ": not in vocabulary" << std::endl;
      return 1;
    }
    std::cout << argv[rest] << ": frequency=" << entry->frequency
              << " path_length=" << entry->pathLength
              << " gesture=" << (entry->gestureEligible ? "yes" : "no")
              << std::endl;
    return 0;
  } else if (cmd == "correct" || cmd == "predict") {
    if (rest >= argc) {
      usage();
      return 2;
    }
    std::string previous = rest + 1 < argc ? argv[rest + 1] : "";
    candidates = cmd == "correct"
                     ? engine.correct(argv[rest], settings.correctionMaxCost,
                                      previous)
                     : engine.predict(argv[rest], settings.predictionMaxCost,
                                      previous);
  } else if (cmd == "next") {
    candidates = engine.suggestNext(rest < argc ? argv[rest] : "");
  } else if (cmd == "gesture") {
    Path gesture;
    for (int i = rest; i < argc; ++i) {
      Point p;
      if (!parsePoint(argv[i], p)) {
        std::cerr << "Malformed point: " << argv[i] << " (expected x,y)"
                  << std::endl;
        return 2;
      }
      gesture.push_back(p);
    }
    candidates = engine.scoreGesture(gesture);
  } else if (cmd == "trace") {
    if (rest >= argc) {
      usage();
      return 2;
    }
    const lexicon::WordEntry *entry = engine.lookup(argv[rest]);
    if (!entry || !entry->gestureEligible) {
      std::cerr << argv[rest] << ": no keyboard path" << std::endl;
      return 1;
    }
    int samples = rest + 1 < argc ? std::atoi(argv[rest + 1]) : 50;
    if (samples < 1) {
      std::cerr << "Invalid sample count" << std::endl;
      return 2;
    }
    candidates = engine.scoreGesture(resample(entry->path, samples));
  } else {
    std::cerr << "Unknown command: " << cmd << std::endl;
    usage();
    return 1;
  }

  Ranker::truncate(candidates, settings.displayCount);
  printCandidates(candidates);
  return 0;
}
