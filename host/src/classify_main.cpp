#include "log.hpp"
#include "errors.hpp"
#include "parity_check.hpp"
#include "registry.hpp"
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace textclf;

// Platform banner
#if defined(_WIN32)
  #define TEXTCLF_PLATFORM "windows"
#elif defined(__APPLE__)
  #define TEXTCLF_PLATFORM "macos"
#elif defined(__linux__)
  #define TEXTCLF_PLATFORM "linux"
#else
  #define TEXTCLF_PLATFORM "unknown"
#endif

struct HostConfig {
  bool quiet = false;                   // only print labels
  bool debug = false;
  bool features = false;                // positional args are key=value pairs
  std::string config_path = std::getenv("TEXTCLF_CONFIG") ? std::getenv("TEXTCLF_CONFIG") : "";
  std::string classifier = "complexity";
  std::string artifact;                 // bypasses the config file
  std::string parity_path;
  std::vector<std::string> args;
};

// trivial flag parser: --quiet --debug --features --config=PATH --classifier=NAME
//                      --artifact=PATH --parity=FILE
static HostConfig parseArgs(int argc, char** argv) {
  HostConfig cfg;
  for (int i=1; i<argc; ++i) {
    std::string a = argv[i];
    if (a == "--quiet") cfg.quiet = true;
    else if (a == "--debug") cfg.debug = true;
    else if (a == "--features") cfg.features = true;
    else if (a.rfind("--config=",0)==0) cfg.config_path = a.substr(9);
    else if (a.rfind("--classifier=",0)==0) cfg.classifier = a.substr(13);
    else if (a.rfind("--artifact=",0)==0) cfg.artifact = a.substr(11);
    else if (a.rfind("--parity=",0)==0) cfg.parity_path = a.substr(9);
    else cfg.args.push_back(a);
  }
  return cfg;
}

static std::string resolveConfigPath() {
  const char* candidates[] = {
    "config/engine.json",        // run from repo root
    "../config/engine.json",     // run from build/
    "../../config/engine.json"   // extra fallback
  };
  for (auto p : candidates) {
    if (std::filesystem::exists(p)) return std::string(p);
  }
  return "config/engine.json"; // default; loadEngineConfig will throw if missing
}

static FeatureTuple parseFeatureArgs(const std::vector<std::string>& args) {
  FeatureTuple t;
  for (const auto& a : args) {
    auto eq = a.find('=');
    if (eq == std::string::npos) {
      Log::write(LogLevel::Warn, "ignoring '%s', expected key=value", a.c_str());
      continue;
    }
    std::string key = a.substr(0, eq), val = a.substr(eq + 1);
    char* end = nullptr;
    double num = std::strtod(val.c_str(), &end);
    if (!val.empty() && end == val.c_str() + val.size()) t.numeric[key] = num;
    else t.categorical[key] = val;
  }
  // a recommender candidate is named by its model id; derive the id traits
  auto id = t.categorical.find("model_id");
  if (id != t.categorical.end()) {
    FeatureTuple traits = recommenderInputs(id->second, "", "", "", 0.0, 0.0);
    for (const char* k : {"has_coder_tag", "has_instant_tag", "model_size"}) {
      t.numeric.emplace(k, traits.numeric[k]);
    }
  }
  return t;
}

static void printPrediction(const HostConfig& CFG, const std::string& input, const Prediction& p) {
  if (CFG.quiet) {
    std::printf("%s\n", p.label.c_str());
    return;
  }
  std::printf("%s\t%.4f\t", p.label.c_str(), p.confidence);
  bool first = true;
  for (const auto& [cls, prob] : sortedProbabilities(p)) {
    std::printf("%s%s=%.4f", first ? "" : " ", cls.c_str(), prob);
    first = false;
  }
  for (const auto& h : p.overlay_hits) {
    std::printf(" [+%.2f %s via \"%s\"]", h.bonus, h.class_label.c_str(), h.cue.c_str());
  }
  std::printf("\n");
  for (const auto& d : p.diagnostics) {
    Log::write(LogLevel::Warn, "'%s': %s", input.c_str(), d.c_str());
  }
}

static int run(const HostConfig& CFG) {
  EngineConfig engine;
  if (!CFG.artifact.empty()) {
    engine.classifiers.emplace(CFG.classifier,
        defaultProfile(CFG.classifier, CFG.artifact,
                       CFG.features ? ClassifierKind::Features : ClassifierKind::Text));
  } else {
    const std::string path = CFG.config_path.empty() ? resolveConfigPath() : CFG.config_path;
    engine = loadEngineConfig(path);
    if (engine.log_level && !CFG.debug) Log::setLevel(*engine.log_level);
    if (engine.log_dir) Log::init(*engine.log_dir);
    Log::write(LogLevel::Info, "Engine config '%s' with %zu classifiers",
               path.c_str(), engine.classifiers.size());
  }

  ClassifierRegistry registry(std::move(engine));
  registry.reload(CFG.classifier);

  if (CFG.features) {
    auto clf = registry.features(CFG.classifier);
    printPrediction(CFG, "features", clf->classifyFeatures(parseFeatureArgs(CFG.args)));
    return 0;
  }

  auto clf = registry.text(CFG.classifier);

  if (!CFG.parity_path.empty()) {
    auto mismatches = checkTokenizerParityFile(clf->tokenizer(), CFG.parity_path);
    for (const auto& m : mismatches) {
      Log::write(LogLevel::Error, "tokenizer parity: '%s' missing=%zu unexpected=%zu",
                 m.text.c_str(), m.missing.size(), m.unexpected.size());
    }
    if (!mismatches.empty()) return 1;
    Log::write(LogLevel::Info, "tokenizer parity OK (%s)", CFG.parity_path.c_str());
  }

  if (!CFG.args.empty()) {
    std::string text;
    for (const auto& a : CFG.args) { if (!text.empty()) text += ' '; text += a; }
    printPrediction(CFG, text, clf->classify(text));
    return 0;
  }

  std::string line;
  size_t n = 0;
  while (std::getline(std::cin, line)) {
    printPrediction(CFG, line, clf->classify(line));
    ++n;
  }
  Log::write(LogLevel::Debug, "classified %zu lines from stdin", n);
  return 0;
}

int main(int argc, char** argv) {
  Log::init("");
  HostConfig CFG = parseArgs(argc, argv);
  Log::setLevel(CFG.debug ? LogLevel::Debug : LogLevel::Warn);
  Log::write(LogLevel::Debug, "textclf starting | platform=%s | build=%s %s",
             TEXTCLF_PLATFORM, __DATE__, __TIME__);
  try {
    return run(CFG);
  } catch (const ArtifactError& e) {
    Log::write(LogLevel::Error, "artifact error: %s", e.what());
  } catch (const ConfigurationError& e) {
    Log::write(LogLevel::Error, "configuration error: %s", e.what());
  } catch (const std::exception& e) {
    Log::write(LogLevel::Error, "error: %s", e.what());
  }
  return 1;
}
