/**
 * Configuration Implementation
 */

#include "config.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace logowatch {

namespace {

bool parseInt(const std::string& text, int& value) {
  if (text.empty()) {
    return false;
  }
  char* end = nullptr;
  long parsed = std::strtol(text.c_str(), &end, 10);
  if (*end != '\0' || parsed < -2147483647L || parsed > 2147483647L) {
    return false;
  }
  value = static_cast<int>(parsed);
  return true;
}

} // namespace

AppConfig::AppConfig() {
  source.locator = "0";
  loop.locator = source.locator;
  loop.initialReferences = {
    {"logo1", "Coca_Cola_Logo.jpg"},
    {"logo2", "logo2.jpg"}
  };
}

std::vector<std::string> AppConfig::slotNames() const {
  std::vector<std::string> names;
  for (const auto& reference : loop.initialReferences) {
    names.push_back(reference.first);
  }
  return names;
}

bool parseConfig(const json& root, AppConfig& config, std::string& error) {
  if (!root.is_object()) {
    error = "configuration root must be an object";
    return false;
  }

  try {
    if (root.contains("source")) {
      const json& source = root["source"];
      config.source.locator = source.value("locator", config.source.locator);
      config.source.openTimeoutMs = source.value("open_timeout_ms", config.source.openTimeoutMs);
      config.source.readTimeoutMs = source.value("read_timeout_ms", config.source.readTimeoutMs);
    }

    if (root.contains("references")) {
      const json& references = root["references"];
      if (!references.is_array()) {
        error = "references must be an array of {slot, path}";
        return false;
      }
      config.loop.initialReferences.clear();
      for (const auto& reference : references) {
        std::string slot = reference.at("slot").get<std::string>();
        std::string path = reference.value("path", std::string());
        config.loop.initialReferences.emplace_back(slot, path);
      }
    }

    if (root.contains("detector")) {
      const json& detector = root["detector"];
      DetectorConfig& d = config.loop.detector;
      d.type = detector.value("type", d.type);
      d.maxFeatures = detector.value("max_features", d.maxFeatures);
      d.matchRatioThreshold = detector.value("ratio_threshold", d.matchRatioThreshold);
      d.minGoodMatches = detector.value("min_good_matches", d.minGoodMatches);
      d.verifyGeometry = detector.value("verify_geometry", d.verifyGeometry);
      d.ransacThreshold = detector.value("ransac_threshold", d.ransacThreshold);
    }

    if (root.contains("loop")) {
      const json& loop = root["loop"];
      LoopConfig& l = config.loop;
      l.processEvery = loop.value("process_every", l.processEvery);
      l.frameSize.width = loop.value("frame_width", l.frameSize.width);
      l.frameSize.height = loop.value("frame_height", l.frameSize.height);
      l.maxReadFailures = loop.value("max_read_failures", l.maxReadFailures);
      l.fpsSmoothing = loop.value("fps_smoothing", l.fpsSmoothing);
      l.countPolicy = loop.value("count_policy", l.countPolicy);
      l.requireReferences = loop.value("require_references", l.requireReferences);
      l.enableProfiling = loop.value("enable_profiling", l.enableProfiling);
      l.annotator.jpegQuality = loop.value("jpeg_quality", l.annotator.jpegQuality);
    }

    if (root.contains("server")) {
      const json& server = root["server"];
      ServerConfig& s = config.server;
      s.port = server.value("port", s.port);
      s.staticDir = server.value("static_dir", s.staticDir);
      s.maxUploadBytes = server.value("max_upload_bytes", s.maxUploadBytes);
      s.streamIntervalMs = server.value("stream_interval_ms", s.streamIntervalMs);
    }
  } catch (const json::exception& e) {
    error = std::string("invalid configuration value: ") + e.what();
    return false;
  }

  config.loop.locator = config.source.locator;
  // Panels share the processing size
  if (config.loop.frameSize.area() > 0) {
    config.loop.annotator.viewSize = config.loop.frameSize;
  }
  return true;
}

bool loadConfigFile(const std::string& path, AppConfig& config, std::string& error) {
  std::ifstream file(path);
  if (!file.is_open()) {
    error = "cannot open " + path;
    return false;
  }

  json root;
  try {
    file >> root;
  } catch (const json::exception& e) {
    error = "JSON parse error in " + path + ": " + e.what();
    return false;
  }

  config.configPath = path;
  return parseConfig(root, config, error);
}

bool parseCommandLine(int argc, char** argv, AppConfig& config, std::string& error) {
  int first = 1;
  if (argc > 1 && std::string(argv[1]).compare(0, 2, "--") != 0) {
    if (!loadConfigFile(argv[1], config, error)) {
      return false;
    }
    first = 2;
  }

  for (int i = first; i < argc; ++i) {
    std::string flag(argv[i]);
    if (i + 1 >= argc) {
      error = "missing value for " + flag;
      return false;
    }
    std::string value(argv[++i]);

    if (flag == "--source") {
      config.source.locator = value;
      config.loop.locator = value;
    } else if (flag == "--port") {
      if (!parseInt(value, config.server.port)) {
        error = "invalid port '" + value + "'";
        return false;
      }
    } else if (flag == "--process-every") {
      if (!parseInt(value, config.loop.processEvery)) {
        error = "invalid --process-every '" + value + "'";
        return false;
      }
    } else {
      error = "unknown option " + flag;
      return false;
    }
  }
  return validateConfig(config, error);
}

bool validateConfig(const AppConfig& config, std::string& error) {
  const LoopConfig& loop = config.loop;
  const DetectorConfig& detector = loop.detector;

  if (config.source.locator.empty()) {
    error = "source.locator is empty";
  } else if (config.source.openTimeoutMs <= 0 || config.source.readTimeoutMs <= 0) {
    error = "source timeouts must be positive";
  } else if (loop.initialReferences.empty()) {
    error = "at least one reference slot is required";
  } else if (!isSupportedDetector(detector.type)) {
    error = "detector.type must be sift, orb or brisk";
  } else if (detector.matchRatioThreshold <= 0.0f || detector.matchRatioThreshold > 1.0f) {
    error = "detector.ratio_threshold must be in (0, 1]";
  } else if (detector.minGoodMatches < 0) {
    error = "detector.min_good_matches must not be negative";
  } else if (loop.processEvery < 1) {
    error = "loop.process_every must be at least 1";
  } else if (loop.frameSize.width < 0 || loop.frameSize.height < 0) {
    error = "loop frame size must not be negative";
  } else if (loop.annotator.jpegQuality < 1 || loop.annotator.jpegQuality > 100) {
    error = "loop.jpeg_quality must be in [1, 100]";
  } else if (loop.maxReadFailures < 1) {
    error = "loop.max_read_failures must be at least 1";
  } else if (loop.fpsSmoothing <= 0.0 || loop.fpsSmoothing > 1.0) {
    error = "loop.fps_smoothing must be in (0, 1]";
  } else if (loop.countPolicy != "latest" && loop.countPolicy != "cumulative") {
    error = "loop.count_policy must be latest or cumulative";
  } else if (config.server.port < 1 || config.server.port > 65535) {
    error = "server.port must be in [1, 65535]";
  } else {
    return true;
  }
  return false;
}

} // namespace logowatch
