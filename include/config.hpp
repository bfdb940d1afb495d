/**
 * Application configuration - JSON file plus command line overrides
 */

#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "frame_source.hpp"
#include "http_server.hpp"
#include "processing_loop.hpp"

namespace logowatch {

struct AppConfig {
  SourceConfig source;
  LoopConfig loop;          // initialReferences doubles as the slot list
  ServerConfig server;
  std::string configPath;

  AppConfig();

  std::vector<std::string> slotNames() const;
};

bool parseConfig(const nlohmann::json& root, AppConfig& config, std::string& error);
bool loadConfigFile(const std::string& path, AppConfig& config, std::string& error);

// logowatch [config.json] [--source L] [--port N] [--process-every N]
bool parseCommandLine(int argc, char** argv, AppConfig& config, std::string& error);

bool validateConfig(const AppConfig& config, std::string& error);

} // namespace logowatch

#endif // CONFIG_HPP
