#include "Credentials.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

#include "errors.hpp"
#include "logger.hpp"

namespace fetcher {

Credentials loadCredentialsFile(const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs) {
    throw ConfigError("Failed to open credentials file: " + path);
  }
  try {
    nlohmann::json j = nlohmann::json::parse(ifs);
    Credentials creds;
    creds.username = j.at("username").get<std::string>();
    creds.key = j.at("key").get<std::string>();
    return creds;
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError("Malformed credentials file " + path + ": " + e.what());
  }
}

Credentials resolveCredentials(const CredentialSources& sources) {
  if (!sources.flagUsername.empty() && !sources.flagKey.empty()) {
    LOG(INFO) << "Using Kaggle credentials from command line";
    return Credentials{sources.flagUsername, sources.flagKey};
  }
  if (!sources.envUsername.empty() && !sources.envKey.empty()) {
    LOG(INFO) << "Using Kaggle credentials from environment";
    return Credentials{sources.envUsername, sources.envKey};
  }
  std::error_code ec;
  if (!sources.configPath.empty() &&
      std::filesystem::exists(sources.configPath, ec)) {
    LOG(INFO) << "Using Kaggle credentials from " << sources.configPath;
    return loadCredentialsFile(sources.configPath);
  }
  LOG(WARN) << "No Kaggle credentials found";
  return Credentials();
}

std::string defaultCredentialsPath(const char* home) {
  if (home == nullptr || *home == '\0') return std::string();
  return (std::filesystem::path(home) / ".kaggle" / "kaggle.json").string();
}

}  // namespace fetcher
