#include <curl/curl.h>
#include <gflags/gflags.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>

#include "Fetcher/ConsoleReporter.hpp"
#include "Fetcher/Credentials.hpp"
#include "Fetcher/FetchPipeline.hpp"
#include "Fetcher/KaggleClient.hpp"
#include "Fetcher/errors.hpp"
#include "utils/logger.hpp"

DEFINE_string(competition, "playground-series-s5e8",
              "Kaggle competition to download");
DEFINE_string(download_path, "../dataset",
              "Directory the archive is downloaded and extracted into");
DEFINE_string(file, "",
              "Download a single competition file instead of all files");
DEFINE_int32(poll_interval_ms, 500,
             "How often the download progress monitor polls the file size");
DEFINE_int32(monitor_start_grace_ms, 5000,
             "How long the progress monitor waits for the download file to "
             "appear (0 to give up immediately)");
DEFINE_int32(monitor_join_timeout_ms, 2000,
             "How long to wait for the progress monitor after the transfer "
             "returns before cancelling it");
DEFINE_string(kaggle_username, "", "Kaggle user name (overrides environment)");
DEFINE_string(kaggle_key, "", "Kaggle API key (overrides environment)");
DEFINE_string(kaggle_config, "",
              "Path to kaggle.json (default ~/.kaggle/kaggle.json)");
DEFINE_string(api_base_url, "https://www.kaggle.com/api/v1",
              "Kaggle API base URL");
DEFINE_string(log_dir, "logs", "Directory for log files");

namespace {

bool ValidatePositive(const char* flagname, int32_t value) {
  if (value > 0) return true;
  std::cerr << "--" << flagname << " must be positive, got " << value
            << std::endl;
  return false;
}

bool ValidateNonNegative(const char* flagname, int32_t value) {
  if (value >= 0) return true;
  std::cerr << "--" << flagname << " must not be negative, got " << value
            << std::endl;
  return false;
}

std::string envOrEmpty(const char* name) {
  const char* value = std::getenv(name);
  return value ? std::string(value) : std::string();
}

}  // namespace

int main(int argc, char* argv[]) {
  gflags::RegisterFlagValidator(&FLAGS_poll_interval_ms, &ValidatePositive);
  gflags::RegisterFlagValidator(&FLAGS_monitor_start_grace_ms,
                                &ValidateNonNegative);
  gflags::RegisterFlagValidator(&FLAGS_monitor_join_timeout_ms,
                                &ValidatePositive);
  gflags::SetUsageMessage(
      "Download, extract and list a Kaggle competition dataset");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  utils::LogConfig logCfg;
  logCfg.logFilePath = FLAGS_log_dir;
  utils::Logger::initialize(logCfg);

  // 凭据在这里解析，核心流程只接收显式的 Credentials
  fetcher::CredentialSources sources;
  sources.flagUsername = FLAGS_kaggle_username;
  sources.flagKey = FLAGS_kaggle_key;
  sources.envUsername = envOrEmpty("KAGGLE_USERNAME");
  sources.envKey = envOrEmpty("KAGGLE_KEY");
  sources.configPath =
      FLAGS_kaggle_config.empty()
          ? fetcher::defaultCredentialsPath(std::getenv("HOME"))
          : FLAGS_kaggle_config;

  fetcher::Credentials credentials;
  try {
    credentials = fetcher::resolveCredentials(sources);
  } catch (const fetcher::ConfigError& e) {
    LOG(ERROR) << e.what();
    std::cout << "❌ Authentication failed: " << e.what() << std::endl;
    return 1;
  }

  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    LOG(FATAL) << "curl_global_init failed";
    return 1;
  }

  fetcher::KaggleClientOptions clientOptions;
  clientOptions.apiBaseUrl = FLAGS_api_base_url;
  fetcher::KaggleClient client(credentials, clientOptions);
  fetcher::ConsoleReporter reporter(std::cout);
  fetcher::FetchPipeline pipeline(client, reporter, reporter, std::cout);

  fetcher::PipelineOptions options;
  options.resourceId = FLAGS_competition;
  options.destinationDir = FLAGS_download_path;
  options.fileName = FLAGS_file;
  options.orchestrator.monitor.pollInterval =
      std::chrono::milliseconds(FLAGS_poll_interval_ms);
  options.orchestrator.monitor.startGrace =
      std::chrono::milliseconds(FLAGS_monitor_start_grace_ms);
  options.orchestrator.joinTimeout =
      std::chrono::milliseconds(FLAGS_monitor_join_timeout_ms);

  int status = 0;
  try {
    pipeline.run(options);
  } catch (const fetcher::ExtractionError& e) {
    LOG(ERROR) << "Extraction failed: " << e.what();
    std::cout << "\n❌ Extraction failed: " << e.what() << std::endl;
    status = 1;
  } catch (const std::filesystem::filesystem_error& e) {
    LOG(ERROR) << "Filesystem error: " << e.what();
    std::cout << "\n❌ " << e.what() << std::endl;
    status = 1;
  }

  curl_global_cleanup();
  gflags::ShutDownCommandLineFlags();
  return status;
}
