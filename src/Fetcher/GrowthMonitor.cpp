#include "GrowthMonitor.hpp"

#include <cstdint>
#include <filesystem>
#include <system_error>

#include "logger.hpp"

namespace fetcher {

namespace {

enum class SizeRead { kOk, kMissing, kFailed };

SizeRead readSize(const std::string& path, std::uint64_t* size,
                  std::string* error) {
  std::error_code ec;
  std::uintmax_t value = std::filesystem::file_size(path, ec);
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory) return SizeRead::kMissing;
    *error = ec.message();
    return SizeRead::kFailed;
  }
  *size = static_cast<std::uint64_t>(value);
  return SizeRead::kOk;
}

}  // namespace

const char* toString(MonitorOutcome outcome) {
  switch (outcome) {
    case MonitorOutcome::kNotStarted:
      return "not-started";
    case MonitorOutcome::kStalled:
      return "stalled";
    case MonitorOutcome::kVanished:
      return "vanished";
    case MonitorOutcome::kShrunk:
      return "shrunk";
    case MonitorOutcome::kCancelled:
      return "cancelled";
    case MonitorOutcome::kFailed:
      return "failed";
    default:
      return "unknown";
  }
}

GrowthMonitor::GrowthMonitor(ProgressListener& listener, MonitorOptions options)
    : listener_(listener), options_(options) {}

MonitorOutcome GrowthMonitor::run(const std::string& path,
                                  const utils::CancellationToken& token) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec) && !waitForCreation(path, token)) {
    // 文件从未出现：不输出任何进度
    LOG(DEBUG) << "Nothing to monitor at " << path;
    return token.isCancelled() ? MonitorOutcome::kCancelled
                               : MonitorOutcome::kNotStarted;
  }

  MonitorState state{path, options_.pollInterval, 0,
                     std::chrono::steady_clock::now()};
  LOG(DEBUG) << "Monitoring " << path << " every "
             << state.pollInterval.count() << "ms";
  MonitorOutcome outcome = poll(state, token);
  LOG(DEBUG) << "Monitor for " << path << " finished: " << toString(outcome)
             << " at " << state.lastSize << " bytes";
  listener_.onMonitorFinished(outcome);
  return outcome;
}

bool GrowthMonitor::waitForCreation(const std::string& path,
                                    const utils::CancellationToken& token) {
  if (options_.startGrace.count() <= 0) return false;
  auto deadline = std::chrono::steady_clock::now() + options_.startGrace;
  std::error_code ec;
  while (std::chrono::steady_clock::now() < deadline) {
    if (token.waitFor(options_.pollInterval)) return false;
    if (std::filesystem::exists(path, ec)) return true;
  }
  return false;
}

MonitorOutcome GrowthMonitor::poll(MonitorState& state,
                                   const utils::CancellationToken& token) {
  std::uint64_t current = 0;
  std::string error;

  while (!token.isCancelled()) {
    SizeRead read = readSize(state.targetPath, &current, &error);

    if (read == SizeRead::kOk && current == state.lastSize) {
      // 可能已完成，也可能只是慢了一拍：隔两个周期再确认一次
      if (token.waitFor(state.pollInterval * 2)) {
        return MonitorOutcome::kCancelled;
      }
      read = readSize(state.targetPath, &current, &error);
      if (read == SizeRead::kOk && current == state.lastSize) {
        return MonitorOutcome::kStalled;
      }
    }

    if (read == SizeRead::kMissing) {
      return MonitorOutcome::kVanished;
    }
    if (read == SizeRead::kFailed) {
      LOG(ERROR) << "Error monitoring " << state.targetPath << ": " << error;
      listener_.onMonitorError(state.targetPath, error);
      return MonitorOutcome::kFailed;
    }
    if (current < state.lastSize) {
      LOG(WARN) << state.targetPath << " shrank from " << state.lastSize
                << " to " << current << " bytes, stop monitoring";
      return MonitorOutcome::kShrunk;
    }

    double elapsed = std::chrono::duration<double>(
                         std::chrono::steady_clock::now() - state.startTime)
                         .count();
    std::optional<double> speed;
    if (elapsed > 0) {
      speed = static_cast<double>(current) / elapsed;
    }
    listener_.onProgress(ProgressSample{current, elapsed}, speed);
    state.lastSize = current;

    if (token.waitFor(state.pollInterval)) {
      return MonitorOutcome::kCancelled;
    }
  }
  return MonitorOutcome::kCancelled;
}

}  // namespace fetcher
