#include "ConsoleReporter.hpp"

#include "size_formatter.hpp"

namespace fetcher {

ConsoleReporter::ConsoleReporter(std::ostream& out, int barWidth)
    : out_(out), barWidth_(barWidth), progressLineOpen_(false) {}

void ConsoleReporter::onProgress(const ProgressSample& sample,
                                 std::optional<double> bytesPerSecond) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string speed = bytesPerSecond
                          ? utils::formatSize(*bytesPerSecond) + "/s"
                          : std::string("calculating...");
  out_ << "\r📥 Downloaded: "
       << utils::formatSize(static_cast<double>(sample.byteCount))
       << " | Speed: " << speed << std::flush;
  progressLineOpen_ = true;
}

void ConsoleReporter::onMonitorError(const std::string& path,
                                     const std::string& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "\nError monitoring download of " << path << ": " << message
       << std::endl;
  progressLineOpen_ = false;
}

void ConsoleReporter::onMonitorFinished(MonitorOutcome) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (progressLineOpen_) {
    out_ << std::endl;
    progressLineOpen_ = false;
  }
}

void ConsoleReporter::onExtractionStarted(const std::string& archiveName,
                                          std::uint64_t totalBytes,
                                          std::size_t memberCount) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "\n📦 Extracting " << archiveName << " (" << memberCount
       << " files)..." << std::endl;
  drawBar(0, totalBytes);
}

void ConsoleReporter::onMemberExtracted(const ArchiveMember&,
                                        std::uint64_t processedBytes,
                                        std::uint64_t totalBytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  drawBar(processedBytes, totalBytes);
}

void ConsoleReporter::onExtractionFinished(std::uint64_t) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << std::endl;
}

void ConsoleReporter::drawBar(std::uint64_t processed, std::uint64_t total) {
  // 空归档按 100% 显示
  double ratio = total > 0 ? static_cast<double>(processed) / total : 1.0;
  int filled = static_cast<int>(ratio * barWidth_);
  out_ << "\rExtracting: " << static_cast<int>(ratio * 100) << "% |"
       << std::string(filled, '#') << std::string(barWidth_ - filled, ' ')
       << "| " << utils::formatSize(static_cast<double>(processed)) << "/"
       << utils::formatSize(static_cast<double>(total)) << std::flush;
}

}  // namespace fetcher
