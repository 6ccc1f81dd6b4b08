#include "FetchPipeline.hpp"

#include <filesystem>

#include "DirectoryReport.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "size_formatter.hpp"

namespace fs = std::filesystem;

namespace fetcher {

void requireArchive(const TransferResult& result) {
  if (!result.succeeded || !result.archivePath) {
    throw NotFoundError("Transfer did not produce an archive");
  }
  std::error_code ec;
  if (!fs::is_regular_file(*result.archivePath, ec)) {
    throw NotFoundError("Archive not found: " + *result.archivePath);
  }
}

FetchPipeline::FetchPipeline(TransferClient& client, ProgressListener& progress,
                             ExtractionListener& extraction, std::ostream& out)
    : client_(client),
      progress_(progress),
      extraction_(extraction),
      out_(out) {}

bool FetchPipeline::run(const PipelineOptions& options) {
  fs::create_directories(options.destinationDir);

  out_ << "🔑 Authenticating with Kaggle API..." << std::endl;
  try {
    client_.authenticate();
    out_ << "✅ Authentication successful!" << std::endl;
  } catch (const AuthError& e) {
    LOG(ERROR) << "Authentication failed: " << e.what();
    out_ << "❌ Authentication failed: " << e.what() << std::endl;
    return false;
  }

  out_ << "\n🎯 Target competition: " << options.resourceId << std::endl;
  out_ << "📁 Download path: " << options.destinationDir << std::endl;

  DownloadOrchestrator orchestrator(progress_, out_, options.orchestrator);
  TransferResult result;
  if (options.fileName.empty()) {
    out_ << "\n📦 Downloading all competition files..." << std::endl;
    result = orchestrator.downloadAll(client_, options.resourceId,
                                      options.destinationDir);
  } else {
    result = orchestrator.downloadOne(client_, options.resourceId,
                                      options.fileName, options.destinationDir);
  }

  bool expanded = false;
  try {
    requireArchive(result);
    expandAndRemove(*result.archivePath, options.destinationDir);
    expanded = true;
  } catch (const NotFoundError& e) {
    // 传输结果才是权威信号，找不到归档只提示、不中断
    LOG(WARN) << e.what();
    out_ << "⚠️  Download failed or file not found" << std::endl;
  }

  printDirectoryReport(out_, listFiles(options.destinationDir));
  out_ << "\n🎉 Download and extraction complete!" << std::endl;
  return expanded;
}

void FetchPipeline::expandAndRemove(const std::string& archivePath,
                                    const std::string& destinationDir) {
  out_ << "✅ Download complete: "
       << utils::formatSize(static_cast<double>(fs::file_size(archivePath)))
       << std::endl;

  ArchiveExpander expander(extraction_);
  expander.expand(archivePath, destinationDir);

  fs::remove(archivePath);
  LOG(INFO) << "Removed " << archivePath;
  out_ << "\n🗑 Removed zip file after extraction" << std::endl;
}

}  // namespace fetcher
