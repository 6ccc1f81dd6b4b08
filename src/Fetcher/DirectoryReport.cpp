#include "DirectoryReport.hpp"

#include <algorithm>
#include <filesystem>

#include "logger.hpp"
#include "size_formatter.hpp"

namespace fetcher {

std::vector<FileEntry> listFiles(const std::string& folder) {
  std::vector<FileEntry> entries;
  std::error_code ec;
  std::filesystem::directory_iterator it(folder, ec);
  if (ec) {
    LOG(WARN) << "Cannot list " << folder << ": " << ec.message();
    return entries;
  }
  for (const auto& entry : it) {
    if (!entry.is_regular_file(ec)) continue;
    std::uintmax_t size = entry.file_size(ec);
    if (ec) continue;
    entries.push_back(FileEntry{entry.path().filename().string(),
                                static_cast<std::uint64_t>(size)});
  }
  std::sort(entries.begin(), entries.end(),
            [](const FileEntry& a, const FileEntry& b) {
              return a.name < b.name;
            });
  return entries;
}

std::uint64_t totalSize(const std::vector<FileEntry>& entries) {
  std::uint64_t total = 0;
  for (const auto& entry : entries) total += entry.size;
  return total;
}

void printDirectoryReport(std::ostream& out,
                          const std::vector<FileEntry>& entries) {
  out << "\n📁 Files in directory after extraction:" << std::endl;
  for (const auto& entry : entries) {
    out << "  📄 " << entry.name << ": "
        << utils::formatSize(static_cast<double>(entry.size)) << std::endl;
  }
  std::uint64_t total = totalSize(entries);
  if (total > 0) {
    out << "\n📊 Total size: " << utils::formatSize(static_cast<double>(total))
        << std::endl;
  }
}

}  // namespace fetcher
