#ifndef DIRECTORY_REPORT_HPP_
#define DIRECTORY_REPORT_HPP_

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace fetcher {

struct FileEntry {
  std::string name;
  std::uint64_t size;
};

// 目录下的普通文件（不递归），按文件名排序
std::vector<FileEntry> listFiles(const std::string& folder);

std::uint64_t totalSize(const std::vector<FileEntry>& entries);

void printDirectoryReport(std::ostream& out,
                          const std::vector<FileEntry>& entries);

}  // namespace fetcher

#endif  // DIRECTORY_REPORT_HPP_
