#ifndef ARCHIVE_EXPANDER_HPP_
#define ARCHIVE_EXPANDER_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace fetcher {

struct ArchiveMember {
  std::string name;
  std::uint64_t uncompressedSize;
  bool isDirectory;
};

class ExtractionListener {
 public:
  virtual ~ExtractionListener() = default;

  virtual void onExtractionStarted(const std::string& archiveName,
                                   std::uint64_t totalBytes,
                                   std::size_t memberCount) = 0;
  virtual void onMemberExtracted(const ArchiveMember& member,
                                 std::uint64_t processedBytes,
                                 std::uint64_t totalBytes) = 0;
  virtual void onExtractionFinished(std::uint64_t totalBytes) = 0;
};

/**
 * @brief 解压 zip 归档并按解压后字节数汇报进度
 *
 * 先枚举全部成员求总大小，再按归档内顺序逐个解压，每写完一个成员
 * 进度增加该成员的解压后大小。任一成员失败即抛出 ExtractionError，
 * 已解出的文件保留在目标目录中。
 */
class ArchiveExpander {
 public:
  explicit ArchiveExpander(ExtractionListener& listener);

  void expand(const std::string& archivePath,
              const std::string& destinationDir);

  static std::vector<ArchiveMember> listMembers(const std::string& archivePath);

 private:
  ExtractionListener& listener_;
};

}  // namespace fetcher

#endif  // ARCHIVE_EXPANDER_HPP_
