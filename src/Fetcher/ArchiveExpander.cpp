#include "ArchiveExpander.hpp"

#include <minizip/unzip.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <system_error>
#include <vector>

#include "errors.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

namespace fetcher {

namespace {

constexpr size_t kBufferSize = 64 * 1024;

struct UnzCloser {
  void operator()(void* zip) const {
    if (zip) unzClose(static_cast<unzFile>(zip));
  }
};
using UnzHandle = std::unique_ptr<void, UnzCloser>;

UnzHandle openArchive(const std::string& archivePath) {
  UnzHandle zip(unzOpen64(archivePath.c_str()));
  if (!zip) {
    throw ExtractionError("Failed to open archive: " + archivePath);
  }
  return zip;
}

ArchiveMember currentMember(unzFile zip) {
  unz_file_info64 info;
  if (unzGetCurrentFileInfo64(zip, &info, nullptr, 0, nullptr, 0, nullptr,
                              0) != UNZ_OK) {
    throw ExtractionError("Failed to read archive entry header");
  }
  std::vector<char> name(info.size_filename + 1, '\0');
  if (unzGetCurrentFileInfo64(zip, &info, name.data(),
                              static_cast<uLong>(name.size()), nullptr, 0,
                              nullptr, 0) != UNZ_OK) {
    throw ExtractionError("Failed to read archive entry name");
  }
  ArchiveMember member;
  member.name.assign(name.data(), info.size_filename);
  member.isDirectory = !member.name.empty() && member.name.back() == '/';
  member.uncompressedSize =
      member.isDirectory ? 0
                         : static_cast<std::uint64_t>(info.uncompressed_size);
  return member;
}

std::vector<ArchiveMember> readMembers(unzFile zip) {
  unz_global_info64 global;
  if (unzGetGlobalInfo64(zip, &global) != UNZ_OK) {
    throw ExtractionError("Failed to read archive directory");
  }
  std::vector<ArchiveMember> members;
  if (global.number_entry == 0) return members;
  members.reserve(static_cast<size_t>(global.number_entry));
  int rc = unzGoToFirstFile(zip);
  while (rc == UNZ_OK) {
    members.push_back(currentMember(zip));
    rc = unzGoToNextFile(zip);
  }
  if (rc != UNZ_END_OF_LIST_OF_FILE) {
    throw ExtractionError("Corrupt archive central directory (code " +
                          std::to_string(rc) + ")");
  }
  return members;
}

// 拒绝绝对路径和含 ".." 的成员名，避免写出目标目录
fs::path resolveTarget(const fs::path& destination, const std::string& name) {
  fs::path relative(name);
  if (relative.empty() || relative.has_root_path()) {
    throw ExtractionError("Unsafe archive member name: " + name);
  }
  for (const auto& part : relative) {
    if (part == "..") {
      throw ExtractionError("Unsafe archive member name: " + name);
    }
  }
  return destination / relative;
}

void extractCurrent(unzFile zip, const ArchiveMember& member,
                    const fs::path& target) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) {
    throw ExtractionError("Failed to create " + target.parent_path().string() +
                          ": " + ec.message());
  }

  if (unzOpenCurrentFile(zip) != UNZ_OK) {
    throw ExtractionError("Failed to open archive member: " + member.name);
  }
  std::ofstream ofs(target, std::ios::binary | std::ios::trunc);
  if (!ofs) {
    unzCloseCurrentFile(zip);
    throw ExtractionError("Failed to create file: " + target.string());
  }

  std::unique_ptr<char[]> buffer(new char[kBufferSize]);
  std::uint64_t written = 0;
  int bytesRead = 0;
  while ((bytesRead = unzReadCurrentFile(
              zip, buffer.get(), static_cast<unsigned>(kBufferSize))) > 0) {
    ofs.write(buffer.get(), bytesRead);
    if (!ofs) {
      unzCloseCurrentFile(zip);
      throw ExtractionError("Failed to write file: " + target.string());
    }
    written += static_cast<std::uint64_t>(bytesRead);
  }
  int closeRc = unzCloseCurrentFile(zip);
  if (bytesRead < 0) {
    throw ExtractionError("Failed to read archive member " + member.name +
                          " (code " + std::to_string(bytesRead) + ")");
  }
  if (closeRc != UNZ_OK) {
    throw ExtractionError("Archive member " + member.name +
                          " is damaged (code " + std::to_string(closeRc) + ")");
  }
  if (written != member.uncompressedSize) {
    throw ExtractionError("Archive member " + member.name + " expanded to " +
                          std::to_string(written) + " bytes, expected " +
                          std::to_string(member.uncompressedSize));
  }
}

}  // namespace

ArchiveExpander::ArchiveExpander(ExtractionListener& listener)
    : listener_(listener) {}

std::vector<ArchiveMember> ArchiveExpander::listMembers(
    const std::string& archivePath) {
  UnzHandle zip = openArchive(archivePath);
  return readMembers(static_cast<unzFile>(zip.get()));
}

void ArchiveExpander::expand(const std::string& archivePath,
                             const std::string& destinationDir) {
  UnzHandle handle = openArchive(archivePath);
  unzFile zip = static_cast<unzFile>(handle.get());

  std::vector<ArchiveMember> members = readMembers(zip);
  std::uint64_t total = 0;
  for (const auto& member : members) {
    total += member.uncompressedSize;
  }
  LOG(INFO) << "Extracting " << members.size() << " members (" << total
            << " bytes) from " << archivePath << " to " << destinationDir;
  listener_.onExtractionStarted(fs::path(archivePath).filename().string(),
                                total, members.size());

  fs::path destination(destinationDir);
  std::uint64_t processed = 0;
  int rc = members.empty() ? UNZ_END_OF_LIST_OF_FILE : unzGoToFirstFile(zip);
  for (const auto& member : members) {
    if (rc != UNZ_OK) {
      throw ExtractionError("Archive ended before member " + member.name);
    }
    fs::path target = resolveTarget(destination, member.name);
    if (member.isDirectory) {
      std::error_code ec;
      fs::create_directories(target, ec);
      if (ec) {
        throw ExtractionError("Failed to create " + target.string() + ": " +
                              ec.message());
      }
    } else {
      extractCurrent(zip, member, target);
    }
    processed += member.uncompressedSize;
    listener_.onMemberExtracted(member, processed, total);
    rc = unzGoToNextFile(zip);
  }

  LOG(INFO) << "Extracted " << processed << " bytes from " << archivePath;
  listener_.onExtractionFinished(total);
}

}  // namespace fetcher
