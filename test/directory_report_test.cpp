#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>

#include "DirectoryReport.hpp"
#include "test_utils.hpp"

using namespace ::testing;
using namespace ::fetcher;
using ::fetcher::test::TempDir;

TEST(DirectoryReportTest, ListsRegularFilesSortedByName) {
  ::fetcher::test::TempDir dir;
  fetcher::test::writeFile(dir.file("train.csv"), std::string(4096, 't'));
  fetcher::test::writeFile(dir.file("sample_submission.csv"), "id,target\n");
  fetcher::test::writeFile(dir.file("test.csv"), std::string(6144, 's'));
  std::filesystem::create_directories(dir.path() / "images");
  fetcher::test::writeFile((dir.path() / "images" / "x.png").string(), "png");

  auto entries = listFiles(dir.path().string());

  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0].name, "sample_submission.csv");
  EXPECT_EQ(entries[0].size, 10u);
  EXPECT_EQ(entries[1].name, "test.csv");
  EXPECT_EQ(entries[1].size, 6144u);
  EXPECT_EQ(entries[2].name, "train.csv");
  EXPECT_EQ(entries[2].size, 4096u);
  EXPECT_EQ(totalSize(entries), 10250u);
}

TEST(DirectoryReportTest, MissingFolderYieldsNoEntries) {
  ::fetcher::test::TempDir dir;
  EXPECT_TRUE(listFiles(dir.file("nope")).empty());
}

TEST(DirectoryReportTest, PrintsSizesAndTotal) {
  std::ostringstream out;
  printDirectoryReport(out, {{"test.csv", 6144}, {"train.csv", 4096}});

  std::string text = out.str();
  EXPECT_THAT(text, HasSubstr("📁 Files in directory after extraction:"));
  EXPECT_THAT(text, HasSubstr("  📄 test.csv: 6.00KB\n"));
  EXPECT_THAT(text, HasSubstr("  📄 train.csv: 4.00KB\n"));
  EXPECT_THAT(text, HasSubstr("📊 Total size: 10.00KB"));
}

TEST(DirectoryReportTest, TotalOmittedWhenEmpty) {
  std::ostringstream out;
  printDirectoryReport(out, {{"empty.txt", 0}});

  EXPECT_THAT(out.str(), HasSubstr("📄 empty.txt: 0.00B"));
  EXPECT_THAT(out.str(), Not(HasSubstr("Total size")));
}
