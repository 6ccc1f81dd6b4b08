#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <vector>

#include "ArchiveExpander.hpp"
#include "errors.hpp"
#include "extractionlistener_mock.hpp"
#include "test_utils.hpp"

using namespace ::testing;
using ::fetcher::test::TempDir;
using ::fetcher::test::ZipEntry;
namespace fs = std::filesystem;

namespace {

MATCHER_P(MemberNamed, name, "") { return arg.name == name; }

class ArchiveExpanderTest : public Test {
 protected:
  void SetUp() override {
    archive_ = dir_.file("data.zip");
    output_ = (dir_.path() / "out").string();
  }

  ::fetcher::test::TempDir dir_;
  std::string archive_;
  std::string output_;
};

}  // namespace

TEST_F(ArchiveExpanderTest, ListsMembersInArchiveOrder) {
  fetcher::test::writeZip(archive_,
                          {{"b.csv", std::string(300, 'b')},
                           {"nested/", ""},
                           {"nested/a.csv", std::string(100, 'a')}});

  auto members = ArchiveExpander::listMembers(archive_);

  ASSERT_EQ(members.size(), 3u);
  EXPECT_EQ(members[0].name, "b.csv");
  EXPECT_EQ(members[0].uncompressedSize, 300u);
  EXPECT_FALSE(members[0].isDirectory);
  EXPECT_EQ(members[1].name, "nested/");
  EXPECT_TRUE(members[1].isDirectory);
  EXPECT_EQ(members[2].name, "nested/a.csv");
  EXPECT_EQ(members[2].uncompressedSize, 100u);
}

TEST_F(ArchiveExpanderTest, ExtractsMembersAndReportsCumulativeBytes) {
  std::string train = fetcher::test::makeContent(4096, 'a');
  std::string test = fetcher::test::makeContent(6144, 'k');
  fetcher::test::writeZip(archive_, {{"train.csv", train}, {"test.csv", test}});

  StrictMock<ExtractionListenerMock> listener;
  {
    InSequence seq;
    EXPECT_CALL(listener, onExtractionStarted("data.zip", 10240u, 2u));
    EXPECT_CALL(listener,
                onMemberExtracted(MemberNamed("train.csv"), 4096u, 10240u));
    EXPECT_CALL(listener,
                onMemberExtracted(MemberNamed("test.csv"), 10240u, 10240u));
    EXPECT_CALL(listener, onExtractionFinished(10240u));
  }
  ArchiveExpander expander(listener);

  expander.expand(archive_, output_);

  EXPECT_EQ(fetcher::test::readFile(output_ + "/train.csv"), train);
  EXPECT_EQ(fetcher::test::readFile(output_ + "/test.csv"), test);
}

TEST_F(ArchiveExpanderTest, IncrementsSumToTotal) {
  std::vector<ZipEntry> entries;
  for (int i = 0; i < 7; ++i) {
    entries.push_back({"part" + std::to_string(i) + ".bin",
                       fetcher::test::makeContent(1000 + i * 517, 'p')});
  }
  entries.push_back({"docs/", ""});
  entries.push_back({"docs/readme.txt", "hello"});
  fetcher::test::writeZip(archive_, entries);

  NiceMock<ExtractionListenerMock> listener;
  std::uint64_t total = 0;
  std::uint64_t previous = 0;
  std::uint64_t increments = 0;
  ON_CALL(listener, onExtractionStarted(_, _, _))
      .WillByDefault(SaveArg<1>(&total));
  ON_CALL(listener, onMemberExtracted(_, _, _))
      .WillByDefault(Invoke([&](const ArchiveMember& member,
                                std::uint64_t processed, std::uint64_t) {
        EXPECT_EQ(processed - previous, member.uncompressedSize);
        increments += processed - previous;
        previous = processed;
      }));
  ArchiveExpander expander(listener);

  expander.expand(archive_, output_);

  EXPECT_EQ(increments, total);
  EXPECT_TRUE(fs::is_directory(output_ + "/docs"));
  EXPECT_EQ(fetcher::test::readFile(output_ + "/docs/readme.txt"), "hello");
}

TEST_F(ArchiveExpanderTest, EmptyArchiveReportsZeroTotal) {
  fetcher::test::writeZip(archive_, {});
  StrictMock<ExtractionListenerMock> listener;
  EXPECT_CALL(listener, onExtractionStarted("data.zip", 0u, 0u));
  EXPECT_CALL(listener, onExtractionFinished(0u));
  ArchiveExpander expander(listener);

  expander.expand(archive_, output_);

  EXPECT_TRUE(fs::is_directory(output_) || !fs::exists(output_));
}

TEST_F(ArchiveExpanderTest, MissingArchiveThrows) {
  NiceMock<ExtractionListenerMock> listener;
  ArchiveExpander expander(listener);

  EXPECT_THROW(expander.expand(dir_.file("missing.zip"), output_),
               ExtractionError);
}

TEST_F(ArchiveExpanderTest, CorruptArchiveThrows) {
  fetcher::test::writeFile(archive_, fetcher::test::makeContent(4000, 'q'));
  StrictMock<ExtractionListenerMock> listener;
  ArchiveExpander expander(listener);

  EXPECT_THROW(expander.expand(archive_, output_), ExtractionError);
}

TEST_F(ArchiveExpanderTest, MemberEscapingDestinationAbortsExpansion) {
  fetcher::test::writeZip(archive_, {{"ok.txt", "fine"},
                                     {"../escape.txt", "nope"},
                                     {"later.txt", "never"}});
  NiceMock<ExtractionListenerMock> listener;
  EXPECT_CALL(listener, onExtractionFinished(_)).Times(0);
  ArchiveExpander expander(listener);

  EXPECT_THROW(expander.expand(archive_, output_), ExtractionError);
  EXPECT_TRUE(fs::exists(output_ + "/ok.txt"));
  EXPECT_FALSE(fs::exists(dir_.file("escape.txt")));
  EXPECT_FALSE(fs::exists(output_ + "/later.txt"));
}
