#include <gtest/gtest.h>

#include <chrono>
#include <fstream>
#include <regex>
#include <sstream>
#include <vector>

#include "autofile_core/errors.hpp"
#include "autofile_core/file_mover.hpp"
#include "utilities_test.hpp"

namespace autofile_tests {

using namespace autofile_core;

namespace {

std::string read_all(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

std::vector<std::string> directory_names(const std::filesystem::path& dir) {
  std::vector<std::string> names;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    names.push_back(entry.path().filename().string());
  }
  return names;
}

// Behaves as if source and target sat on different volumes: linking the
// downloaded file fails with EXDEV, so placement goes through the copy path.
class CrossVolumeMover : public FileMover {
 public:
  bool fail_copy = false;
  bool links_supported = true;

 protected:
  std::error_code link_file(const std::filesystem::path& from,
                            const std::filesystem::path& to) override {
    if (!links_supported) {
      return std::make_error_code(std::errc::operation_not_permitted);
    }
    if (from.filename().string().front() != '.') {
      return std::make_error_code(std::errc::cross_device_link);
    }
    return FileMover::link_file(from, to);
  }

  std::error_code copy_contents(const std::filesystem::path& from,
                                const std::filesystem::path& to) override {
    if (fail_copy) {
      // Half-written file, as after ENOSPC mid-copy
      std::ofstream(to, std::ios::binary) << "trunc";
      return std::make_error_code(std::errc::no_space_on_device);
    }
    return FileMover::copy_contents(from, to);
  }
};

}  // namespace

class FileMoverTest : public TempDirTestBase {
 protected:
  void SetUp() override {
    TempDirTestBase::SetUp();
    source_dir_ = temp_dir_ / "downloads";
    target_dir_ = temp_dir_ / "filed" / "Acme" / "20240305";
    std::filesystem::create_directories(source_dir_);
  }

  std::filesystem::path source_dir_;
  std::filesystem::path target_dir_;
  FileMover mover_;
};

TEST_F(FileMoverTest, MovesIntoNewDirectory) {
  auto source = source_dir_ / "report.pdf";
  TestUtilities::write_file(source, "report body");

  MovedPath moved = mover_.move(source, target_dir_);

  EXPECT_EQ(moved, target_dir_ / "report.pdf");
  EXPECT_FALSE(std::filesystem::exists(source));
  EXPECT_EQ(read_all(moved), "report body");
}

TEST_F(FileMoverTest, CollisionGetsTimestampSuffixAndLeavesExistingUntouched) {
  TestUtilities::write_file(target_dir_ / "report.pdf", "original");
  auto source = source_dir_ / "report.pdf";
  TestUtilities::write_file(source, "newer");

  MovedPath moved = mover_.move(source, target_dir_);

  EXPECT_NE(moved, target_dir_ / "report.pdf");
  EXPECT_TRUE(std::regex_match(moved.filename().string(),
                               std::regex(R"(report_\d{8}_\d{6}\.pdf)")));
  EXPECT_EQ(read_all(target_dir_ / "report.pdf"), "original");
  EXPECT_EQ(read_all(moved), "newer");
  EXPECT_FALSE(std::filesystem::exists(source));
}

TEST_F(FileMoverTest, NumberedPolicyCountsUp) {
  TestUtilities::write_file(target_dir_ / "notes.txt", "0");
  TestUtilities::write_file(target_dir_ / "notes_1.txt", "1");
  auto source = source_dir_ / "notes.txt";
  TestUtilities::write_file(source, "2");

  MovedPath moved = mover_.move(source, target_dir_, CollisionPolicy::NumberedSuffix);

  EXPECT_EQ(moved, target_dir_ / "notes_2.txt");
  EXPECT_EQ(read_all(target_dir_ / "notes_1.txt"), "1");
}

TEST_F(FileMoverTest, MissingSourceThrowsMoveError) {
  try {
    mover_.move(source_dir_ / "missing.pdf", target_dir_);
    FAIL() << "Expected MoveError";
  } catch (const MoveError& e) {
    EXPECT_EQ(e.kind(), PipelineErrorKind::MoveError);
    EXPECT_TRUE(static_cast<bool>(e.cause()));
  }
}

TEST_F(FileMoverTest, ExhaustedAttemptsThrowAndKeepSource) {
  FileMover one_shot(1);
  TestUtilities::write_file(target_dir_ / "a.pdf", "existing");
  auto source = source_dir_ / "a.pdf";
  TestUtilities::write_file(source, "incoming");

  EXPECT_THROW(one_shot.move(source, target_dir_), MoveError);
  EXPECT_TRUE(std::filesystem::exists(source));
  EXPECT_EQ(read_all(target_dir_ / "a.pdf"), "existing");
}

TEST_F(FileMoverTest, CopyAcrossVolumesKeepsContentAndModificationTime) {
  auto source = source_dir_ / "invoice.pdf";
  TestUtilities::write_file(source, "invoice body");
  const auto original_mtime = std::filesystem::last_write_time(source) - std::chrono::hours(36);
  std::filesystem::last_write_time(source, original_mtime);

  CrossVolumeMover mover;
  MovedPath moved = mover.move(source, target_dir_);

  EXPECT_EQ(moved, target_dir_ / "invoice.pdf");
  EXPECT_FALSE(std::filesystem::exists(source));
  EXPECT_EQ(read_all(moved), "invoice body");
  EXPECT_EQ(std::filesystem::last_write_time(moved), original_mtime);
  EXPECT_EQ(directory_names(target_dir_), std::vector<std::string>{"invoice.pdf"});
}

TEST_F(FileMoverTest, FailedCopyLeavesNothingInTargetAndKeepsSource) {
  auto source = source_dir_ / "invoice.pdf";
  TestUtilities::write_file(source, "invoice body");

  CrossVolumeMover mover;
  mover.fail_copy = true;

  try {
    mover.move(source, target_dir_);
    FAIL() << "Expected MoveError";
  } catch (const MoveError& e) {
    EXPECT_EQ(e.cause(), std::make_error_code(std::errc::no_space_on_device));
  }

  EXPECT_TRUE(directory_names(target_dir_).empty());
  EXPECT_EQ(read_all(source), "invoice body");
}

TEST_F(FileMoverTest, CopyWithoutLinkSupportRenamesIntoFreeName) {
  auto existing = target_dir_ / "invoice.pdf";
  std::filesystem::create_directories(target_dir_);
  TestUtilities::write_file(existing, "older invoice");
  auto source = source_dir_ / "invoice.pdf";
  TestUtilities::write_file(source, "newer invoice");

  CrossVolumeMover mover;
  mover.links_supported = false;
  MovedPath moved = mover.move(source, target_dir_, CollisionPolicy::NumberedSuffix);

  EXPECT_EQ(moved, target_dir_ / "invoice_1.pdf");
  EXPECT_EQ(read_all(existing), "older invoice");
  EXPECT_EQ(read_all(moved), "newer invoice");
  EXPECT_FALSE(std::filesystem::exists(source));
  EXPECT_EQ(directory_names(target_dir_).size(), 2u);
}

TEST(FileMoverCandidateTest, CandidateNames) {
  auto now = TestUtilities::make_local_time(2024, 3, 5, 10, 4, 9);
  const std::filesystem::path dir = "/data/x";

  EXPECT_EQ(FileMover::candidate_path(dir, "a.tar.gz", CollisionPolicy::Timestamp, 0, now),
            dir / "a.tar.gz");
  EXPECT_EQ(FileMover::candidate_path(dir, "a.pdf", CollisionPolicy::Timestamp, 1, now),
            dir / "a_20240305_100409.pdf");
  EXPECT_EQ(FileMover::candidate_path(dir, "a.pdf", CollisionPolicy::Timestamp, 3, now),
            dir / "a_20240305_100409_3.pdf");
  EXPECT_EQ(FileMover::candidate_path(dir, "README", CollisionPolicy::NumberedSuffix, 2, now),
            dir / "README_2");
}

TEST(FileMoverCandidateTest, RejectsZeroAttempts) {
  EXPECT_THROW(FileMover(0), std::invalid_argument);
}

}  // namespace autofile_tests
