#include <gtest/gtest.h>

#include "autofile_core/classifier.hpp"
#include "autofile_core/path_builder.hpp"
#include "utilities_test.hpp"

namespace autofile_tests {

using namespace autofile_core;

TEST(PathBuilderTest, ThreeLevelTitleEndToEnd) {
  auto labels = parse_label("[Acme][P100]Door sensor broken");
  ASSERT_TRUE(labels.has_value());

  auto plan = PathBuilder::build_destination(
      *labels, TestUtilities::make_local_time(2024, 3, 5, 10, 0), "/data");

  EXPECT_EQ(plan.target_directory,
            std::filesystem::path("/data/Acme/P100/Door sensor broken/20240305"));
  EXPECT_EQ(plan.levels, 3);
}

TEST(PathBuilderTest, TwoLevelTitleEndToEnd) {
  auto labels = parse_label("[Acme]Door sensor broken");
  ASSERT_TRUE(labels.has_value());

  auto plan = PathBuilder::build_destination(
      *labels, TestUtilities::make_local_time(2024, 3, 5, 10, 0), "/data");

  EXPECT_EQ(plan.target_directory, std::filesystem::path("/data/Acme/Door sensor broken/20240305"));
  EXPECT_EQ(plan.levels, 2);
}

TEST(PathBuilderTest, IdenticalInputsGiveIdenticalPlans) {
  Labels labels{{"Acme", "P100", "Door"}};
  auto when = TestUtilities::make_local_time(2023, 12, 31, 23, 59, 59);

  auto first = PathBuilder::build_destination(labels, when, "/data");
  for (int i = 0; i < 5; ++i) {
    EXPECT_EQ(PathBuilder::build_destination(labels, when, "/data").target_directory,
              first.target_directory);
  }
  EXPECT_EQ(first.target_directory.filename(), "20231231");
}

TEST(PathBuilderTest, RejectsWrongSegmentCount) {
  EXPECT_THROW(PathBuilder::build_destination(Labels{{"only"}}, std::chrono::system_clock::now(),
                                              "/data"),
               std::invalid_argument);
  EXPECT_THROW(PathBuilder::build_destination(Labels{{"a", "b", "c", "d"}},
                                              std::chrono::system_clock::now(), "/data"),
               std::invalid_argument);
}

TEST(PathBuilderTest, SanitizesSegments) {
  EXPECT_EQ(PathBuilder::sanitize_segment("  Door: open/close?  "), "Door_ open_close_");
  EXPECT_EQ(PathBuilder::sanitize_segment(".."), "_");
  EXPECT_EQ(PathBuilder::sanitize_segment("   "), "_");
  EXPECT_EQ(PathBuilder::sanitize_segment("tab\there"), "tab_here");

  auto plan = PathBuilder::build_destination(Labels{{"..", "a/b"}},
                                             TestUtilities::make_local_time(2024, 1, 2), "/data");
  EXPECT_EQ(plan.target_directory, std::filesystem::path("/data/_/a_b/20240102"));
}

TEST(PathBuilderTest, ReferenceTimeUsesFileMtime) {
  auto dir = TestUtilities::create_temp_dir("autofile_pathbuilder");
  auto file = dir / "a.pdf";
  TestUtilities::write_file(file, "x");
  auto when = TestUtilities::make_local_time(2024, 3, 5, 10, 0);
  TestUtilities::set_mtime(file, when);

  EXPECT_EQ(PathBuilder::format_date_folder(PathBuilder::reference_time_for(file)), "20240305");

  // Missing file falls back to now
  auto before = std::chrono::system_clock::now();
  auto fallback = PathBuilder::reference_time_for(dir / "missing.pdf");
  EXPECT_GE(fallback, before - std::chrono::seconds(1));

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

}  // namespace autofile_tests
