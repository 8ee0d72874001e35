#include <gtest/gtest.h>

#include "autofile_core/services/folder_browser.hpp"
#include "utilities_test.hpp"

namespace autofile_tests {

using namespace autofile_core;

class FolderBrowserTest : public TempDirTestBase {
 protected:
  void SetUp() override {
    TempDirTestBase::SetUp();
    std::filesystem::create_directories(temp_dir_ / "beta");
    std::filesystem::create_directories(temp_dir_ / "Acme" / "P100");
    std::filesystem::create_directories(temp_dir_ / ".cache");
    TestUtilities::write_file(temp_dir_ / "readme.txt", "not a folder");
    browser_ = std::make_unique<FolderBrowser>(temp_dir_);
  }

  std::unique_ptr<FolderBrowser> browser_;
};

TEST_F(FolderBrowserTest, ListsVisibleFoldersCaseInsensitively) {
  auto names = browser_->list_subfolders();
  ASSERT_EQ(names.size(), 2u);
  EXPECT_EQ(names[0], "Acme");
  EXPECT_EQ(names[1], "beta");
}

TEST_F(FolderBrowserTest, ListsNestedFolder) {
  auto names = browser_->list_subfolders("Acme");
  ASSERT_EQ(names.size(), 1u);
  EXPECT_EQ(names[0], "P100");
}

TEST_F(FolderBrowserTest, RejectsPathsOutsideRoot) {
  EXPECT_THROW(browser_->resolve("../elsewhere"), FolderBrowserError);
  EXPECT_THROW(browser_->resolve("Acme/../../elsewhere"), FolderBrowserError);
  EXPECT_THROW(browser_->resolve("/etc"), FolderBrowserError);
  EXPECT_EQ(browser_->resolve("Acme/../beta"), browser_->root() / "beta");
}

TEST_F(FolderBrowserTest, ListingAFileOrMissingFolderThrows) {
  EXPECT_THROW(browser_->list_subfolders("readme.txt"), FolderBrowserError);
  EXPECT_THROW(browser_->list_subfolders("nope"), FolderBrowserError);
}

TEST_F(FolderBrowserTest, CreatesSanitizedSubfolder) {
  auto created = browser_->create_subfolder("Acme", "  Q3: report?  ");
  EXPECT_EQ(created, browser_->root() / "Acme" / "Q3 report");
  EXPECT_TRUE(std::filesystem::is_directory(created));

  // Existing folder is not an error
  EXPECT_NO_THROW(browser_->create_subfolder("Acme", "Q3 report"));
}

TEST_F(FolderBrowserTest, RejectsEmptyFolderNames) {
  EXPECT_THROW(browser_->create_subfolder("", "   "), FolderBrowserError);
  EXPECT_THROW(browser_->create_subfolder("", "???"), FolderBrowserError);
  EXPECT_THROW(browser_->create_subfolder("", ".."), FolderBrowserError);
}

TEST(FolderBrowserSanitizeTest, DropsReservedCharacters) {
  EXPECT_EQ(FolderBrowser::sanitize_folder_name("a<b>c:d\"e/f\\g|h?i*j"), "abcdefghij");
  EXPECT_EQ(FolderBrowser::sanitize_folder_name("\tplain\n"), "plain");
}

}  // namespace autofile_tests
