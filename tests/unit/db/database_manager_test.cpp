#include <gtest/gtest.h>
#include <sqlite_modern_cpp.h>
#include <string>

#include "../../common/utilities_test.hpp"
#include "autofile_core/db/pooled_connection.hpp"

namespace autofile_core {

class DatabaseManagerTest : public autofile_tests::JournalTestBase {};

TEST_F(DatabaseManagerTest, CreatesSchema_OnInitialization) {
  PooledConnection conn(*db_manager_);
  int count = 0;
  *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name='move_journal'" >> count;
  EXPECT_EQ(count, 1);
}

TEST_F(DatabaseManagerTest, HasJournalIndex) {
  PooledConnection conn(*db_manager_);
  int idx_count = 0;
  *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='index' AND "
           "name='idx_move_journal_status_created'" >> idx_count;
  EXPECT_EQ(idx_count, 1);
}

TEST_F(DatabaseManagerTest, SecondInitializeIsNoOp) {
  EXPECT_TRUE(db_manager_->is_initialized());
  EXPECT_NO_THROW(db_manager_->initialize(temp_db_path_, 1));
  PooledConnection conn(*db_manager_);
}

TEST_F(DatabaseManagerTest, GetConnectionAfterShutdownThrows) {
  db_manager_->shutdown();
  EXPECT_FALSE(db_manager_->is_initialized());
  EXPECT_THROW(db_manager_->get_connection(), std::runtime_error);
}

TEST_F(DatabaseManagerTest, CreatesMissingParentDirectories) {
  auto nested = temp_dir_ / "a" / "b" / "journal.db";
  DatabaseManager mgr;
  mgr.initialize(nested, 1);
  EXPECT_TRUE(std::filesystem::exists(nested));
  mgr.shutdown();
}

}  // namespace autofile_core
