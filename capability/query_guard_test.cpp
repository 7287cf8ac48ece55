#include "capability/query_guard.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;
using capability::CheckQuery;

class MockDatabase : public capability::Database {
 public:
  MOCK_METHOD2(Query, std::vector<proto::Row>(const std::string&,
                                               const proto::ValueDict&));
  MOCK_METHOD0(Tables, std::vector<std::string>());
  MOCK_METHOD1(Schema, std::vector<proto::Row>(const std::string&));
};

TEST(QueryGuardTest, AcceptsReadsAndFilteredWrites) {
  std::string error;
  EXPECT_TRUE(CheckQuery("SELECT * FROM users WHERE id = :id", &error));
  EXPECT_TRUE(CheckQuery("  select 1", &error));
  EXPECT_TRUE(CheckQuery("UPDATE t SET a = 1 WHERE id = 2", &error));
  EXPECT_TRUE(CheckQuery("delete from t where id in (1, 2)", &error));
  EXPECT_TRUE(CheckQuery("INSERT INTO t VALUES ('drop table x')", &error));
}

TEST(QueryGuardTest, RejectsAdministrativeStatements) {
  std::string error;
  EXPECT_FALSE(CheckQuery("DROP TABLE users", &error));
  EXPECT_THAT(error, HasSubstr("DROP"));
  EXPECT_FALSE(CheckQuery("  alter table t add column c int", &error));
  EXPECT_FALSE(CheckQuery("/* hi */ TRUNCATE t", &error));
  EXPECT_FALSE(CheckQuery("-- comment\nGRANT ALL ON t TO bob", &error));
  EXPECT_FALSE(CheckQuery("SELECT 1; DROP TABLE t", &error));
  EXPECT_FALSE(CheckQuery("PRAGMA table_info(t)", &error));
  EXPECT_FALSE(CheckQuery("   ", &error));
}

TEST(QueryGuardTest, RejectsUnfilteredWrites) {
  std::string error;
  EXPECT_FALSE(CheckQuery("DELETE FROM users", &error));
  EXPECT_THAT(error, HasSubstr("WHERE"));
  EXPECT_FALSE(CheckQuery("UPDATE users SET admin = 1", &error));
  EXPECT_FALSE(CheckQuery("UPDATE users SET note = 'where'", &error));
}

TEST(QueryGuardTest, GuardedDatabaseCapsRows) {
  auto mock = std::make_shared<MockDatabase>();
  std::vector<proto::Row> rows(5);
  EXPECT_CALL(*mock, Query("SELECT * FROM t", _)).WillOnce(Return(rows));
  capability::GuardedDatabase guarded(mock, 3);
  EXPECT_EQ(guarded.Query("SELECT * FROM t", proto::ValueDict()).size(), 3);
}

TEST(QueryGuardTest, GuardedDatabaseNeverForwardsRejectedQueries) {
  auto mock = std::make_shared<MockDatabase>();
  EXPECT_CALL(*mock, Query(_, _)).Times(0);
  EXPECT_CALL(*mock, Tables())
      .WillOnce(Return(std::vector<std::string>{"a", "b"}));
  capability::GuardedDatabase guarded(mock, 10);
  EXPECT_THROW(guarded.Query("DROP TABLE t", proto::ValueDict()),
               capability::database_error);
  EXPECT_EQ(guarded.Tables().size(), 2);
}

TEST(QueryGuardTest, SchemaRowsAreCapped) {
  auto mock = std::make_shared<MockDatabase>();
  EXPECT_CALL(*mock, Schema("t"))
      .WillOnce(Return(std::vector<proto::Row>(4)));
  capability::GuardedDatabase guarded(mock, 2);
  EXPECT_EQ(guarded.Schema("t").size(), 2);
}

TEST(QueryGuardTest, EveryQueryIsLogged) {
  auto mock = std::make_shared<MockDatabase>();
  EXPECT_CALL(*mock, Query("SELECT 1", _))
      .WillRepeatedly(Return(std::vector<proto::Row>()));
  capability::GuardedDatabase guarded(mock, 10, "acme");
  proto::ValueDict params;
  params.add_entry()->mutable_key()->set_str_value("id");
  guarded.Query("SELECT 1", params);
  EXPECT_THROW(guarded.Query("DELETE FROM t", proto::ValueDict()),
               capability::database_error);
  std::vector<proto::QueryRecord> log = guarded.QueryLog();
  ASSERT_EQ(log.size(), 2);
  EXPECT_EQ(log[0].query(), "SELECT 1");
  EXPECT_EQ(log[0].tenant_id(), "acme");
  EXPECT_EQ(log[0].params().entry(0).key().str_value(), "id");
  EXPECT_TRUE(log[0].accepted());
  EXPECT_FALSE(log[1].accepted());
  EXPECT_THAT(log[1].error(), HasSubstr("WHERE"));

  for (size_t i = 0; i < capability::kMaxQueryLog; i++)
    guarded.Query("SELECT 1", proto::ValueDict());
  log = guarded.QueryLog();
  ASSERT_EQ(log.size(), capability::kMaxQueryLog);
  EXPECT_TRUE(log.front().accepted());
  EXPECT_EQ(log.back().query(), "SELECT 1");
}

}  // namespace
