#ifndef CAPABILITY_QUERY_GUARD_HPP
#define CAPABILITY_QUERY_GUARD_HPP

#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "capability/database.hpp"
#include "proto/sandbox.pb.h"

namespace capability {

// Returns false and sets error_msg if the statement starts with a
// schema-changing or administrative keyword, or is an UPDATE or DELETE
// without a WHERE clause.
bool CheckQuery(const std::string& query, std::string* error_msg);

static const constexpr size_t kMaxQueryLog = 1000;

// Applies CheckQuery to every query and caps the number of returned rows.
// Every query is recorded, rejected ones included; the log keeps the most
// recent kMaxQueryLog entries.
class GuardedDatabase : public Database {
 public:
  GuardedDatabase(std::shared_ptr<Database> database, size_t max_rows,
                  std::string tenant_id = "")
      : database_(std::move(database)),
        max_rows_(max_rows),
        tenant_id_(std::move(tenant_id)) {}

  std::vector<proto::Row> Query(const std::string& query,
                                const proto::ValueDict& params) override;
  std::vector<std::string> Tables() override { return database_->Tables(); }
  std::vector<proto::Row> Schema(const std::string& table) override;

  std::vector<proto::QueryRecord> QueryLog() const;

 private:
  std::shared_ptr<Database> database_;
  size_t max_rows_;
  std::string tenant_id_;

  mutable absl::Mutex mutex_;
  std::deque<proto::QueryRecord> log_ GUARDED_BY(mutex_);
};

}  // namespace capability

#endif
