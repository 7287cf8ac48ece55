#ifndef CAPABILITY_DATABASE_HPP
#define CAPABILITY_DATABASE_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include "proto/channel.pb.h"
#include "proto/value.pb.h"

namespace capability {

class database_error : public std::runtime_error {
 public:
  explicit database_error(const std::string& msg) : std::runtime_error(msg) {}
};

// Query access to a tenant database, injected by the embedder. Sandboxed
// code reaches it only through db_query(), db_tables() and db_schema().
// Implementations report failures by throwing database_error.
class Database {
 public:
  virtual ~Database() = default;
  virtual std::vector<proto::Row> Query(const std::string& query,
                                        const proto::ValueDict& params) = 0;
  virtual std::vector<std::string> Tables() = 0;
  // One row per column of the table.
  virtual std::vector<proto::Row> Schema(const std::string& table) = 0;
};

}  // namespace capability

#endif
