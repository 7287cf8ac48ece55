#include "capability/query_guard.hpp"

#include <set>

#include "absl/strings/ascii.h"
#include "absl/strings/str_split.h"
#include "glog/logging.h"
#include "util/misc.hpp"

namespace capability {

namespace {

const std::set<std::string>& ForbiddenKeywords() {
  static const std::set<std::string>* keywords = new std::set<std::string>{
      "DROP",  "ALTER",  "CREATE",   "TRUNCATE", "GRANT",
      "REVOKE", "SHUTDOWN", "EXEC",   "EXECUTE",  "ATTACH",
      "DETACH", "VACUUM", "PRAGMA",  "COPY"};
  return *keywords;
}

// Upper-cased words of the statement, with comments and string literals
// removed.
std::vector<std::string> Words(const std::string& query) {
  std::string clean;
  for (size_t i = 0; i < query.size(); i++) {
    char c = query[i];
    if (c == '-' && i + 1 < query.size() && query[i + 1] == '-') {
      while (i < query.size() && query[i] != '\n') i++;
      clean += ' ';
    } else if (c == '/' && i + 1 < query.size() && query[i + 1] == '*') {
      size_t end = query.find("*/", i + 2);
      i = end == std::string::npos ? query.size() : end + 1;
      clean += ' ';
    } else if (c == '\'' || c == '"') {
      size_t end = query.find(c, i + 1);
      i = end == std::string::npos ? query.size() : end;
      clean += " _ ";
    } else if (absl::ascii_isalnum(c) || c == '_') {
      clean += absl::ascii_toupper(c);
    } else {
      clean += ' ';
    }
  }
  return absl::StrSplit(clean, ' ', absl::SkipEmpty());
}

}  // namespace

bool CheckQuery(const std::string& query, std::string* error_msg) {
  std::vector<std::string> words = Words(query);
  if (words.empty()) {
    *error_msg = "empty query";
    return false;
  }
  // Statements separated by ';' are checked one by one.
  for (const auto& statement : absl::StrSplit(query, ';', absl::SkipWhitespace())) {
    std::vector<std::string> stmt_words = Words(std::string(statement));
    if (stmt_words.empty()) continue;
    const std::string& first = stmt_words[0];
    if (ForbiddenKeywords().count(first)) {
      *error_msg = first + " statements are not allowed";
      return false;
    }
    if (first == "UPDATE" || first == "DELETE") {
      bool has_where = false;
      for (const std::string& word : stmt_words) has_where |= word == "WHERE";
      if (!has_where) {
        *error_msg = first + " without a WHERE clause is not allowed";
        return false;
      }
    }
  }
  return true;
}

std::vector<proto::Row> GuardedDatabase::Query(
    const std::string& query, const proto::ValueDict& params) {
  proto::QueryRecord record;
  record.set_query(query);
  *record.mutable_params() = params;
  record.set_tenant_id(tenant_id_);
  record.set_timestamp_millis(util::NowMillis());
  std::string error;
  bool accepted = CheckQuery(query, &error);
  record.set_accepted(accepted);
  if (!accepted) record.set_error(error);
  {
    absl::MutexLock lock(&mutex_);
    if (log_.size() >= kMaxQueryLog) log_.pop_front();
    log_.push_back(std::move(record));
  }
  if (!accepted) {
    LOG(WARNING) << "Rejected database query: " << error;
    throw database_error(error);
  }
  std::vector<proto::Row> rows = database_->Query(query, params);
  if (rows.size() > max_rows_) rows.resize(max_rows_);
  return rows;
}

std::vector<proto::Row> GuardedDatabase::Schema(const std::string& table) {
  std::vector<proto::Row> rows = database_->Schema(table);
  if (rows.size() > max_rows_) rows.resize(max_rows_);
  return rows;
}

std::vector<proto::QueryRecord> GuardedDatabase::QueryLog() const {
  absl::MutexLock lock(&mutex_);
  return std::vector<proto::QueryRecord>(log_.begin(), log_.end());
}

}  // namespace capability
