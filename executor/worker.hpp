#ifndef EXECUTOR_WORKER_HPP
#define EXECUTOR_WORKER_HPP

#include <string>
#include <vector>

#include "capability/database.hpp"
#include "proto/channel.pb.h"

namespace executor {

// Exit statuses of codebox-worker other than 0.
static const constexpr int kWorkerExitProtocol = 2;
static const constexpr int kWorkerExitMemory = 3;
static const constexpr int kWorkerExitInterrupted = 4;

// The database as seen from inside the sandbox: every call is a round trip
// to the supervisor over the channel.
class ChannelDatabase : public capability::Database {
 public:
  explicit ChannelDatabase(int fd) : fd_(fd) {}

  std::vector<proto::Row> Query(const std::string& query,
                                const proto::ValueDict& params) override;
  std::vector<std::string> Tables() override;
  std::vector<proto::Row> Schema(const std::string& table) override;

 private:
  proto::DatabaseReply Call(const proto::DatabaseCall& call);
  int fd_;
};

// Reads a WorkerRequest from fd, runs it in this process and writes the
// ExecutionReport back. Debug events, variable snapshots and database calls
// travel on the same channel while the script runs. Returns the exit status
// of the worker.
int RunWorker(int fd);

}  // namespace executor

#endif
