#include "executor/worker.hpp"

#include <signal.h>
#include <stdio.h>
#include <sys/resource.h>
#include <unistd.h>

#include <memory>
#include <new>

#include "capability/output.hpp"
#include "capability/surface.hpp"
#include "capability/value_codec.hpp"
#include "debugger/debugger.hpp"
#include "policy/config.hpp"
#include "script/interpreter.hpp"
#include "util/channel.hpp"
#include "util/misc.hpp"
#include "validator/validator.hpp"

namespace {

// Released when an allocation fails, so that the report can still be built.
static const constexpr size_t kReserveBytes = 4 << 20;

// Budgets keeping the report well under the channel's frame size.
static const constexpr size_t kMaxResultBytes = 4 << 20;
static const constexpr size_t kMaxVariableBytes = 4 << 20;
static const constexpr size_t kMaxSessionBytes = 16 << 20;

// Caps the address space at what the worker maps now plus max_memory_mb.
bool LimitAddressSpace(int64_t max_memory_mb) {
  FILE* statm = fopen("/proc/self/statm", "r");
  if (!statm) return false;
  long long pages = 0;
  bool ok = fscanf(statm, "%lld", &pages) == 1;
  fclose(statm);
  if (!ok) return false;
  struct rlimit rlim;
  rlim.rlim_cur = rlim.rlim_max =
      pages * sysconf(_SC_PAGESIZE) + (max_memory_mb << 20);
  return setrlimit(RLIMIT_AS, &rlim) == 0;
}

void OnTerminate(int) { script::Interpreter::RequestInterrupt(); }

// The pieces the script can observe, plus the channel they report to.
class Session {
 public:
  Session(int fd, const proto::WorkerRequest& request)
      : fd_(fd),
        config_(policy::SandboxConfig::FromProto(request.config())),
        stdout_(config_.max_output_bytes),
        stderr_(config_.max_output_bytes),
        debugger_(
            [this](const proto::DebugEvent& event) {
              proto::ChildMessage message;
              *message.mutable_debug_event() = event;
              Send(message);
            },
            [this](const proto::VariableSnapshot& snapshot) {
              proto::ChildMessage message;
              *message.mutable_variable_snapshot() = snapshot;
              Send(message);
            }),
        database_(request.has_database() ? new executor::ChannelDatabase(fd)
                                         : nullptr),
        surface_(config_, &stdout_, &debugger_, database_.get()),
        interpreter_(config_.max_recursion_depth) {
    surface_.Install(&interpreter_);
    for (const proto::SessionVariable& global : request.global())
      interpreter_.SetGlobal(global.name(), capability::FromProto(global.value()));
  }

  const policy::SandboxConfig& config() const { return config_; }
  bool channel_broken() const { return channel_broken_; }

  void Debug(const std::string& message, proto::DebugLevel level,
             const std::string& data = "") {
    if (config_.enable_debugging) debugger_.Log(message, level, data);
  }

  void Run(std::shared_ptr<const script::ast::Module> program) {
    interpreter_.Run(std::move(program));
  }

  // Records an uncaught script error in stderr and in the debug events.
  void Fail(const script::ScriptError& error, proto::ExecutionReport* report) {
    std::string traceback = error.Traceback();
    stderr_.Write(traceback);
    report->set_error(std::string("Execution error: ") + error.what());
    report->set_error_type(error.type());
    script::Value data = script::Value::NewDict();
    data.dict().Set(script::Value::Str("exception_type"),
                    script::Value::Str(error.type()));
    data.dict().Set(script::Value::Str("traceback"),
                    script::Value::Str(traceback));
    Debug("Execution failed: " + report->error(), proto::LEVEL_ERROR,
          script::Repr(data));
  }

  // Fills the captured output, and on success the result and the
  // variables to keep for the next execution.
  void Finish(bool completed, proto::ExecutionReport* report) {
    report->set_completed(completed);
    report->set_stdout(stdout_.contents());
    report->set_stdout_truncated(stdout_.truncated());
    report->set_stderr(stderr_.contents());
    report->set_stderr_truncated(stderr_.truncated());
    if (!completed) return;
    std::string error;
    size_t session_bytes = 0;
    for (const auto& global : interpreter_.globals()) {
      if (global.first.compare(0, 2, "__") == 0) continue;
      proto::Value value;
      // Functions and modules stay behind.
      if (!capability::ToProto(global.second, &value, &error)) continue;
      size_t size = value.ByteSizeLong();
      if (size > kMaxVariableBytes ||
          session_bytes + size > kMaxSessionBytes) {
        Debug("Variable " + global.first + " is too large to be kept",
              proto::LEVEL_WARNING);
        continue;
      }
      session_bytes += size;
      proto::SessionVariable* variable = report->add_session();
      variable->set_name(global.first);
      *variable->mutable_value() = std::move(value);
    }
    script::Value result;
    if (interpreter_.GetGlobal("__result__", &result)) {
      proto::Value* encoded = report->mutable_result();
      if (!capability::ToProto(result, encoded, &error) ||
          encoded->ByteSizeLong() > kMaxResultBytes)
        encoded->set_str_value(
            util::Truncate(script::Repr(result), kMaxResultBytes));
    }
  }

  bool Send(const proto::ChildMessage& message) {
    std::string error;
    if (!util::WriteMessage(fd_, message, &error)) channel_broken_ = true;
    return !channel_broken_;
  }

 private:
  int fd_;
  policy::SandboxConfig config_;
  capability::OutputBuffer stdout_;
  capability::OutputBuffer stderr_;
  debugger::Debugger debugger_;
  std::unique_ptr<capability::Database> database_;
  capability::CapabilitySurface surface_;
  script::Interpreter interpreter_;
  bool channel_broken_ = false;
};

}  // namespace

namespace executor {

proto::DatabaseReply ChannelDatabase::Call(const proto::DatabaseCall& call) {
  proto::ChildMessage message;
  *message.mutable_database_call() = call;
  std::string error;
  if (!util::WriteMessage(fd_, message, &error))
    throw capability::database_error("database unavailable: " + error);
  proto::DatabaseReply reply;
  if (util::ReadMessage(fd_, &reply, &error) != util::ReadStatus::kMessage)
    throw capability::database_error("database unavailable: " + error);
  if (!reply.ok()) throw capability::database_error(reply.error());
  return reply;
}

std::vector<proto::Row> ChannelDatabase::Query(const std::string& query,
                                               const proto::ValueDict& params) {
  proto::DatabaseCall call;
  call.set_kind(proto::DatabaseCall::QUERY);
  call.set_query(query);
  *call.mutable_params() = params;
  proto::DatabaseReply reply = Call(call);
  return std::vector<proto::Row>(reply.row().begin(), reply.row().end());
}

std::vector<std::string> ChannelDatabase::Tables() {
  proto::DatabaseCall call;
  call.set_kind(proto::DatabaseCall::TABLES);
  proto::DatabaseReply reply = Call(call);
  return std::vector<std::string>(reply.table().begin(), reply.table().end());
}

std::vector<proto::Row> ChannelDatabase::Schema(const std::string& table) {
  proto::DatabaseCall call;
  call.set_kind(proto::DatabaseCall::SCHEMA);
  call.set_table(table);
  proto::DatabaseReply reply = Call(call);
  return std::vector<proto::Row>(reply.row().begin(), reply.row().end());
}

int RunWorker(int fd) {
  proto::WorkerRequest request;
  std::string error;
  if (util::ReadMessage(fd, &request, &error) != util::ReadStatus::kMessage)
    return kWorkerExitProtocol;

  struct sigaction action = {};
  action.sa_handler = OnTerminate;
  sigemptyset(&action.sa_mask);
  if (sigaction(SIGTERM, &action, nullptr) == -1) return kWorkerExitProtocol;

  std::unique_ptr<char[]> reserve(new char[kReserveBytes]);
  Session session(fd, request);
  if (!LimitAddressSpace(session.config().max_memory_mb))
    return kWorkerExitProtocol;

  proto::ChildMessage message;
  proto::ExecutionReport* report = message.mutable_report();
  int status = 0;
  try {
    validator::ValidationError validation;
    std::shared_ptr<const script::ast::Module> program;
    if (!validator::Validate(request.source(), session.config(), &validation,
                             &program)) {
      report->set_error(validation.message);
      report->set_error_type("ValidationError");
      session.Finish(false, report);
    } else {
      session.Debug("Starting code execution", proto::LEVEL_INFO);
      try {
        session.Run(std::move(program));
        session.Debug("Code execution completed", proto::LEVEL_INFO);
        session.Finish(true, report);
      } catch (const script::ScriptError& e) {
        session.Fail(e, report);
        session.Finish(false, report);
      } catch (const script::Interrupted&) {
        report->set_error("Execution terminated");
        report->set_error_type("Interrupted");
        session.Finish(false, report);
        status = kWorkerExitInterrupted;
      }
    }
  } catch (const std::bad_alloc&) {
    reserve.reset();
    message.Clear();
    report = message.mutable_report();
    report->set_error_type("MemoryError");
    session.Finish(false, report);
    status = kWorkerExitMemory;
  }
  if (!session.Send(message) || session.channel_broken())
    return kWorkerExitProtocol;
  return status;
}

}  // namespace executor
