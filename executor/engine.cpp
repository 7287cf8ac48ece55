#include "executor/engine.hpp"

#include <errno.h>
#include <limits.h>
#include <signal.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <functional>
#include <stdexcept>
#include <thread>

#include "absl/strings/str_cat.h"
#include "executor/worker.hpp"
#include "glog/logging.h"
#include "proto/channel.pb.h"
#include "sandbox/sandbox.hpp"
#include "util/channel.hpp"
#include "util/flags.hpp"
#include "util/misc.hpp"
#include "util/which.hpp"
#include "validator/validator.hpp"

namespace {

static const constexpr char kWorkerName[] = "codebox-worker";

// What the channel carried during one execution. Written by the serving
// thread, read after it has been joined.
struct ChannelState {
  bool has_report = false;
  proto::ExecutionReport report;
  std::string error;
};

proto::DatabaseReply Answer(const proto::DatabaseCall& call,
                            capability::Database* database) {
  proto::DatabaseReply reply;
  if (!database) {
    reply.set_error("no database is available");
    return reply;
  }
  try {
    switch (call.kind()) {
      case proto::DatabaseCall::QUERY:
        for (proto::Row& row : database->Query(call.query(), call.params()))
          *reply.add_row() = std::move(row);
        break;
      case proto::DatabaseCall::TABLES:
        for (const std::string& table : database->Tables())
          reply.add_table(table);
        break;
      case proto::DatabaseCall::SCHEMA:
        for (proto::Row& row : database->Schema(call.table()))
          *reply.add_row() = std::move(row);
        break;
      default:
        reply.set_error("unknown database call");
        return reply;
    }
  } catch (const std::exception& e) {
    reply.Clear();
    reply.set_error(e.what());
    return reply;
  }
  reply.set_ok(true);
  return reply;
}

// Sends the request to the worker, then serves it until it closes the
// channel.
void Serve(int fd, const proto::WorkerRequest& request,
           capability::Database* database, debugger::Debugger* debugger,
           ChannelState* state) {
  if (!util::WriteMessage(fd, request, &state->error)) return;
  while (true) {
    proto::ChildMessage message;
    switch (util::ReadMessage(fd, &message, &state->error)) {
      case util::ReadStatus::kClosed:
        return;
      case util::ReadStatus::kError:
        return;
      case util::ReadStatus::kMessage:
        break;
    }
    switch (message.kind_case()) {
      case proto::ChildMessage::kDatabaseCall:
        if (!util::WriteMessage(fd, Answer(message.database_call(), database),
                                &state->error))
          return;
        break;
      case proto::ChildMessage::kDebugEvent:
        if (debugger) debugger->Append(std::move(*message.mutable_debug_event()));
        break;
      case proto::ChildMessage::kVariableSnapshot:
        if (debugger)
          debugger->AppendSnapshot(
              std::move(*message.mutable_variable_snapshot()));
        break;
      case proto::ChildMessage::kReport:
        state->has_report = true;
        state->report = std::move(*message.mutable_report());
        break;
      default:
        state->error = "unexpected message from the worker";
        return;
    }
  }
}

void SetError(proto::Status status, proto::ErrorKind kind,
              const std::string& error, proto::ExecutionResult* result) {
  result->set_status(status);
  result->set_error_kind(kind);
  result->set_error(error);
}

}  // namespace

namespace executor {

bool StatusTracker::IsTerminal(proto::Status status) {
  return status == proto::COMPLETED || status == proto::FAILED ||
         status == proto::TIMEOUT || status == proto::CANCELLED;
}

bool StatusTracker::CanTransition(proto::Status from, proto::Status to) {
  switch (from) {
    case proto::CREATED:
      return to == proto::RUNNING || to == proto::CANCELLED;
    case proto::RUNNING:
      return IsTerminal(to);
    case proto::COMPLETED:
    case proto::FAILED:
    case proto::TIMEOUT:
      return to == proto::RUNNING;
    default:
      return false;
  }
}

void StatusTracker::Transition(proto::Status to) {
  if (!CanTransition(status_, to))
    throw std::logic_error(absl::StrCat("illegal status transition ",
                                        proto::Status_Name(status_), " -> ",
                                        proto::Status_Name(to)));
  status_ = to;
}

std::string FindWorker() {
  if (!FLAGS_worker_path.empty()) return FLAGS_worker_path;
  char self[PATH_MAX] = {};
  ssize_t len = readlink("/proc/self/exe", self, sizeof(self) - 1);
  if (len > 0) {
    std::string dir(self, len);
    dir = dir.substr(0, dir.rfind('/') + 1);
    std::string candidate = dir + kWorkerName;
    if (access(candidate.c_str(), X_OK) == 0) return candidate;
  }
  return util::which(kWorkerName);
}

proto::ExecutionResult ExecutionEngine::Execute(
    const ExecutionRequest& request,
    std::map<std::string, proto::Value>* session) const {
  CHECK(request.config != nullptr);
  const policy::SandboxConfig& config = *request.config;
  proto::ExecutionResult result;
  result.set_execution_id(request.execution_id);
  result.set_instance_id(request.instance_id);
  result.set_tenant_id(request.tenant_id);
  result.set_created_at_millis(util::NowMillis());
  StatusTracker status;
  status.Transition(proto::RUNNING);

  auto finish = [&](proto::Status final_status) {
    status.Transition(final_status);
    result.set_status(final_status);
    if (config.enable_debugging && request.debugger)
      *result.mutable_debug_summary() = request.debugger->Summary();
    result.set_completed_at_millis(util::NowMillis());
    LOG(INFO) << "Execution " << request.execution_id << " of sandbox "
              << request.instance_id << ": " << proto::Status_Name(final_status)
              << " in " << result.execution_time() << "s";
    return result;
  };

  validator::ValidationError validation;
  if (!validator::Validate(request.source, config, &validation)) {
    VLOG(1) << "Execution " << request.execution_id << " rejected: "
            << validation.message;
    SetError(proto::FAILED, proto::VALIDATION_ERROR,
             "Code validation failed: " + validation.message, &result);
    return finish(proto::FAILED);
  }

  std::shared_ptr<sandbox::ExecutionControl> control = request.control;
  if (!control) control = std::make_shared<sandbox::ExecutionControl>();
  if (control->termination() == sandbox::Termination::kCancelled) {
    SetError(proto::CANCELLED, proto::CANCELLED_BY_CLIENT,
             "Execution cancelled", &result);
    return finish(proto::CANCELLED);
  }

  proto::WorkerRequest worker_request;
  *worker_request.mutable_config() = config.ToProto();
  worker_request.set_source(request.source);
  for (const auto& global : request.globals) {
    proto::SessionVariable* variable = worker_request.add_global();
    variable->set_name(global.first);
    *variable->mutable_value() = global.second;
  }
  worker_request.set_has_database(request.database != nullptr);

  auto start = std::chrono::steady_clock::now();
  auto record_time = [&]() {
    result.set_execution_time(
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start)
            .count());
  };

  int fds[2];
  if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == -1) {
    PLOG(ERROR) << "socketpair";
    SetError(proto::FAILED, proto::INTERNAL_ERROR,
             absl::StrCat("socketpair: ", strerror(errno)), &result);
    record_time();
    return finish(proto::FAILED);
  }

  ChannelState channel;
  std::thread server(Serve, fds[0], std::cref(worker_request),
                     request.database, request.debugger, &channel);

  sandbox::ExecutionOptions options("/", options_.worker_path);
  options.wall_limit_millis =
      static_cast<int64_t>(config.max_execution_time * 1000);
  options.cpu_limit_millis = options.wall_limit_millis;
  options.max_files = config.max_open_files;
  // RLIMIT_NPROC counts every process of the user, so max_processes is
  // enforced by the resource monitor per session instead.
  options.channel_fd = fds[1];
  options.kill_grace_millis = options_.kill_grace_millis;
  options.control = control;

  sandbox::ExecutionInfo info;
  std::string error_msg;
  std::unique_ptr<sandbox::Sandbox> box = sandbox::Sandbox::Create();
  bool started = box->Execute(options, &info, &error_msg);
  // The worker is gone: once our copy of its end is closed the serving
  // thread reads to the end of the channel and stops.
  close(fds[1]);
  server.join();
  close(fds[0]);
  record_time();

  result.set_memory_usage_kb(info.memory_usage_kb);
  result.set_cpu_time((info.cpu_time_millis + info.sys_time_millis) / 1000.0);
  if (channel.has_report) {
    result.set_stdout(channel.report.stdout());
    result.set_stderr(channel.report.stderr());
    result.set_stdout_truncated(channel.report.stdout_truncated());
    result.set_stderr_truncated(channel.report.stderr_truncated());
  }

  auto log_failure = [&]() {
    if (config.enable_debugging && request.debugger)
      request.debugger->Log("Execution failed: " + result.error(),
                            proto::LEVEL_ERROR);
  };

  if (!started) {
    LOG(ERROR) << "Could not start the worker for " << request.execution_id
               << ": " << error_msg;
    SetError(proto::FAILED, proto::INTERNAL_ERROR,
             "Failed to start the sandbox: " + error_msg, &result);
    return finish(proto::FAILED);
  }

  if (info.termination != sandbox::Termination::kNone) {
    result.set_termination_reason(info.termination_reason);
    switch (info.termination) {
      case sandbox::Termination::kCancelled:
        SetError(proto::CANCELLED, proto::CANCELLED_BY_CLIENT,
                 "Execution cancelled", &result);
        return finish(proto::CANCELLED);
      case sandbox::Termination::kTimeLimit:
        result.set_monitor_terminated(true);
        SetError(proto::TIMEOUT, proto::TIMEOUT_EXCEEDED,
                 absl::StrCat("Execution timeout after ",
                              config.max_execution_time, " seconds"),
                 &result);
        log_failure();
        return finish(proto::TIMEOUT);
      case sandbox::Termination::kMemoryLimit:
        result.set_monitor_terminated(true);
        SetError(proto::FAILED, proto::MEMORY_EXCEEDED,
                 absl::StrCat("Memory limit exceeded (", config.max_memory_mb,
                              " MB)"),
                 &result);
        log_failure();
        return finish(proto::FAILED);
      default:
        result.set_monitor_terminated(true);
        SetError(proto::FAILED, proto::MONITOR_TERMINATED,
                 "Terminated by the resource monitor: " +
                     info.termination_reason,
                 &result);
        log_failure();
        return finish(proto::FAILED);
    }
  }

  bool cpu_exhausted =
      info.signal == SIGXCPU ||
      (info.signal == SIGKILL &&
       info.cpu_time_millis + info.sys_time_millis >= options.cpu_limit_millis);
  if (info.wall_limit_exceeded || cpu_exhausted) {
    SetError(proto::TIMEOUT, proto::TIMEOUT_EXCEEDED,
             absl::StrCat("Execution timeout after ", config.max_execution_time,
                          " seconds"),
             &result);
    log_failure();
    return finish(proto::TIMEOUT);
  }

  if (info.signal == 0 && info.status_code == kWorkerExitMemory) {
    SetError(proto::FAILED, proto::MEMORY_EXCEEDED,
             absl::StrCat("Memory limit exceeded (", config.max_memory_mb,
                          " MB)"),
             &result);
    log_failure();
    return finish(proto::FAILED);
  }

  if (channel.has_report && info.signal == 0) {
    const proto::ExecutionReport& report = channel.report;
    if (report.completed() && info.status_code == 0) {
      if (report.has_result()) *result.mutable_result() = report.result();
      if (session) {
        session->clear();
        for (const proto::SessionVariable& variable : report.session())
          (*session)[variable.name()] = variable.value();
      }
      return finish(proto::COMPLETED);
    }
    SetError(proto::FAILED, proto::RUNTIME_FAULT, report.error(), &result);
    return finish(proto::FAILED);
  }

  std::string how = info.signal
                        ? absl::StrCat("killed by signal ", info.signal)
                        : absl::StrCat("exited with status ", info.status_code);
  LOG(WARNING) << "Worker of " << request.execution_id << " " << how
               << (channel.error.empty() ? "" : ": " + channel.error);
  SetError(proto::FAILED, proto::RUNTIME_FAULT,
           "Execution error: the sandboxed process " + how, &result);
  log_failure();
  return finish(proto::FAILED);
}

}  // namespace executor
