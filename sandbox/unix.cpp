#include "sandbox/unix.hpp"

#include <chrono>
#include <thread>

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "glog/logging.h"

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

// Upper bound on the descriptors closed in the child.
static const constexpr long kMaxCloseFd = 1 << 16;
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;

std::unique_ptr<Sandbox> Sandbox::Create() {
  return std::unique_ptr<Sandbox>(new Unix());
}

bool Unix::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                   std::string* error_msg) {
  options_ = &options;
  if (!Setup(error_msg)) return false;
  if (!DoFork(error_msg)) return false;
  if (!Wait(info, error_msg)) return false;
  return true;
}

bool Unix::Setup(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  if (pipe2(pipe_fds_, O_CLOEXEC) == -1) {
    *error_msg = "pipe2: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  // Arguments are prepared here, the child may not allocate.
  arg_storage_.clear();
  args_.clear();
  auto add_arg = [this](const std::string& arg) {
    arg_storage_.emplace_back(arg.begin(), arg.end());
    arg_storage_.back().push_back(0);
  };
  add_arg(options_->executable);
  for (const std::string& arg : options_->args) add_arg(arg);
  for (std::vector<char>& arg : arg_storage_) args_.push_back(arg.data());
  args_.push_back(nullptr);
  return true;
}

bool Unix::DoFork(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
    return false;
  }
  if (fork_result) {
    child_pid_ = fork_result;
    return true;
  }
  Child();
}

void Unix::Child() {
  close(pipe_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 2] = {};
    strncat(buf, prefix, 64);
    strncat(buf, ": ", 2);
    strncat(buf, err, kStrErrorBufSize);
    int len = strlen(buf);
    write(pipe_fds_[1], &len, sizeof(len));
    write(pipe_fds_[1], buf, len);
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));
  };

  // Change process group, so that we do not receive Ctrl-Cs in the terminal
  // and the whole group can be killed at once.
  if (setsid() == -1) die("setsid", errno);

  // The error pipe must not sit where the standard streams or the channel
  // go.
  if (pipe_fds_[1] <= kChannelFd) {
    int fd = fcntl(pipe_fds_[1], F_DUPFD_CLOEXEC, kChannelFd + 1);
    if (fd == -1) die("fcntl", errno);
    close(pipe_fds_[1]);
    pipe_fds_[1] = fd;
  }

  if (options_->channel_fd != -1) {
    if (options_->channel_fd == kChannelFd) {
      if (fcntl(kChannelFd, F_SETFD, 0) == -1) die("fcntl", errno);
    } else if (dup2(options_->channel_fd, kChannelFd) == -1) {
      die("redir channel", errno);
    }
  }

  auto open_or_null = [&die](const std::string& path, int flags) {
    int fd = path.empty() ? open("/dev/null", O_RDWR)
                          : open(path.c_str(), flags, S_IRUSR | S_IWUSR);
    if (fd == -1) die("open", errno);
    return fd;
  };
  int stdin_fd = open_or_null(options_->stdin_file, O_RDONLY);
  int stdout_fd =
      open_or_null(options_->stdout_file, O_WRONLY | O_CREAT | O_TRUNC);
  int stderr_fd =
      open_or_null(options_->stderr_file, O_WRONLY | O_CREAT | O_TRUNC);

  if (chdir(options_->root.c_str()) == -1) {
    die("chdir", errno);
  }

  // Handle I/O redirection.
#define DUP(field, fd)                                       \
  if (field##_fd != fd && dup2(field##_fd, fd) == -1) {      \
    die("redir " #field, errno);                             \
  }
  DUP(stdin, STDIN_FILENO);
  DUP(stdout, STDOUT_FILENO);
  DUP(stderr, STDERR_FILENO);
#undef DUP

  // Nothing inherited from the parent survives, except the channel.
  long max_fd = sysconf(_SC_OPEN_MAX);
  if (max_fd < 0 || max_fd > kMaxCloseFd) max_fd = kMaxCloseFd;
  int first_fd = options_->channel_fd != -1 ? kChannelFd + 1 : kChannelFd;
  for (int fd = first_fd; fd < max_fd; fd++) {
    if (fd != pipe_fds_[1]) close(fd);
  }

  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == -1) die("prctl", errno);

  // Set resource limits.
  struct rlimit rlim;
#define SET_RLIM(res, value)                    \
  {                                             \
    rlim_t lim = value;                         \
    if (lim) {                                  \
      rlim.rlim_cur = lim;                      \
      rlim.rlim_max = lim;                      \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        die("setrlim " #res, errno);            \
      }                                         \
    }                                           \
  }

  SET_RLIM(AS, options_->memory_limit_kb * 1024);
  SET_RLIM(CPU, (options_->cpu_limit_millis + 999) / 1000);
  SET_RLIM(FSIZE, options_->max_file_size_kb * 1024);
  SET_RLIM(NOFILE, options_->max_files);
  SET_RLIM(STACK, options_->max_stack_kb * 1024);
#undef SET_RLIM
  rlim.rlim_cur = rlim.rlim_max = 0;
  if (setrlimit(RLIMIT_CORE, &rlim) < 0) die("setrlim CORE", errno);

  int count = 0;
  do {
    execv(options_->executable.c_str(), args_.data());
    usleep(100);
    // We try at most 16 times to avoid livelocks.
  } while (errno == ETXTBSY && count++ < 16);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  close(pipe_fds_[1]);
  int error_len = 0;
  if (read(pipe_fds_[0], &error_len, sizeof(error_len)) == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    if (error_len < 0 || error_len >= PIPE_BUF) error_len = PIPE_BUF - 1;
    if (read(pipe_fds_[0], error, error_len) < 0) error[0] = 0;
    close(pipe_fds_[0]);
    *error_msg = error;
    // The child has already exited.
    if (waitpid(child_pid_, nullptr, 0) == -1) PLOG(WARNING) << "waitpid";
    return false;
  }
  close(pipe_fds_[0]);

  ExecutionControl* control = options_->control.get();
  if (control) control->SetPid(child_pid_);

  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  // wait4 is used instead of waitpid since it also returns the resource
  // usage of this child alone.
  int child_status = 0;
  bool has_exited = false;
  int64_t sigterm_sent_at = -1;
  struct rusage rusage = {};
  while (true) {
    int ret = wait4(child_pid_, &child_status, WNOHANG, &rusage);
    if (ret == -1 && errno != EINTR) {
      char buf[kStrErrorBufSize] = {};
      *error_msg = "wait4: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      kill(child_pid_, SIGKILL);
      if (control) control->SetPid(0);
      return false;
    }
    if (ret == child_pid_) {
      has_exited = true;
      break;
    }
    int64_t elapsed = elapsed_millis();
    if (options_->wall_limit_millis && elapsed >= options_->wall_limit_millis) {
      info->wall_limit_exceeded = true;
      break;
    }
    if (control) {
      if (sigterm_sent_at < 0) {
        info->termination = control->termination(&info->termination_reason);
        if (info->termination != Termination::kNone) {
          VLOG(1) << "Stopping " << child_pid_ << ": "
                  << info->termination_reason;
          kill(child_pid_, SIGTERM);
          sigterm_sent_at = elapsed;
        }
      } else if (elapsed - sigterm_sent_at >= options_->kill_grace_millis) {
        VLOG(1) << "Killing " << child_pid_ << " after the grace period";
        break;
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  if (!has_exited) {
    kill(child_pid_, SIGKILL);
    while (wait4(child_pid_, &child_status, 0, &rusage) == -1) {
      if (errno == EINTR) continue;
      char buf[kStrErrorBufSize] = {};
      *error_msg = "wait4: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      if (control) control->SetPid(0);
      return false;
    }
  }
  // Whatever the child left behind in its session goes too. ESRCH means
  // there was nothing left.
  if (kill(-child_pid_, SIGKILL) == -1 && errno != ESRCH) {
    PLOG(WARNING) << "kill(" << -child_pid_ << ")";
  }
  if (control) control->SetPid(0);

  info->memory_usage_kb = rusage.ru_maxrss;
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->wall_time_millis = elapsed_millis();
  info->cpu_time_millis =
      (int64_t)rusage.ru_utime.tv_sec * 1000 + rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis =
      (int64_t)rusage.ru_stime.tv_sec * 1000 + rusage.ru_stime.tv_usec / 1000;
  return true;
}

}  // namespace sandbox
