#include "policy/config.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "absl/strings/str_cat.h"
#include "util/flags.hpp"

namespace {

// a.b.c -> {a, a.b, a.b.c}
std::vector<std::string> DottedPrefixes(const std::string& module) {
  std::vector<std::string> prefixes;
  size_t pos = 0;
  while ((pos = module.find('.', pos)) != std::string::npos) {
    prefixes.push_back(module.substr(0, pos));
    pos++;
  }
  prefixes.push_back(module);
  return prefixes;
}

template <typename T>
void SetIfPositive(T value, T* field) {
  if (value > 0) *field = value;
}

}  // namespace

namespace policy {

const std::set<std::string>& FileAccessModules() {
  static const std::set<std::string>* modules = new std::set<std::string>{
      "os",      "io",      "pathlib", "shutil", "tempfile",
      "glob",    "fileinput", "shelve", "sqlite3", "zipfile",
      "tarfile", "gzip",    "bz2",     "lzma",   "mmap"};
  return *modules;
}

const std::set<std::string>& NetworkAccessModules() {
  static const std::set<std::string>* modules = new std::set<std::string>{
      "socket", "ssl",     "http",     "urllib",   "ftplib",
      "smtplib", "telnetlib", "poplib", "imaplib", "requests",
      "aiohttp", "xmlrpc",  "socketserver"};
  return *modules;
}

ResourceCeilings ResourceCeilings::FromFlags() {
  ResourceCeilings ceilings;
  ceilings.max_execution_time = FLAGS_max_execution_time;
  ceilings.max_memory_mb = FLAGS_max_memory_mb;
  ceilings.max_cpu_percent = FLAGS_max_cpu_percent;
  ceilings.max_open_files = FLAGS_max_open_files;
  ceilings.max_processes = FLAGS_max_processes;
  ceilings.max_threads = FLAGS_max_threads;
  ceilings.max_output_bytes = FLAGS_max_output_bytes;
  ceilings.max_source_length = FLAGS_max_source_length;
  return ceilings;
}

proto::ResourceCeilings ResourceCeilings::ToProto() const {
  proto::ResourceCeilings ceilings;
  ceilings.set_max_execution_time(max_execution_time);
  ceilings.set_max_memory_mb(max_memory_mb);
  ceilings.set_max_cpu_percent(max_cpu_percent);
  ceilings.set_max_open_files(max_open_files);
  ceilings.set_max_processes(max_processes);
  ceilings.set_max_threads(max_threads);
  ceilings.set_max_output_bytes(max_output_bytes);
  ceilings.set_max_source_length(max_source_length);
  return ceilings;
}

SandboxConfig SandboxConfig::Default() {
  SandboxConfig config;
  config.max_execution_time = FLAGS_default_execution_time;
  config.max_memory_mb = FLAGS_default_memory_mb;
  config.max_output_bytes = FLAGS_default_output_bytes;
  config.max_source_length = FLAGS_default_source_length;
  config.max_recursion_depth = FLAGS_default_recursion_depth;
  config.allowed_modules = {
      "json",     "datetime",     "math",      "random",  "collections",
      "itertools", "functools",   "operator",  "re",      "string",
      "uuid",     "hashlib",      "base64",    "urllib.parse", "typing",
      "dataclasses", "enum",      "asyncio",   "pandas",  "numpy",
      "requests", "aiohttp"};
  config.blocked_modules = {
      "os",       "sys",       "subprocess", "importlib", "socket",
      "urllib",   "http",      "ftplib",     "smtplib",   "telnetlib",
      "shutil",   "ctypes",    "multiprocessing", "threading", "signal",
      "resource", "pickle",    "marshal",    "builtins",  "gc",
      "inspect",  "code",      "pty"};
  config.blocked_callables = {
      "exec",    "eval",    "compile", "__import__", "getattr",
      "setattr", "delattr", "hasattr", "globals",    "locals",
      "vars",    "dir",     "open",    "input",      "breakpoint",
      "exit",    "quit",    "memoryview"};
  return config;
}

SandboxConfig SandboxConfig::FromProto(const proto::SandboxConfig& config) {
  SandboxConfig result = Default();
  SetIfPositive(config.max_execution_time(), &result.max_execution_time);
  SetIfPositive(config.max_memory_mb(), &result.max_memory_mb);
  SetIfPositive(config.max_output_bytes(), &result.max_output_bytes);
  SetIfPositive(config.max_source_length(), &result.max_source_length);
  SetIfPositive(config.max_cpu_percent(), &result.max_cpu_percent);
  SetIfPositive(config.max_open_files(), &result.max_open_files);
  SetIfPositive(config.max_processes(), &result.max_processes);
  SetIfPositive(config.max_threads(), &result.max_threads);
  SetIfPositive(config.max_recursion_depth(), &result.max_recursion_depth);
  if (config.allowed_modules_size() > 0) {
    result.allowed_modules = std::set<std::string>(
        config.allowed_modules().begin(), config.allowed_modules().end());
  }
  result.blocked_modules.insert(config.blocked_modules().begin(),
                                config.blocked_modules().end());
  result.blocked_callables.insert(config.blocked_callables().begin(),
                                  config.blocked_callables().end());
  if (config.has_enable_debugging())
    result.enable_debugging = config.enable_debugging();
  result.enable_file_access = config.enable_file_access();
  result.enable_network_access = config.enable_network_access();
  return result;
}

proto::SandboxConfig SandboxConfig::ToProto() const {
  proto::SandboxConfig config;
  config.set_max_execution_time(max_execution_time);
  config.set_max_memory_mb(max_memory_mb);
  config.set_max_output_bytes(max_output_bytes);
  for (const std::string& module : allowed_modules)
    config.add_allowed_modules(module);
  for (const std::string& module : blocked_modules)
    config.add_blocked_modules(module);
  for (const std::string& callable : blocked_callables)
    config.add_blocked_callables(callable);
  config.set_enable_debugging(enable_debugging);
  config.set_max_source_length(max_source_length);
  config.set_enable_file_access(enable_file_access);
  config.set_enable_network_access(enable_network_access);
  config.set_max_cpu_percent(max_cpu_percent);
  config.set_max_open_files(max_open_files);
  config.set_max_processes(max_processes);
  config.set_max_threads(max_threads);
  config.set_max_recursion_depth(max_recursion_depth);
  return config;
}

SandboxConfig SandboxConfig::ClampedTo(const ResourceCeilings& ceilings) const {
  SandboxConfig config = *this;
  config.max_execution_time =
      std::min(max_execution_time, ceilings.max_execution_time);
  config.max_memory_mb = std::min(max_memory_mb, ceilings.max_memory_mb);
  config.max_cpu_percent = std::min(max_cpu_percent, ceilings.max_cpu_percent);
  config.max_open_files = std::min(max_open_files, ceilings.max_open_files);
  config.max_processes = std::min(max_processes, ceilings.max_processes);
  config.max_threads = std::min(max_threads, ceilings.max_threads);
  config.max_output_bytes =
      std::min(max_output_bytes, ceilings.max_output_bytes);
  config.max_source_length =
      std::min(max_source_length, ceilings.max_source_length);
  return config;
}

void SandboxConfig::CheckValid() const {
  auto require = [](bool condition, const char* what) {
    if (!condition)
      throw std::invalid_argument(absl::StrCat(what, " must be positive"));
  };
  require(max_execution_time > 0, "max_execution_time");
  require(max_memory_mb > 0, "max_memory_mb");
  require(max_output_bytes > 0, "max_output_bytes");
  require(max_source_length > 0, "max_source_length");
  require(max_cpu_percent > 0, "max_cpu_percent");
  require(max_open_files > 0, "max_open_files");
  require(max_processes > 0, "max_processes");
  require(max_threads > 0, "max_threads");
  require(max_recursion_depth > 0, "max_recursion_depth");
  if (max_recursion_depth > 1000)
    throw std::invalid_argument("max_recursion_depth must be at most 1000");
}

bool SandboxConfig::IsModuleBlocked(const std::string& module) const {
  auto blocked = [this](const std::string& name) {
    return blocked_modules.count(name) ||
           (!enable_file_access && FileAccessModules().count(name)) ||
           (!enable_network_access && NetworkAccessModules().count(name));
  };
  if (blocked(module)) return true;
  if (allowed_modules.count(module)) return false;
  for (const std::string& prefix : DottedPrefixes(module)) {
    if (blocked(prefix)) return true;
  }
  return false;
}

bool SandboxConfig::IsModuleAllowed(const std::string& module) const {
  if (allowed_modules.empty()) return true;
  for (const std::string& prefix : DottedPrefixes(module)) {
    if (allowed_modules.count(prefix)) return true;
  }
  return false;
}

}  // namespace policy
