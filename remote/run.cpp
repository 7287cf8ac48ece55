#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "gflags/gflags.h"
#include "glog/logging.h"
#include "google/protobuf/util/json_util.h"
#include "manager/sandbox_manager.hpp"
#include "policy/config.hpp"
#include "util/flags.hpp"

DEFINE_string(tenant, "cli", "Tenant the script runs for");  // NOLINT
DEFINE_bool(debug, true, "Collect debug events");            // NOLINT

int main(int argc, char** argv) {
  gflags::SetUsageMessage("Runs a script in a sandbox and prints the result");
  google::InitGoogleLogging(argv[0]);
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  if (argc != 2) {
    std::cerr << "Usage: " << argv[0] << " [flags] script.py" << std::endl;
    return 2;
  }

  std::ifstream in(argv[1]);
  if (!in) {
    std::cerr << "Cannot open " << argv[1] << std::endl;
    return 2;
  }
  std::stringstream source;
  source << in.rdbuf();

  manager::ManagerOptions options = manager::ManagerOptions::FromFlags();
  if (options.engine.worker_path.empty()) {
    std::cerr << "codebox-worker not found, use --worker_path" << std::endl;
    return 2;
  }
  manager::SandboxManager manager(options);
  manager.Start();

  policy::SandboxConfig config = policy::SandboxConfig::Default();
  config.enable_debugging = FLAGS_debug;
  proto::ExecutionResult result;
  try {
    result = manager.Execute(manager.Create(FLAGS_tenant, config), source.str());
  } catch (const std::invalid_argument& e) {
    std::cerr << "Invalid configuration: " << e.what() << std::endl;
    return 2;
  }
  manager.Stop();

  google::protobuf::util::JsonPrintOptions json_options;
  json_options.add_whitespace = true;
  json_options.preserve_proto_field_names = true;
  std::string json;
  auto status =
      google::protobuf::util::MessageToJsonString(result, &json, json_options);
  if (!status.ok()) {
    LOG(ERROR) << "Cannot print the result: " << status.ToString();
    return 2;
  }
  std::cout << json;
  return result.status() == proto::COMPLETED ? 0 : 1;
}
