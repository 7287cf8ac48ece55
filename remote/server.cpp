#include <string>

#include "gflags/gflags.h"
#include "glog/logging.h"
#include "grpc++/security/server_credentials.h"
#include "grpc++/server.h"
#include "grpc++/server_builder.h"
#include "manager/sandbox_manager.hpp"
#include "remote/service.hpp"
#include "util/flags.hpp"

int main(int argc, char** argv) {
  google::InitGoogleLogging(argv[0]);
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  manager::ManagerOptions options = manager::ManagerOptions::FromFlags();
  if (options.engine.worker_path.empty()) {
    LOG(ERROR) << "codebox-worker not found, use --worker_path";
    return 1;
  }
  manager::SandboxManager manager(options);
  manager.Start();

  remote::SandboxServiceImpl service(&manager);
  std::string server_address =
      FLAGS_listen_address + ":" + std::to_string(FLAGS_port);
  grpc::ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  if (!server) {
    LOG(ERROR) << "Cannot listen on " << server_address;
    return 1;
  }
  LOG(INFO) << "Server listening on " << server_address
            << ", worker: " << options.engine.worker_path;
  server->Wait();
  manager.Stop();
  manager.CleanupAll();
}
