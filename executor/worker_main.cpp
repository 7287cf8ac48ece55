#include "executor/worker.hpp"
#include "sandbox/sandbox.hpp"

// Runs one script inside the sandbox. Started by the supervisor with the
// channel on sandbox::kChannelFd and nothing else open.
int main() { return executor::RunWorker(sandbox::kChannelFd); }
