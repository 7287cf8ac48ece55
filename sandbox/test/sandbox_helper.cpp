#include <dirent.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <chrono>
#include <ctime>
#include <fstream>
#include <new>
#include <string>
#include <thread>
#include <vector>

// Child program for the sandbox tests: argv[1] selects the behaviour and
// argv[2] is its argument.
int main(int argc, char** argv) {
  if (argc < 2) return 100;
  std::string mode = argv[1];
  double arg = argc > 2 ? atof(argv[2]) : 0;
  if (mode == "exit") return static_cast<int>(arg);
  if (mode == "signal") {
    raise(static_cast<int>(arg));
    return 101;
  }
  if (mode == "sleep") {
    std::this_thread::sleep_for(std::chrono::milliseconds(
        static_cast<int64_t>(arg * 1000)));
    return 0;
  }
  if (mode == "ignore_term") {
    signal(SIGTERM, SIG_IGN);
    std::this_thread::sleep_for(std::chrono::milliseconds(
        static_cast<int64_t>(arg * 1000)));
    return 0;
  }
  if (mode == "spin") {
    std::clock_t start = std::clock();
    volatile uint64_t x = 0;
    while (std::clock() - start < arg * CLOCKS_PER_SEC) x++;
    return 0;
  }
  if (mode == "alloc") {
    try {
      std::vector<char> v(static_cast<size_t>(arg) << 20, 1);
      return v[v.size() / 2] == 1 ? 0 : 102;
    } catch (const std::bad_alloc&) {
      return 3;
    }
  }
  if (mode == "fds") {
    DIR* dir = opendir("/proc/self/fd");
    if (!dir) return 103;
    int count = 0;
    while (struct dirent* entry = readdir(dir)) {
      if (entry->d_name[0] != '.') count++;
    }
    closedir(dir);
    // The directory stream itself was counted.
    printf("%d\n", count - 1);
    return 0;
  }
  if (mode == "channel") {
    const char kPing[] = "ping";
    return write(3, kPing, strlen(kPing)) == 4 ? 0 : 104;
  }
  if (mode == "nnp") {
    std::ifstream status("/proc/self/status");
    std::string line;
    while (std::getline(status, line)) {
      if (line.compare(0, 11, "NoNewPrivs:") == 0) {
        printf("%s\n", line.c_str() + 11 + strspn(line.c_str() + 11, " \t"));
        return 0;
      }
    }
    return 105;
  }
  return 100;
}
