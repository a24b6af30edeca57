#include <chrono>
#include <cstdlib>
#include <cstring>
#include <thread>

// Allocates and touches argv[1] MiB, one MiB at a time, then holds the memory
// for a moment.
int main(int argc, char** argv) {
  if (argc < 2) return 2;
  const size_t chunk = 1024 * 1024;
  const long count = atol(argv[1]);
  for (long i = 0; i < count; i++) {
    char* data = static_cast<char*>(malloc(chunk));
    if (data == nullptr) return 1;
    memset(data, static_cast<int>(i), chunk);
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  return 0;
}
