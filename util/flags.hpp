#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>

struct Flags {
  // Common flags
  static std::string log_file;
  static bool verbose;

  // Server flags
  static std::string listen_address;
  static int32_t port;
  static std::string scratch_dir;
  static bool keep_scratch;
  static std::string engine;
  static std::string sandbox_binary;
  static std::string nsjail;
  static std::string nsjail_config;
  static std::string seccomp_policy;
  static std::string runtimes;
  static int64_t grace_ms;

  // Server-wide ceilings, 0 means unlimited.
  static int64_t max_cpu_time_ms;
  static int64_t max_wall_time_ms;
  static int64_t max_memory_bytes;
  static int64_t max_output_bytes;
  static int64_t max_processes;
  static int64_t max_file_size_bytes;
  static int64_t max_open_files;
  static int32_t max_concurrent_executions;
};

#endif
