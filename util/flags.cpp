#include "util/flags.hpp"

std::string Flags::log_file;
bool Flags::verbose = false;

std::string Flags::listen_address = "0.0.0.0";
int32_t Flags::port = 8060;
std::string Flags::scratch_dir = "/tmp/snekbox";
bool Flags::keep_scratch = false;
std::string Flags::engine = "auto";
std::string Flags::sandbox_binary;
std::string Flags::nsjail = "nsjail";
std::string Flags::nsjail_config;
std::string Flags::seccomp_policy;
std::string Flags::runtimes;
int64_t Flags::grace_ms = 500;

int64_t Flags::max_cpu_time_ms = 6000;
int64_t Flags::max_wall_time_ms = 6000;
int64_t Flags::max_memory_bytes = 52428800;
int64_t Flags::max_output_bytes = 1000000;
int64_t Flags::max_processes = 6;
int64_t Flags::max_file_size_bytes = 10485760;
int64_t Flags::max_open_files = 64;
int32_t Flags::max_concurrent_executions = 0;
