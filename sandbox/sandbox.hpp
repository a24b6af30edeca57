#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sandbox {

// File descriptor on which a sandbox program writes its report.
static const constexpr int kReportFd = 3;

// Name of the directory the execution's scratch space is mounted on inside an
// isolating filesystem view.
static const constexpr char* kSandboxMountPoint = "/snekbox";

enum class Resource { NONE, MEMORY, CPU_TIME, PROCESSES, FILE_SIZE };

const char* ResourceName(Resource resource);

// Settings to execute a program in the sandbox. All the limits are already
// resolved against the server ceilings, 0 means unlimited.
struct IsolationConfig {
  // Program to run, command[0] is an absolute path.
  std::vector<std::string> command;
  // Complete environment of the program, as KEY=VALUE.
  std::vector<std::string> env;
  // Host path of the writable scratch directory. The program starts with it
  // as its working directory.
  std::string scratch_dir;

  int64_t cpu_limit_millis = 0;
  int64_t wall_limit_millis = 0;
  int64_t memory_limit_bytes = 0;
  int64_t output_limit_bytes = 0;
  int64_t max_procs = 0;
  int64_t max_files = 0;
  int64_t max_file_size_bytes = 0;
  bool allow_network = false;
};

// How the sandboxed program ended, as seen by the sandbox.
struct Termination {
  enum class Kind { EXITED, SIGNALED, LIMIT_EXCEEDED, SETUP_FAILED };
  Kind kind = Kind::EXITED;
  int32_t status_code = 0;
  int32_t signal = 0;
  Resource resource = Resource::NONE;
  int64_t cpu_time_millis = 0;
  int64_t memory_usage_kb = 0;
  // Operator-facing detail, never returned to clients.
  std::string message;
  // Diagnostics emitted by the sandbox itself.
  std::vector<std::string> log;
};

// Sandbox interface. A sandbox is an external program that isolates the
// command it is given: the supervisor spawns Command(config) with the
// program's stdin, stdout and stderr, plus a pipe on kReportFd, and hands the
// wait status and everything read from that pipe to Interpret.
// Implementations need to register themselves by creating a global object of
// type Sandbox::Register<SandboxImpl> and should define the kName member and
// the Create and Score static functions. Create should return a pointer to a
// newly allocated instance of the given implementation, while Score should
// return a value that defines how "good" that sandbox is: negative if the
// sandbox cannot be used in the current configuration, positive otherwise (a
// bigger value means a better sandbox).
// Registering a sandbox is not thread-safe and should be done before any
// threads are created.
class Sandbox {
 public:
  using create_t = std::function<Sandbox*()>;
  using score_t = std::function<int()>;

  // Returns the best available sandbox if name is "auto", otherwise the one
  // with the given name. Returns nullptr if there is no such usable sandbox.
  static std::unique_ptr<Sandbox> Create(const std::string& name = "auto");

  // Names of the registered sandboxes, usable or not.
  static std::vector<std::string> Names();

  virtual const char* Name() const = 0;

  // Returns the argv that runs config.command under this sandbox.
  virtual std::vector<std::string> Command(
      const IsolationConfig& config) const = 0;

  // Translates the exit of the sandbox program into the termination of the
  // sandboxed command.
  virtual Termination Interpret(int wait_status, const std::string& report,
                                const IsolationConfig& config) const = 0;

  // Constructor and destructors
  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Sandbox::Register_(T::kName, &T::Create, &T::Score); }
  };

 private:
  struct Entry {
    std::string name;
    create_t create;
    score_t score;
  };
  using store_t = std::vector<Entry>;
  static store_t* Boxes_();
  static void Register_(const std::string& name, create_t, score_t);
  template <typename T>
  friend class Register;
};

}  // namespace sandbox

#endif
