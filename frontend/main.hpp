#ifndef FRONTEND_MAIN_HPP
#define FRONTEND_MAIN_HPP
#include <string>

#include <kj/main.h>

#include "supervisor/execution.hpp"

namespace frontend {

// The `eval` subcommand: runs one source file, on a server or in-process,
// and prints the result as JSON.
class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::MainBuilder::Validity RunRemote(const supervisor::ExecutionRequest& req);
  kj::MainBuilder::Validity RunLocal(const supervisor::ExecutionRequest& req);

  kj::ProcessContext& context;
  std::string server_ = "127.0.0.1:8060";
  std::string runtime_ = "python3";
  std::string source_path_;
  std::string stdin_path_;
  bool local_ = false;
  supervisor::Limits limits_;
};
}  // namespace frontend
#endif
