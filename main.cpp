#include "frontend/main.hpp"
#include "sandbox/main.hpp"
#include "server/main.hpp"
#include "util/version.hpp"

class SnekboxMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit SnekboxMain(kj::ProcessContext& context)
      : context(context), sm(&context), bm(&context), em(&context) {}
  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "Snekbox (" + util::version + ")",
                           "Runs untrusted code under resource limits")
        .addSubCommand("server", KJ_BIND_METHOD(sm, getMain), "run the server")
        .addSubCommand("sandbox", KJ_BIND_METHOD(bm, getMain),
                       "run the built-in sandbox")
        .addSubCommand("eval", KJ_BIND_METHOD(em, getMain),
                       "run a source file and print the result")
        .build();
  }

 private:
  kj::ProcessContext& context;
  server::Main sm;
  sandbox::Main bm;
  frontend::Main em;
};

KJ_MAIN(SnekboxMain);
