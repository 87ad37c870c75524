#include <kj/main.h>

#include "sandbox/main.hpp"

class SandboxMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit SandboxMain(kj::ProcessContext& context) : bm(&context) {}
  kj::MainFunc getMain() { return bm.getMain(); }

 private:
  sandbox::Main bm;
};

KJ_MAIN(SandboxMain);
