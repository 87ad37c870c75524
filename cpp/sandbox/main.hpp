#ifndef SANDBOX_MAIN_HPP
#define SANDBOX_MAIN_HPP
#include <string>
#include <vector>

#include <kj/main.h>

namespace sandbox {

class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity AddArg(kj::StringPtr arg);
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
  std::vector<std::string> command_;
};
}  // namespace sandbox
#endif
