#include "sandbox/main.hpp"

#include <unistd.h>
#include <fstream>
#include <iostream>

#include "sandbox/unix.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"
#include "util/which.hpp"

namespace sandbox {

kj::MainBuilder::Validity Main::AddArg(kj::StringPtr arg) {
  command_.emplace_back(arg.cStr());
  return true;
}

kj::MainBuilder::Validity Main::Run() {
  std::ofstream log_file;
  if (!Flags::log_file.empty()) {
    log_file.open(Flags::log_file, std::ios::app);
    if (!log_file) {
      return kj::str("cannot open log file: ", Flags::log_file.c_str());
    }
  }
  bool to_file = log_file.is_open();
  util::LogManager log_manager(to_file ? log_file : std::cerr,
                               !to_file && isatty(STDERR_FILENO));
  if (Flags::verbose) context.increaseLoggingVerbosity();

  std::string executable = util::which(command_[0]);
  if (executable.empty()) {
    return kj::str("command not found: ", command_[0].c_str());
  }
  ExecutionOptions options(executable);
  options.SetArgs(
      std::vector<std::string>(command_.begin() + 1, command_.end()));
  options.stdin_file = Flags::stdin_file;
  options.stdout_file = Flags::stdout_file;
  options.stderr_file = Flags::stderr_file;
  if (Flags::memory_limit) options.limits.memory_limit = Flags::memory_limit;
  if (Flags::time_limit) options.limits.time_limit = Flags::time_limit;
  options.wall_limit_millis = Flags::wall_limit_millis;

  Unix sandbox;
  ExecutionInfo info = sandbox.Execute(options);
  std::cout << info.status.ToString() << "; " << info.usage.ToString();
  if (!info.message.empty()) std::cout << "; " << info.message;
  std::cout << std::endl;
  return true;
}

kj::MainFunc Main::getMain() {
  // MainBuilder does not copy the version string.
  static const std::string title = "Sandbox (" + util::version + ")";
  return kj::MainBuilder(context, title.c_str(),
                         "Runs a command with resource limits and reports how "
                         "it terminated and the resources it used. Use -- to "
                         "separate the command from the sandbox options.")
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(Flags::verbose),
                 "Log informational messages")
      .addOptionWithArg({'m', "memory-limit"},
                        util::setUint64(Flags::memory_limit), "<BYTES>",
                        "Maximum address space size of the command")
      .addOptionWithArg({'t', "time-limit"}, util::setUint64(Flags::time_limit),
                        "<SECONDS>", "Maximum CPU time of the command")
      .addOptionWithArg({'w', "wall-limit"},
                        util::setUint64(Flags::wall_limit_millis,
                                        kMaxWallLimitMillis),
                        "<MILLIS>",
                        "Kill the command after this wall time")
      .addOptionWithArg({'i', "stdin"}, util::setString(Flags::stdin_file),
                        "<FILE>", "Redirect the standard input from a file")
      .addOptionWithArg({'o', "stdout"}, util::setString(Flags::stdout_file),
                        "<FILE>", "Redirect the standard output to a file")
      .addOptionWithArg({'e', "stderr"}, util::setString(Flags::stderr_file),
                        "<FILE>", "Redirect the standard error to a file")
      .expectOneOrMoreArgs("<command>", KJ_BIND_METHOD(*this, AddArg))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace sandbox
