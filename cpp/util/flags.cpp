#include "util/flags.hpp"

std::string Flags::log_file;
bool Flags::verbose = false;

uint64_t Flags::memory_limit = 0;
uint64_t Flags::time_limit = 0;
uint64_t Flags::wall_limit_millis = 0;

std::string Flags::stdin_file;
std::string Flags::stdout_file;
std::string Flags::stderr_file;
