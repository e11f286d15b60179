#pragma once

#include <cstdint>
#include <string>

namespace cloudsim {
namespace cli {

struct ProgramOptions {
  std::size_t nodes{3};
  uint16_t base_port{8000};
  std::string file;
  std::size_t replication{2};
  std::string storage_root{"virtual_storage"};
  std::string log_file;
  bool valid{false};
};

// ---- COMMAND LINE ----
void print_usage(const std::string& program_name);
// Parses paired flag/value arguments. Reports the problem and the usage text on
// stderr and returns options with valid == false on any error.
ProgramOptions parse_command_line(int argc, const char* const argv[]);

} // namespace cli
} // namespace cloudsim
