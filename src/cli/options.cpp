#include "cli/options.hpp"
#include <iostream>
#include <limits>
#include <stdexcept>
#include <unordered_set>

namespace cloudsim {
namespace cli {

namespace {

// Whole-string unsigned parse within [min_value, max_value]
std::size_t parse_bounded(const std::string& value, std::size_t min_value, std::size_t max_value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw std::invalid_argument("not a number");
  }
  unsigned long long parsed = std::stoull(value);
  if (parsed < min_value || parsed > max_value) {
    throw std::out_of_range("out of range");
  }
  return static_cast<std::size_t>(parsed);
}

} // namespace

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [options]\n"
        << "Options:\n"
        << "  -n, --nodes        Number of nodes to start (default 3)\n"
        << "  -p, --base-port    Port of the first node, the others follow (default 8000)\n"
        << "  -f, --file         File to distribute across the cluster\n"
        << "  -r, --replication  Requested replication factor (default 2)\n"
        << "  -s, --storage      Root directory of the virtual disks (default virtual_storage)\n"
        << "  -l, --log-file     Also write the log to this file\n"
        << "Example: " << program_name << " -n 4 -p 9000 -f data.bin\n";
}

ProgramOptions parse_command_line(int argc, const char* const argv[]) {
  const std::unordered_set<std::string> flags = {
    "-n", "--nodes", "-p", "--base-port", "-f", "--file",
    "-r", "--replication", "-s", "--storage", "-l", "--log-file"
  };

  ProgramOptions options;

  if (argc % 2 == 0) {
    std::cerr << "Error: Every option needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    try {
      if (flag == "-n" || flag == "--nodes") {
        options.nodes = parse_bounded(value, 1, std::numeric_limits<uint16_t>::max());
      } else if (flag == "-p" || flag == "--base-port") {
        options.base_port = static_cast<uint16_t>(parse_bounded(value, 1, std::numeric_limits<uint16_t>::max()));
      } else if (flag == "-f" || flag == "--file") {
        options.file = value;
      } else if (flag == "-r" || flag == "--replication") {
        options.replication = parse_bounded(value, 1, std::numeric_limits<uint16_t>::max());
      } else if (flag == "-s" || flag == "--storage") {
        options.storage_root = value;
      } else if (flag == "-l" || flag == "--log-file") {
        options.log_file = value;
      }
    } catch (const std::exception&) {
      std::cerr << "Error: Invalid value for " << flag << ": " << value << '\n';
      print_usage(argv[0]);
      return options;
    }
  }

  if (options.base_port + options.nodes - 1 > std::numeric_limits<uint16_t>::max()) {
    std::cerr << "Error: Node count and base port must leave room for every node\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

} // namespace cli
} // namespace cloudsim
