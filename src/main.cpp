// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"

#include <chrono>
#include <iostream>
#include <string>

void PrintUsage(const char* program_name) {
  std::cout
      << "lanscan - find other instances on the local network\n\n"
      << "Usage: " << program_name << " [options]\n\n"
      << "Probing:\n"
      << "  --port=<port>          Well-known port to probe (default: 44444)\n"
      << "  --timeout=<ms>         Per-probe connect timeout (default: 500)\n"
      << "  --concurrency=<n>      Maximum simultaneous probes (default: 64, max: 4096)\n"
      << "  --io-threads=<n>       Threads driving the probes (default: 1)\n"
      << "  --deadline=<ms>        Stop the whole scan after this long (default: none)\n"
      << "\n"
      << "Target selection:\n"
      << "  --subnet=<cidr>        Scan this subnet instead of the host's interfaces (repeatable)\n"
      << "  --interface=<name>     Only scan subnets of this interface (repeatable)\n"
      << "  --filter=<spec>        private (default), ipv4, all, or prefix:<text>\n"
      << "  --min-prefix=<bits>    Skip subnets wider than this prefix length\n"
      << "  --skip-reserved        Do not probe network and broadcast addresses\n"
      << "  --skip-self            Do not probe this host's own addresses\n"
      << "\n"
      << "Output:\n"
      << "  --json                 Print the result as JSON\n"
      << "  --verbose              Also list addresses that did not answer\n"
      << "  --loglevel=<level>     trace, debug, info, warn, error, off (default: info)\n"
      << "  --logfile=<path>       Also write the log to a file\n"
      << "\n"
      << "Other:\n"
      << "  --listen               Answer probes from other instances and keep running\n"
      << "  --version              Show version information\n"
      << "  --help                 Show this help message\n"
      << std::endl;
}

namespace {

bool ParseNumberOption(const std::string& arg, const std::string& name, int min, int max, int& out) {
  auto value = lanscan::util::SafeParseInt(arg.substr(name.size()), min, max);
  if (!value) {
    std::cerr << "Error: invalid value for " << name.substr(0, name.size() - 1) << " (expected " << min << ".."
              << max << ")\n";
    return false;
  }
  out = *value;
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  try {
    lanscan::app::AppConfig config;
    int value = 0;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
      } else if (arg == "--version" || arg == "-v") {
        std::cout << lanscan::GetFullVersionString() << std::endl;
        std::cout << lanscan::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.starts_with("--port=")) {
        auto port = lanscan::util::SafeParsePort(arg.substr(7));
        if (!port) {
          std::cerr << "Error: invalid value for --port (expected 1..65535)\n";
          return 2;
        }
        config.discovery.port = *port;
      } else if (arg.starts_with("--timeout=")) {
        if (!ParseNumberOption(arg, "--timeout=", 1, 600000, value))
          return 2;
        config.discovery.timeout = std::chrono::milliseconds(value);
      } else if (arg.starts_with("--concurrency=")) {
        if (!ParseNumberOption(arg, "--concurrency=", 1, 4096, value))
          return 2;
        config.discovery.concurrency_limit = static_cast<size_t>(value);
      } else if (arg.starts_with("--io-threads=")) {
        if (!ParseNumberOption(arg, "--io-threads=", 1, 64, value))
          return 2;
        config.discovery.io_threads = static_cast<size_t>(value);
      } else if (arg.starts_with("--deadline=")) {
        if (!ParseNumberOption(arg, "--deadline=", 0, 86400000, value))
          return 2;
        config.discovery.run_deadline = std::chrono::milliseconds(value);
      } else if (arg.starts_with("--subnet=")) {
        config.subnets.push_back(arg.substr(9));
      } else if (arg.starts_with("--interface=")) {
        config.interface_names.push_back(arg.substr(12));
      } else if (arg.starts_with("--filter=")) {
        config.filter_spec = arg.substr(9);
        config.filter_explicit = true;
      } else if (arg.starts_with("--min-prefix=")) {
        if (!ParseNumberOption(arg, "--min-prefix=", 0, 32, value))
          return 2;
        config.min_prefix_length = value;
      } else if (arg == "--skip-reserved") {
        config.discovery.exclude_reserved = true;
      } else if (arg == "--skip-self") {
        config.discovery.skip_local_addresses = true;
      } else if (arg == "--json") {
        config.json_output = true;
      } else if (arg == "--verbose") {
        config.verbose = true;
        config.discovery.record_unreachable = true;
      } else if (arg.starts_with("--loglevel=")) {
        config.log_level = arg.substr(11);
      } else if (arg.starts_with("--logfile=")) {
        config.log_file = arg.substr(10);
        config.log_to_file = !config.log_file.empty();
      } else if (arg == "--listen") {
        config.listen = true;
      } else {
        std::cerr << "Error: unknown option '" << arg << "'\n";
        PrintUsage(argv[0]);
        return 2;
      }
    }

    lanscan::util::LogManager::Initialize(config.log_level, config.log_to_file, config.log_file);

    int exit_code = 0;
    {
      lanscan::app::Application app(config);
      exit_code = app.run(std::cout);
    }

    lanscan::util::LogManager::Shutdown();
    return exit_code;

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
