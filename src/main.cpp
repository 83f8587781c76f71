#include "cli/cli.hpp"
#include "config/sync_config.hpp"
#include "logger/logger.hpp"
#include "store/local_object_store.hpp"
#include "sync/sync_engine.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  s3sync::config::SyncConfig config;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -r <store-root> -b <bucket> [options]\n"
        << "Required arguments:\n"
        << "  -r, --root      Directory holding the buckets\n"
        << "  -b, --bucket    Bucket name\n"
        << "Optional arguments:\n"
        << "  -l, --log       Log file (default s3sync.log)\n"
        << "  -v, --level     Log level: trace, debug, info, warning, error, fatal\n"
        << "  -t, --timeout   Deadline per remote call in seconds (default none)\n"
        << "  --legacy-lookup Treat failed upload lookups as absent keys\n"
        << "Example: " << program_name << " -r /var/lib/s3sync -b data\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> value_flags = {
    "-r", "--root", "-b", "--bucket", "-l", "--log", "-v", "--level", "-t", "--timeout"
  };

  ProgramOptions options;
  auto& config = options.config;

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "--legacy-lookup") {
      config.treat_lookup_error_as_absent = true;
      continue;
    }

    if (value_flags.count(flag) == 0 || i + 1 >= argc) {
      std::cerr << "Error: Unknown or incomplete argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    const std::string value(argv[++i]);
    if (flag == "-r" || flag == "--root") {
      config.store_root = value;
    } else if (flag == "-b" || flag == "--bucket") {
      config.bucket = value;
    } else if (flag == "-l" || flag == "--log") {
      config.log_file = value;
    } else if (flag == "-v" || flag == "--level") {
      config.log_level = value;
    } else if (flag == "-t" || flag == "--timeout") {
      try {
        config.call_timeout = s3sync::config::parse_timeout_seconds(value);
      } catch (const s3sync::config::ConfigError& e) {
        std::cerr << "Error: " << e.what() << '\n';
        print_usage(argv[0]);
        return options;
      }
    }
  }

  if (config.store_root.empty() || config.bucket.empty()) {
    std::cerr << "Error: Both store root and bucket are required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_shell(const s3sync::config::SyncConfig& config) {
  try {
    s3sync::logging::init_logging(config.log_file, s3sync::logging::parse_severity(config.log_level));

    s3sync::store::LocalObjectStore store(config);
    s3sync::sync::SyncEngine engine(store, config);
    s3sync::cli::CLI cli(engine);

    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start s3sync: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options.config)) {
    return 1;
  }
  return 0;
}
