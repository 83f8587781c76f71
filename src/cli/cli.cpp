#include "cli/cli.hpp"
#include <algorithm>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace s3sync {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(sync::SyncEngine& engine, std::istream& in, std::ostream& out)
  : running_(false)
  , engine_(engine)
  , in_(in)
  , out_(out) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  out_ << "S3Sync> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    running_ = execute(line);
    if (running_) {
      out_ << "S3Sync> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  if (!(iss >> command)) {
    return true;
  }

  if (command == "quit") {
    return false;
  }

  std::vector<std::string> args;
  std::string arg;
  while (iss >> arg) {
    args.push_back(arg);
  }

  process_command(command, std::move(args));
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, std::vector<std::string> args) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() << " arguments";

  try {
    if (command == "ls") {
      handle_list_command(args);
    }
    else if (command == "help") {
      handle_help_command();
    }
    else if (command == "upload") {
      handle_upload_command(std::move(args));
    }
    else if (command == "download") {
      handle_download_command(args);
    }
    else if (command == "rename") {
      handle_rename_command(std::move(args));
    }
    else if (command == "delete") {
      handle_delete_command(args);
    }
    else {
      out_ << "Unknown command: " << command << ". Type 'help' for a list of commands" << std::endl;
    }
  } catch (const sync::ContractViolation& e) {
    log_and_display_error("Invalid arguments", e.what());
  } catch (const std::exception& e) {
    log_and_display_error("Error running " + command, e.what());
  }
}

void CLI::handle_list_command(const std::vector<std::string>& args) {
  if (args.size() > 2) {
    out_ << "Usage: ls [prefix] [filter]" << std::endl;
    return;
  }

  std::string prefix = args.size() > 0 ? args[0] : "";
  std::string filter = args.size() > 1 ? args[1] : "";
  auto listing = engine_.list_checksums(prefix, filter);
  out_ << listing.size() << " objects" << std::endl;
}

void CLI::handle_upload_command(std::vector<std::string> args) {
  bool make_public = take_flag(args, "--public");
  bool encrypt = take_flag(args, "--encrypt");

  std::vector<std::string> local_paths, remote_keys;
  if (!split_pairs(args, local_paths, remote_keys,
                   "upload [--public] [--encrypt] <local> <key> [<local> <key> ...]")) {
    return;
  }
  print_summary(engine_.upload_files(local_paths, remote_keys, make_public, encrypt));
}

void CLI::handle_download_command(const std::vector<std::string>& args) {
  std::vector<std::string> remote_keys, local_paths;
  if (!split_pairs(args, remote_keys, local_paths, "download <key> <local> [<key> <local> ...]")) {
    return;
  }
  print_summary(engine_.download_files(remote_keys, local_paths));
}

void CLI::handle_rename_command(std::vector<std::string> args) {
  bool keep_original = take_flag(args, "--keep");
  bool make_public = take_flag(args, "--public");

  std::vector<std::string> src_keys, dst_keys;
  if (!split_pairs(args, src_keys, dst_keys, "rename [--keep] [--public] <src> <dst> [<src> <dst> ...]")) {
    return;
  }
  print_summary(engine_.rename_keys(src_keys, dst_keys, keep_original, make_public));
}

void CLI::handle_delete_command(const std::vector<std::string>& args) {
  if (args.empty()) {
    out_ << "Usage: delete <key> [<key> ...]" << std::endl;
    return;
  }
  print_summary(engine_.delete_keys(args));
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help                                   Display this help message" << std::endl;
  out_ << "  ls [prefix] [filter]                   List keys and checksums" << std::endl;
  out_ << "  upload [--public] [--encrypt] <local> <key> ...  Upload changed files" << std::endl;
  out_ << "  download <key> <local> ...             Download changed objects" << std::endl;
  out_ << "  rename [--keep] [--public] <src> <dst> ...       Copy keys, then delete sources" << std::endl;
  out_ << "  delete <key> ...                       Delete keys" << std::endl;
  out_ << "  quit                                   Exit the shell" << std::endl << std::endl;
}


//==============================================
// HELPERS
//==============================================

bool CLI::take_flag(std::vector<std::string>& args, const std::string& flag) {
  auto it = std::find(args.begin(), args.end(), flag);
  if (it == args.end()) {
    return false;
  }
  args.erase(it);
  return true;
}

bool CLI::split_pairs(const std::vector<std::string>& args, std::vector<std::string>& first,
                      std::vector<std::string>& second, const std::string& usage) {
  if (args.empty() || args.size() % 2 != 0) {
    out_ << "Usage: " << usage << std::endl;
    return false;
  }

  for (size_t i = 0; i < args.size(); i += 2) {
    first.push_back(args[i]);
    second.push_back(args[i + 1]);
  }
  return true;
}

void CLI::print_summary(const sync::BatchResult& result) {
  for (const auto& item : result.items()) {
    if (item.outcome == sync::Outcome::Failed) {
      out_ << "  failed: " << item.source << " (" << item.reason << ")" << std::endl;
    }
  }
  out_ << result.summary() << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace s3sync
