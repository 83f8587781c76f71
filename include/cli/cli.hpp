#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "sync/sync_engine.hpp"

namespace s3sync {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit CLI(sync::SyncEngine& engine, std::istream& in = std::cin, std::ostream& out = std::cout);


    // ---- STARTUP ----
    void run();
    // Executes one command line, returns false on "quit"
    bool execute(const std::string& line);

private:
    // ---- PARAMETERS ----
    bool running_;
    sync::SyncEngine& engine_;
    std::istream& in_;
    std::ostream& out_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, std::vector<std::string> args);
    void handle_list_command(const std::vector<std::string>& args);
    void handle_upload_command(std::vector<std::string> args);
    void handle_download_command(const std::vector<std::string>& args);
    void handle_rename_command(std::vector<std::string> args);
    void handle_delete_command(const std::vector<std::string>& args);
    void handle_help_command();

    // Removes a "--flag" argument, returns whether it was present
    static bool take_flag(std::vector<std::string>& args, const std::string& flag);
    // Splits "a1 b1 a2 b2 ..." into two parallel lists
    bool split_pairs(const std::vector<std::string>& args, std::vector<std::string>& first,
                     std::vector<std::string>& second, const std::string& usage);
    void print_summary(const sync::BatchResult& result);
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace s3sync
