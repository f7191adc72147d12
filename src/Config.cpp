#include "Config.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>
#include <algorithm>
#include <array>
#include <system_error>

namespace nativeio {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

constexpr std::array<const char*, 8> kCommands = {
    "write", "read", "length", "set-length", "flush", "list", "remove", "rename"};

}  // namespace

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;

    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.size() - 2);
            continue;
        }

        // Key-value pair
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        try {
            if (current_section == "storage") {
                if (key == "root") config.storage.root = value;
                else if (key == "create_root") config.storage.create_root = parseBool(value);
                else if (key == "sync_on_flush") config.storage.sync_on_flush = parseBool(value);
            }
            else if (current_section == "executor") {
                if (key == "worker_threads")
                    config.executor.worker_threads = static_cast<size_t>(std::stoul(value));
            }
            else if (current_section == "logging") {
                if (key == "debug") config.logging.debug = parseBool(value);
                else if (key == "log_file") config.logging.log_file = value;
            }
        } catch (const std::logic_error&) {
            spdlog::warn("Ignoring invalid value for {}.{}: '{}'", current_section, key, value);
        }
    }

    return config;
}

Config Config::parseArgs(int argc, char* argv[]) {
    Config config;

    CLI::App app{"native-io - asynchronous storage handles over a local directory"};

    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file");

    std::string root;
    auto* root_opt = app.add_option("-r,--root", root, "Storage root directory");
    size_t threads = 0;
    auto* threads_opt = app.add_option("-j,--threads", threads, "Worker threads for I/O operations");
    bool no_sync = false;
    auto* no_sync_opt = app.add_flag("--no-sync", no_sync, "Use fdatasync instead of fsync on flush");
    bool debug = false;
    auto* debug_opt = app.add_flag("-d,--debug", debug, "Enable debug output");
    std::string log_file;
    auto* log_opt = app.add_option("--log-file", log_file, "Also write logs to this file");
    app.add_flag_function("-q,--quiet", [&config](int64_t) { config.foreground = false; },
                 "Do not log to the console");

    CommandConfig command;

    auto* write_cmd = app.add_subcommand("write", "Write bytes to a storage file");
    write_cmd->add_option("name", command.target, "Storage name")->required();
    write_cmd->add_option("data", command.data, "Bytes to write")->required();
    write_cmd->add_option("--offset", command.offset, "File offset");

    auto* read_cmd = app.add_subcommand("read", "Read bytes from a storage file");
    read_cmd->add_option("name", command.target, "Storage name")->required();
    read_cmd->add_option("--length", command.length, "Number of bytes to read")->default_val(64);
    read_cmd->add_option("--offset", command.offset, "File offset");

    auto* length_cmd = app.add_subcommand("length", "Print the length of a storage file");
    length_cmd->add_option("name", command.target, "Storage name")->required();

    auto* set_length_cmd = app.add_subcommand("set-length", "Truncate or extend a storage file");
    set_length_cmd->add_option("name", command.target, "Storage name")->required();
    set_length_cmd->add_option("length", command.length, "New length in bytes")->required();

    auto* flush_cmd = app.add_subcommand("flush", "Flush a storage file to disk");
    flush_cmd->add_option("name", command.target, "Storage name")->required();

    app.add_subcommand("list", "List storage files");

    auto* remove_cmd = app.add_subcommand("remove", "Delete a storage file");
    remove_cmd->add_option("name", command.target, "Storage name")->required();

    auto* rename_cmd = app.add_subcommand("rename", "Rename a storage file");
    rename_cmd->add_option("name", command.target, "Current storage name")->required();
    rename_cmd->add_option("new_name", command.new_name, "New storage name")->required();

    app.require_subcommand(1);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    // Config file provides the base, command line args override it
    if (!config_file.empty()) {
        auto file_config = loadFromFile(config_file);
        if (file_config) {
            bool foreground = config.foreground;
            config = *file_config;
            config.foreground = foreground;
        } else {
            spdlog::warn("Could not load config file: {}", config_file);
        }
    }

    if (root_opt->count() > 0) config.storage.root = root;
    if (threads_opt->count() > 0) config.executor.worker_threads = threads;
    if (no_sync_opt->count() > 0) config.storage.sync_on_flush = !no_sync;
    if (debug_opt->count() > 0) config.logging.debug = debug;
    if (log_opt->count() > 0) config.logging.log_file = log_file;

    command.name = app.get_subcommands().front()->get_name();
    config.command = command;

    return config;
}

bool Config::validate() const {
    if (storage.root.empty()) {
        spdlog::error("Storage root is required (use -r option)");
        return false;
    }

    std::error_code ec;
    bool exists = std::filesystem::exists(storage.root, ec);
    if (exists && !std::filesystem::is_directory(storage.root, ec)) {
        spdlog::error("Storage root is not a directory: {}", storage.root);
        return false;
    }

    if (!exists && !storage.create_root) {
        spdlog::error("Storage root does not exist: {}", storage.root);
        return false;
    }

    if (executor.worker_threads == 0) {
        spdlog::error("At least one worker thread is required");
        return false;
    }

    if (!command.name.empty() &&
        std::find(kCommands.begin(), kCommands.end(), command.name) == kCommands.end()) {
        spdlog::error("Unknown command: {}", command.name);
        return false;
    }

    return true;
}

bool Config::prepareRoot() const {
    std::error_code ec;
    if (std::filesystem::is_directory(storage.root, ec)) {
        return true;
    }

    if (!storage.create_root) {
        return false;
    }

    std::filesystem::create_directories(storage.root, ec);
    if (ec) {
        spdlog::error("Failed to create storage root {}: {}", storage.root, ec.message());
        return false;
    }

    spdlog::info("Created storage root {}", storage.root);
    return true;
}

}  // namespace nativeio
