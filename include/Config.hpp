#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include <filesystem>

namespace nativeio {

struct StorageConfig {
    std::string root = "./native-io-data";
    bool create_root = true;
    bool sync_on_flush = true;  // fsync on flush, fdatasync otherwise
};

struct ExecutorConfig {
    size_t worker_threads = 4;
};

struct LoggingConfig {
    bool debug = false;
    std::string log_file;
};

// Command selected on the command line
struct CommandConfig {
    std::string name;            // write, read, length, set-length, flush, list, remove, rename
    std::string target;          // storage name the command works on
    std::string new_name;        // rename destination
    std::string data;            // write payload
    uint64_t offset = 0;
    uint64_t length = 0;
};

struct Config {
    StorageConfig storage;
    ExecutorConfig executor;
    LoggingConfig logging;
    CommandConfig command;

    bool foreground = true;

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Parse command line arguments
    static Config parseArgs(int argc, char* argv[]);

    // Validate configuration
    bool validate() const;

    // Create the storage root if allowed and missing
    bool prepareRoot() const;
};

}  // namespace nativeio
