#include "Config.hpp"
#include "ErrorHandler.hpp"
#include "OperationExecutor.hpp"
#include "StorageHandle.hpp"
#include "StorageManager.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <iostream>
#include <string>
#include <vector>

using namespace nativeio;

namespace {

void setupLogging(bool debug, bool foreground, const std::string& logFile) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        auto level = debug ? spdlog::level::debug : spdlog::level::info;

        if (foreground) {
            // Diagnostics go to stderr; stdout carries command output
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(level);
            sinks.push_back(console_sink);
        }

        if (!logFile.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, false);
                file_sink->set_level(level);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "Cannot open log file " << logFile << ": " << ex.what() << std::endl;
            }
        }

        if (sinks.empty()) {
            // Quiet mode still reports errors
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(spdlog::level::err);
            sinks.push_back(console_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("native-io", sinks.begin(), sinks.end());
        logger->set_level(level);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

std::vector<uint8_t> toBytes(const std::string& data) {
    return std::vector<uint8_t>(data.begin(), data.end());
}

// Runs one data command against an open handle and closes it afterwards
int runDataCommand(StorageManager& manager, const CommandConfig& command) {
    auto handle = manager.open(command.target);
    int status = 0;

    try {
        if (command.name == "write") {
            auto result = handle->write(toBytes(command.data), command.offset).get();
            std::cout << result.writtenBytes << std::endl;
        } else if (command.name == "read") {
            std::vector<uint8_t> buffer(static_cast<size_t>(command.length));
            auto result = handle->read(std::move(buffer), command.offset).get();
            std::cout.write(reinterpret_cast<const char*>(result.buffer.data()),
                            static_cast<std::streamsize>(result.readBytes));
            std::cout << std::endl;
            spdlog::debug("Read {} bytes from {}", result.readBytes, command.target);
        } else if (command.name == "length") {
            std::cout << handle->getLength().get() << std::endl;
        } else if (command.name == "set-length") {
            handle->setLength(command.length).get();
        } else if (command.name == "flush") {
            handle->flush().get();
        }
    } catch (const NativeIOException& e) {
        spdlog::error("{} failed: {} ({})", command.name, e.what(), e.name());
        status = 1;
    }

    handle->close().wait();
    return status;
}

int runCommand(StorageManager& manager, const CommandConfig& command) {
    if (command.name == "list") {
        for (const auto& name : manager.list()) {
            std::cout << name << std::endl;
        }
        return 0;
    }

    if (command.name == "remove") {
        manager.remove(command.target);
        return 0;
    }

    if (command.name == "rename") {
        manager.rename(command.target, command.new_name);
        return 0;
    }

    return runDataCommand(manager, command);
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse configuration
    Config config;
    try {
        config = Config::parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    // Setup logging
    setupLogging(config.logging.debug, config.foreground, config.logging.log_file);

    spdlog::debug("Storage root: {}", config.storage.root);

    // Validate configuration
    if (!config.validate() || !config.prepareRoot()) {
        return 1;
    }

    int result = 0;
    try {
        // Executor outlives the manager and every handle it creates
        OperationExecutor executor(config.executor.worker_threads);
        {
            StorageManager manager(config.storage, executor);
            result = runCommand(manager, config.command);
        }
        executor.shutdown();
    } catch (const NativeIOException& e) {
        spdlog::error("{}: {} ({})", config.command.name, e.what(), e.name());
        result = 1;
    } catch (const std::exception& e) {
        spdlog::error("{}: {}", config.command.name, e.what());
        result = 1;
    }

    return result;
}
