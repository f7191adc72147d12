#pragma once

#include "Config.hpp"
#include "StorageHandle.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace nativeio {

class OperationExecutor;

// Maps storage names to files under the root directory and hands out handles
class StorageManager {
public:
    StorageManager(const StorageConfig& config, OperationExecutor& executor);

    // Closes every handle still open
    ~StorageManager();

    // Non-copyable
    StorageManager(const StorageManager&) = delete;
    StorageManager& operator=(const StorageManager&) = delete;

    // Open (creating if needed) the named file
    std::shared_ptr<StorageHandle> open(const std::string& name);

    // Delete the named file; missing files are ignored
    void remove(const std::string& name);

    void rename(const std::string& oldName, const std::string& newName);

    // Names of all stored files, sorted
    std::vector<std::string> list() const;

    // Get number of names held by handles that are not closed yet
    size_t openCount() const;

    // Close every live handle and wait for the closes to settle
    void closeAll();

    // Names are 1-100 characters of [a-z0-9_]
    static bool isValidName(std::string_view name);
    static constexpr size_t kMaxNameLength = 100;

    const std::filesystem::path& root() const { return m_root; }

private:
    std::filesystem::path pathFor(const std::string& name) const;
    void validateName(const std::string& name) const;

    // Caller holds m_mutex
    bool isOpenLocked(const std::string& name);

    std::filesystem::path m_root;
    StorageConfig m_config;
    OperationExecutor& m_executor;

    std::unordered_map<std::string, std::weak_ptr<StorageHandle>> m_handles;
    mutable std::mutex m_mutex;
};

}  // namespace nativeio
