#include "StorageManager.hpp"
#include "FileStorageBackend.hpp"
#include "ErrorHandler.hpp"
#include "OperationExecutor.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <system_error>

namespace nativeio {

StorageManager::StorageManager(const StorageConfig& config, OperationExecutor& executor)
    : m_root(config.root), m_config(config), m_executor(executor) {
    std::error_code ec;
    if (!std::filesystem::is_directory(m_root, ec)) {
        if (!m_config.create_root) {
            throw StorageIoError(ENOENT, "storage root " + m_root.string());
        }
        std::filesystem::create_directories(m_root, ec);
        if (ec) {
            throw StorageIoError(ec.value(), "create storage root " + m_root.string());
        }
    }
}

StorageManager::~StorageManager() {
    closeAll();
}

std::shared_ptr<StorageHandle> StorageManager::open(const std::string& name) {
    validateName(name);

    std::lock_guard<std::mutex> lock(m_mutex);

    if (isOpenLocked(name)) {
        throw NativeIOException(ErrorKind::NoModificationAllowed,
                                "open " + name + ": the file is already open");
    }

    auto backend = std::make_unique<FileStorageBackend>(pathFor(name), m_config.sync_on_flush);
    auto handle = StorageHandle::create(name, std::move(backend), m_executor);
    m_handles[name] = handle;

    spdlog::info("Opened storage {}", name);
    return handle;
}

void StorageManager::remove(const std::string& name) {
    validateName(name);

    std::lock_guard<std::mutex> lock(m_mutex);

    if (isOpenLocked(name)) {
        throw NativeIOException(ErrorKind::NoModificationAllowed,
                                "remove " + name + ": the file is open");
    }

    std::error_code ec;
    bool removed = std::filesystem::remove(pathFor(name), ec);
    if (ec) {
        throw StorageIoError(ec.value(), "remove " + name);
    }

    spdlog::info("Removed storage {}{}", name, removed ? "" : " (did not exist)");
}

void StorageManager::rename(const std::string& oldName, const std::string& newName) {
    validateName(oldName);
    validateName(newName);

    std::lock_guard<std::mutex> lock(m_mutex);

    if (isOpenLocked(oldName) || isOpenLocked(newName)) {
        throw NativeIOException(ErrorKind::NoModificationAllowed,
                                "rename " + oldName + " to " + newName + ": a file is open");
    }

    std::error_code ec;
    if (!std::filesystem::exists(pathFor(oldName), ec)) {
        throw StorageIoError(ENOENT, "rename " + oldName);
    }
    if (std::filesystem::exists(pathFor(newName), ec)) {
        throw NativeIOException(ErrorKind::NoModificationAllowed,
                                "rename " + oldName + " to " + newName + ": target exists");
    }

    std::filesystem::rename(pathFor(oldName), pathFor(newName), ec);
    if (ec) {
        throw StorageIoError(ec.value(), "rename " + oldName);
    }

    spdlog::info("Renamed storage {} to {}", oldName, newName);
}

std::vector<std::string> StorageManager::list() const {
    std::vector<std::string> names;

    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(m_root, ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        std::string name = entry.path().filename().string();
        if (isValidName(name)) {
            names.push_back(std::move(name));
        }
    }

    if (ec) {
        throw StorageIoError(ec.value(), "list " + m_root.string());
    }

    std::sort(names.begin(), names.end());
    return names;
}

size_t StorageManager::openCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    return static_cast<size_t>(std::count_if(m_handles.begin(), m_handles.end(),
        [](const auto& entry) {
            auto handle = entry.second.lock();
            return handle && handle->state() != HandleState::Closed;
        }));
}

void StorageManager::closeAll() {
    std::vector<std::shared_ptr<StorageHandle>> live;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& entry : m_handles) {
            if (auto handle = entry.second.lock()) {
                live.push_back(std::move(handle));
            }
        }
    }

    for (auto& handle : live) {
        handle->close().wait();
    }

    if (!live.empty()) {
        spdlog::info("Closed {} storage handles", live.size());
    }
}

bool StorageManager::isValidName(std::string_view name) {
    if (name.empty() || name.size() > kMaxNameLength) {
        return false;
    }

    return std::all_of(name.begin(), name.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
    });
}

std::filesystem::path StorageManager::pathFor(const std::string& name) const {
    return m_root / name;
}

void StorageManager::validateName(const std::string& name) const {
    if (!isValidName(name)) {
        throw NativeIOException(ErrorKind::InvalidName, "invalid storage name '" + name + "'");
    }
}

bool StorageManager::isOpenLocked(const std::string& name) {
    auto it = m_handles.find(name);
    if (it == m_handles.end()) {
        return false;
    }

    auto handle = it->second.lock();
    if (!handle || handle->state() == HandleState::Closed) {
        m_handles.erase(it);
        return false;
    }

    return true;
}

}  // namespace nativeio
