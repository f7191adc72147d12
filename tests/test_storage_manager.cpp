#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "StorageManager.hpp"
#include "OperationExecutor.hpp"
#include "ErrorHandler.hpp"
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>

using namespace nativeio;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

class StorageManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() / "native_io_manager_test";
        std::filesystem::remove_all(tempDir_);
        config_.root = (tempDir_ / "root").string();
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
    }

    ErrorKind kindOf(const std::function<void()>& action) {
        try {
            action();
        } catch (const NativeIOException& e) {
            return e.kind();
        }
        return ErrorKind::None;
    }

    std::filesystem::path tempDir_;
    StorageConfig config_;
    OperationExecutor executor_{2};
};

// Name validation
TEST_F(StorageManagerTest, ValidNames) {
    EXPECT_TRUE(StorageManager::isValidName("file_name"));
    EXPECT_TRUE(StorageManager::isValidName("abc123"));
    EXPECT_TRUE(StorageManager::isValidName("_"));
    EXPECT_TRUE(StorageManager::isValidName(std::string(100, 'a')));
}

TEST_F(StorageManagerTest, InvalidNames) {
    EXPECT_FALSE(StorageManager::isValidName(""));
    EXPECT_FALSE(StorageManager::isValidName(std::string(101, 'a')));
    EXPECT_FALSE(StorageManager::isValidName("File"));
    EXPECT_FALSE(StorageManager::isValidName("a.b"));
    EXPECT_FALSE(StorageManager::isValidName("../escape"));
    EXPECT_FALSE(StorageManager::isValidName("with space"));
}

TEST_F(StorageManagerTest, CreatesRoot) {
    StorageManager manager(config_, executor_);

    EXPECT_TRUE(std::filesystem::is_directory(config_.root));
}

TEST_F(StorageManagerTest, MissingRootWithoutCreateFails) {
    config_.create_root = false;

    EXPECT_THROW({ StorageManager manager(config_, executor_); }, StorageIoError);
}

// Open and close
TEST_F(StorageManagerTest, OpenReturnsOpenHandle) {
    StorageManager manager(config_, executor_);

    auto file = manager.open("file_name");

    ASSERT_NE(file, nullptr);
    EXPECT_EQ(file->state(), HandleState::Open);
    EXPECT_EQ(file->name(), "file_name");
    EXPECT_EQ(manager.openCount(), 1u);
    EXPECT_TRUE(std::filesystem::exists(std::filesystem::path(config_.root) / "file_name"));

    file->close().get();
    EXPECT_EQ(manager.openCount(), 0u);
}

TEST_F(StorageManagerTest, OpenRejectsInvalidName) {
    StorageManager manager(config_, executor_);

    EXPECT_EQ(kindOf([&]() { manager.open("Bad Name"); }), ErrorKind::InvalidName);
}

TEST_F(StorageManagerTest, OpenTwiceFailsUntilClosed) {
    StorageManager manager(config_, executor_);

    auto file = manager.open("file_name");
    EXPECT_EQ(kindOf([&]() { manager.open("file_name"); }), ErrorKind::NoModificationAllowed);

    file->close().get();

    auto reopened = manager.open("file_name");
    EXPECT_EQ(reopened->state(), HandleState::Open);
    reopened->close().get();
}

TEST_F(StorageManagerTest, DroppedHandleFreesName) {
    StorageManager manager(config_, executor_);

    manager.open("file_name");

    EXPECT_EQ(manager.openCount(), 0u);
    EXPECT_NO_THROW(manager.open("file_name"));
}

TEST_F(StorageManagerTest, DataSurvivesReopen) {
    StorageManager manager(config_, executor_);

    auto file = manager.open("file_name");
    file->write(std::vector<uint8_t>{96, 97, 98, 99}, 0).get();
    file->flush().get();
    file->close().get();

    auto reopened = manager.open("file_name");
    EXPECT_EQ(reopened->getLength().get(), 4u);
    auto read = reopened->read(std::vector<uint8_t>(4), 0).get();
    EXPECT_THAT(read.buffer, ElementsAre(96, 97, 98, 99));
    reopened->close().get();
}

TEST_F(StorageManagerTest, OperationsFailAfterCloseThroughManagerHandle) {
    StorageManager manager(config_, executor_);

    auto file = manager.open("file_name");
    auto closed = file->close();

    EXPECT_THROW(file->read(std::vector<uint8_t>(4), 4).get(), InvalidStateError);
    EXPECT_NO_THROW(closed.get());
    EXPECT_THROW(file->read(std::vector<uint8_t>(4), 4).get(), InvalidStateError);
}

TEST_F(StorageManagerTest, CloseAllClosesLiveHandles) {
    StorageManager manager(config_, executor_);

    auto first = manager.open("first");
    auto second = manager.open("second");

    manager.closeAll();

    EXPECT_EQ(first->state(), HandleState::Closed);
    EXPECT_EQ(second->state(), HandleState::Closed);
    EXPECT_EQ(manager.openCount(), 0u);
}

// Directory operations
TEST_F(StorageManagerTest, ListReturnsSortedNames) {
    StorageManager manager(config_, executor_);
    EXPECT_THAT(manager.list(), IsEmpty());

    manager.open("zeta")->close().get();
    manager.open("alpha")->close().get();
    std::ofstream(std::filesystem::path(config_.root) / "Not.Valid") << "ignored";

    EXPECT_THAT(manager.list(), ElementsAre("alpha", "zeta"));
}

TEST_F(StorageManagerTest, RemoveDeletesFile) {
    StorageManager manager(config_, executor_);
    manager.open("file_name")->close().get();

    manager.remove("file_name");

    EXPECT_THAT(manager.list(), IsEmpty());
    EXPECT_NO_THROW(manager.remove("file_name"));
}

TEST_F(StorageManagerTest, RemoveFailsWhileOpen) {
    StorageManager manager(config_, executor_);
    auto file = manager.open("file_name");

    EXPECT_EQ(kindOf([&]() { manager.remove("file_name"); }), ErrorKind::NoModificationAllowed);

    file->close().get();
    EXPECT_NO_THROW(manager.remove("file_name"));
}

TEST_F(StorageManagerTest, RenameMovesFile) {
    StorageManager manager(config_, executor_);
    auto file = manager.open("old_name");
    file->write(std::vector<uint8_t>{1, 2, 3}, 0).get();
    file->close().get();

    manager.rename("old_name", "new_name");

    EXPECT_THAT(manager.list(), ElementsAre("new_name"));
    auto renamed = manager.open("new_name");
    EXPECT_EQ(renamed->getLength().get(), 3u);
    renamed->close().get();
}

TEST_F(StorageManagerTest, RenameFailures) {
    StorageManager manager(config_, executor_);
    auto open = manager.open("open_file");
    manager.open("other")->close().get();

    EXPECT_EQ(kindOf([&]() { manager.rename("open_file", "moved"); }),
              ErrorKind::NoModificationAllowed);
    EXPECT_EQ(kindOf([&]() { manager.rename("other", "open_file"); }),
              ErrorKind::NoModificationAllowed);
    EXPECT_EQ(kindOf([&]() { manager.rename("missing", "moved"); }), ErrorKind::NotFound);
    EXPECT_EQ(kindOf([&]() { manager.rename("other", "Bad"); }), ErrorKind::InvalidName);

    open->close().get();
    EXPECT_EQ(kindOf([&]() { manager.rename("other", "open_file"); }),
              ErrorKind::NoModificationAllowed);
}
