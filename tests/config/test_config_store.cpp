/*
 * test_config_store.cpp - Tests for the JSON backed configuration store
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include <unistd.h>

#include "config/config_store.hpp"
#include "config/exception.hpp"

using namespace deq::config;
using json = nlohmann::json;
namespace fs = std::filesystem;

class JsonConfigStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info =
            ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() /
               ("deq-config-" + std::string(info->name()) + "-" +
                std::to_string(::getpid()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        path_ = dir_ / "config.json";
    }

    void TearDown() override { fs::remove_all(dir_); }

    void writeFile(const std::string& content) {
        std::ofstream(path_) << content;
    }

    auto readFile() -> json {
        std::ifstream ifs(path_);
        return json::parse(ifs);
    }

    fs::path dir_;
    fs::path path_;
};

// ========== Loading Tests ==========

TEST_F(JsonConfigStoreTest, MissingFileUsesDefaultsWithHost) {
    JsonConfigStore store(path_);
    store.load();

    auto devices = store.listDevices();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].id, "host");
    EXPECT_TRUE(devices[0].isHost);
    EXPECT_TRUE(store.listTasks().empty());
    EXPECT_FALSE(store.notificationSettings().enabled);
    EXPECT_FALSE(fs::exists(path_));
}

TEST_F(JsonConfigStoreTest, HostInsertedFirstWhenMissing) {
    writeFile(R"({"devices": [{"id": "nas", "name": "NAS", "ip": "10.0.0.2"}]})");
    JsonConfigStore store(path_);
    store.load();

    auto devices = store.listDevices();
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].id, "host");
    EXPECT_EQ(devices[1].id, "nas");
    EXPECT_TRUE(store.document().contains("notifications"));
}

TEST_F(JsonConfigStoreTest, ExistingHostIsKept) {
    writeFile(R"({"devices": [{"id": "me", "name": "Me", "ip": "localhost",
                                "is_host": true}]})");
    JsonConfigStore store(path_);
    store.load();

    auto devices = store.listDevices();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].id, "me");
}

TEST_F(JsonConfigStoreTest, MalformedJsonThrows) {
    writeFile("{ not json");
    JsonConfigStore store(path_);
    EXPECT_THROW(store.load(), BadConfigException);
}

TEST_F(JsonConfigStoreTest, NonObjectRootThrows) {
    writeFile("[1, 2, 3]");
    JsonConfigStore store(path_);
    EXPECT_THROW(store.load(), BadConfigException);
}

TEST_F(JsonConfigStoreTest, MalformedTaskIsSkipped) {
    writeFile(R"({"tasks": [{"name": "no id"},
                            {"id": "t1", "name": "ok", "type": "wake"}]})");
    JsonConfigStore store(path_);
    store.load();

    auto tasks = store.listTasks();
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_EQ(tasks[0].id, "t1");
}

// ========== Persistence Tests ==========

TEST_F(JsonConfigStoreTest, SaveTaskPersistsAndPreservesUnknownKeys) {
    writeFile(R"({
        "theme": "dark",
        "tasks": [{"id": "t1", "name": "Backup", "type": "backup",
                   "custom": {"keep": 1},
                   "schedule": {"type": "daily", "time": "02:30"},
                   "source": {"device": "host", "path": "/data/"},
                   "dest": {"device": "host", "path": "/backup"}}]
    })");
    JsonConfigStore store(path_);
    store.load();

    auto task = store.getTask("t1");
    ASSERT_TRUE(task.has_value());
    task->lastStatus = deq::task::TaskStatus::Success;
    task->lastSize = "1.2GB";
    store.saveTask(*task);

    auto saved = readFile();
    EXPECT_EQ(saved["theme"], "dark");
    ASSERT_EQ(saved["tasks"].size(), 1u);
    const auto& t = saved["tasks"][0];
    EXPECT_EQ(t["custom"]["keep"], 1);
    EXPECT_EQ(t["schedule"]["time"], "02:30");
    EXPECT_EQ(t["last_status"], "success");
    EXPECT_EQ(t["last_size"], "1.2GB");
    EXPECT_TRUE(t["last_error"].is_null());
    EXPECT_FALSE(fs::exists(fs::path(path_.string() + ".tmp")));
}

TEST_F(JsonConfigStoreTest, SaveTaskInsertsNewTask) {
    JsonConfigStore store(path_);
    store.load();

    deq::task::Task task;
    task.id = "new";
    task.name = "Wake NAS";
    task.type = deq::task::TaskType::Wake;
    task.device = "nas";
    store.saveTask(task);

    ASSERT_TRUE(store.getTask("new").has_value());
    auto saved = readFile();
    EXPECT_EQ(saved["tasks"][0]["type"], "wake");
    EXPECT_EQ(saved["tasks"][0]["target"], "device");
}

TEST_F(JsonConfigStoreTest, ModifyTaskAppliesAndPersists) {
    writeFile(R"({"tasks": [{"id": "t1", "name": "x", "enabled": true}]})");
    JsonConfigStore store(path_);
    store.load();

    auto updated = store.modifyTask(
        "t1", [](deq::task::Task& t) { t.enabled = false; });
    ASSERT_TRUE(updated.has_value());
    EXPECT_FALSE(updated->enabled);
    EXPECT_FALSE(store.getTask("t1")->enabled);
    EXPECT_FALSE(readFile()["tasks"][0]["enabled"].get<bool>());

    EXPECT_FALSE(store.modifyTask("missing", [](deq::task::Task&) {}));
}

TEST_F(JsonConfigStoreTest, ThrowingModificationLeavesTaskUnchanged) {
    writeFile(R"({"tasks": [{"id": "t1", "name": "before"}]})");
    JsonConfigStore store(path_);
    store.load();

    EXPECT_THROW(store.modifyTask("t1",
                                  [](deq::task::Task& t) {
                                      t.name = "after";
                                      throw std::runtime_error("boom");
                                  }),
                 std::runtime_error);
    EXPECT_EQ(store.getTask("t1")->name, "before");
}

TEST_F(JsonConfigStoreTest, SaveIndentsWithTwoSpaces) {
    JsonConfigStore store(path_);
    store.load();
    store.save();

    std::ifstream ifs(path_);
    std::string first;
    std::string second;
    std::getline(ifs, first);
    std::getline(ifs, second);
    EXPECT_EQ(first, "{");
    EXPECT_EQ(second.rfind("  \"", 0), 0u);
}

TEST_F(JsonConfigStoreTest, NotificationSettingsFromDocument) {
    writeFile(R"({"notifications": {"enabled": true,
                                    "ntfy": {"enabled": true, "topic": "lab"}}})");
    JsonConfigStore store(path_);
    store.load();

    auto settings = store.notificationSettings();
    EXPECT_TRUE(settings.enabled);
    EXPECT_TRUE(settings.ntfy.enabled);
    EXPECT_EQ(settings.ntfy.topic, "lab");
}
