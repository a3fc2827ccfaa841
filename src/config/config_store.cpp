/*
 * config_store.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "config_store.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "exception.hpp"

namespace deq::config {

namespace {

auto defaultHostDevice() -> json {
    return json{{"id", "host"},
                {"name", "DeQ Host"},
                {"ip", "localhost"},
                {"icon", "cpu"},
                {"is_host", true}};
}

auto parseDevices(const json& list) -> std::vector<device::Device> {
    std::vector<device::Device> devices;
    if (!list.is_array()) {
        return devices;
    }
    for (const auto& entry : list) {
        try {
            devices.push_back(entry.get<device::Device>());
        } catch (const json::exception& e) {
            spdlog::warn("Skipping malformed device entry: {}", e.what());
        }
    }
    return devices;
}

auto parseTasks(const json& list) -> std::vector<task::Task> {
    std::vector<task::Task> tasks;
    if (!list.is_array()) {
        return tasks;
    }
    for (const auto& entry : list) {
        try {
            tasks.push_back(entry.get<task::Task>());
        } catch (const json::exception& e) {
            spdlog::warn("Skipping malformed task entry: {}", e.what());
        }
    }
    return tasks;
}

}  // namespace

JsonConfigStore::JsonConfigStore(std::filesystem::path path)
    : path_(std::move(path)) {
    adoptDocument(defaultDocument());
}

auto JsonConfigStore::defaultDocument() -> json {
    return json{
        {"devices", json::array()},
        {"tasks", json::array()},
        {"notifications",
         json{{"enabled", false},
              {"ntfy", json{{"enabled", false},
                            {"server", "https://ntfy.sh"},
                            {"topic", ""},
                            {"token", ""}}},
              {"discord", json{{"enabled", false}, {"webhook_url", ""}}},
              {"slack", json{{"enabled", false}, {"webhook_url", ""}}},
              {"webhook", json{{"enabled", false},
                               {"url", ""},
                               {"headers", json::object()}}},
              {"alerts", json{{"device_offline", true},
                              {"container_stopped", true},
                              {"high_cpu", true},
                              {"high_memory", true},
                              {"high_disk", true}}}}}};
}

void JsonConfigStore::load() {
    json document;
    std::error_code ec;
    if (std::filesystem::exists(path_, ec)) {
        std::ifstream ifs(path_);
        if (!ifs) {
            THROW_CONFIG_IO_EXCEPTION("Failed to open config file: " +
                                      path_.string());
        }
        try {
            document = json::parse(ifs);
        } catch (const json::parse_error& e) {
            THROW_BAD_CONFIG_EXCEPTION("Malformed config file " +
                                       path_.string() + ": " + e.what());
        }
        if (!document.is_object()) {
            THROW_BAD_CONFIG_EXCEPTION("Config root must be an object: " +
                                       path_.string());
        }
        spdlog::info("Config loaded from file: {}", path_.string());
    } else {
        spdlog::warn("Config file {} not found, using defaults",
                     path_.string());
        document = defaultDocument();
    }

    for (const auto& [key, value] : defaultDocument().items()) {
        if (!document.contains(key)) {
            document[key] = value;
        }
    }
    if (!document["devices"].is_array()) {
        document["devices"] = json::array();
    }

    auto& devices = document["devices"];
    bool hostExists = std::any_of(devices.begin(), devices.end(),
                                  [](const json& d) {
                                      return d.is_object() &&
                                             d.value("is_host", false);
                                  });
    if (!hostExists) {
        devices.insert(devices.begin(), defaultHostDevice());
        spdlog::info("Added default host device");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    adoptDocument(std::move(document));
    spdlog::info("{} device(s), {} task(s) configured", devices_.size(),
                 tasks_.size());
}

void JsonConfigStore::adoptDocument(json document) {
    devices_ = parseDevices(document["devices"]);
    tasks_ = parseTasks(document.value("tasks", json::array()));
    document_ = std::move(document);
}

auto JsonConfigStore::serializeLocked() const -> json {
    json document = document_;
    json tasks = json::array();
    for (const auto& task : tasks_) {
        tasks.push_back(task);
    }
    document["tasks"] = std::move(tasks);
    return document;
}

void JsonConfigStore::writeLocked() {
    const auto content = serializeLocked().dump(2);

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }

    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::trunc);
        if (!ofs) {
            THROW_CONFIG_IO_EXCEPTION("Failed to open " + tmp.string() +
                                      " for writing");
        }
        ofs << content;
        ofs.flush();
        if (!ofs) {
            THROW_CONFIG_IO_EXCEPTION("Failed to write " + tmp.string());
        }
    }

    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        THROW_CONFIG_IO_EXCEPTION("Failed to replace " + path_.string());
    }
    spdlog::debug("Config saved to {}", path_.string());
}

void JsonConfigStore::save() {
    std::lock_guard<std::mutex> lock(mutex_);
    writeLocked();
}

auto JsonConfigStore::document() const -> json {
    std::lock_guard<std::mutex> lock(mutex_);
    return serializeLocked();
}

auto JsonConfigStore::getDevice(const std::string& id) const
    -> std::optional<device::Device> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(devices_.begin(), devices_.end(),
                           [&](const device::Device& d) { return d.id == id; });
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return *it;
}

auto JsonConfigStore::listDevices() const -> std::vector<device::Device> {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_;
}

auto JsonConfigStore::getTask(const std::string& id) const
    -> std::optional<task::Task> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [&](const task::Task& t) { return t.id == id; });
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return *it;
}

auto JsonConfigStore::listTasks() const -> std::vector<task::Task> {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_;
}

void JsonConfigStore::saveTask(const task::Task& task) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [&](const task::Task& t) { return t.id == task.id; });
    if (it == tasks_.end()) {
        tasks_.push_back(task);
    } else {
        *it = task;
    }
    writeLocked();
}

auto JsonConfigStore::modifyTask(const std::string& id,
                                 const std::function<void(task::Task&)>& mutate)
    -> std::optional<task::Task> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [&](const task::Task& t) { return t.id == id; });
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    // A throwing mutation leaves the stored task untouched.
    task::Task updated = *it;
    mutate(updated);
    *it = std::move(updated);
    writeLocked();
    return *it;
}

auto JsonConfigStore::notificationSettings() const
    -> notify::NotificationSettings {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = document_.find("notifications");
    if (it == document_.end() || !it->is_object()) {
        return {};
    }
    return it->get<notify::NotificationSettings>();
}

}  // namespace deq::config
