/*
 * config_store.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-02-16

Description: Device and task configuration, backed by a JSON document

**************************************************/

#ifndef DEQ_CONFIG_CONFIG_STORE_HPP
#define DEQ_CONFIG_CONFIG_STORE_HPP

#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "device/device_types.hpp"
#include "notify/settings.hpp"
#include "task/task_types.hpp"

namespace deq::config {

using json = nlohmann::json;

/**
 * @brief Read access to devices and tasks, plus task persistence.
 *
 * Every getter returns a copy. Writers persist before returning and report
 * storage failures by throwing ConfigIOException.
 */
class IConfigStore {
public:
    virtual ~IConfigStore() = default;

    virtual auto getDevice(const std::string& id) const
        -> std::optional<device::Device> = 0;
    virtual auto listDevices() const -> std::vector<device::Device> = 0;

    virtual auto getTask(const std::string& id) const
        -> std::optional<task::Task> = 0;
    virtual auto listTasks() const -> std::vector<task::Task> = 0;

    /**
     * @brief Inserts @p task or replaces the task with the same id.
     */
    virtual void saveTask(const task::Task& task) = 0;

    /**
     * @brief Applies @p mutate to the stored task under the store lock and
     * persists the result. Exceptions thrown by @p mutate propagate and
     * leave the stored task unchanged.
     *
     * @return The updated task, or std::nullopt when @p id does not exist
     */
    virtual auto modifyTask(const std::string& id,
                            const std::function<void(task::Task&)>& mutate)
        -> std::optional<task::Task> = 0;

    virtual auto notificationSettings() const
        -> notify::NotificationSettings = 0;
};

/**
 * @brief IConfigStore kept in memory and mirrored to a JSON file.
 *
 * Keys the core does not understand are preserved across load/save.
 */
class JsonConfigStore : public IConfigStore {
public:
    explicit JsonConfigStore(std::filesystem::path path);

    /**
     * @brief Reads the file, or starts from defaults when it does not exist.
     *
     * Missing top-level sections are filled in and a host device is added
     * when none is marked is_host.
     *
     * @throws BadConfigException on malformed JSON
     * @throws ConfigIOException when the file cannot be read
     */
    void load();

    /**
     * @brief Writes the document atomically (temp file, then rename).
     * @throws ConfigIOException
     */
    void save();

    /**
     * @brief Copy of the whole document as it would be saved.
     */
    [[nodiscard]] auto document() const -> json;

    [[nodiscard]] auto path() const -> const std::filesystem::path& {
        return path_;
    }

    auto getDevice(const std::string& id) const
        -> std::optional<device::Device> override;
    auto listDevices() const -> std::vector<device::Device> override;
    auto getTask(const std::string& id) const
        -> std::optional<task::Task> override;
    auto listTasks() const -> std::vector<task::Task> override;
    void saveTask(const task::Task& task) override;
    auto modifyTask(const std::string& id,
                    const std::function<void(task::Task&)>& mutate)
        -> std::optional<task::Task> override;
    auto notificationSettings() const -> notify::NotificationSettings override;

    /**
     * @brief Built-in document used when no file exists.
     */
    static auto defaultDocument() -> json;

private:
    void adoptDocument(json document);
    auto serializeLocked() const -> json;
    void writeLocked();

    std::filesystem::path path_;
    mutable std::mutex mutex_;
    json document_;
    std::vector<device::Device> devices_;
    std::vector<task::Task> tasks_;
};

}  // namespace deq::config

#endif  // DEQ_CONFIG_CONFIG_STORE_HPP
