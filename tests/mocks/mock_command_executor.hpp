/*
 * mock_command_executor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef DEQ_TESTS_MOCK_COMMAND_EXECUTOR_HPP
#define DEQ_TESTS_MOCK_COMMAND_EXECUTOR_HPP

#include <gmock/gmock.h>

#include "command/command_executor.hpp"

namespace deq::test {

class MockCommandExecutor : public command::ICommandExecutor {
public:
    MOCK_METHOD(bool, probe, (const device::Device&), (override));
    MOCK_METHOD(std::optional<device::DeviceStats>, fetchStats,
                (const device::Device&), (override));
    MOCK_METHOD((std::map<std::string, std::string>), fetchContainerStates,
                (const device::Device&), (override));
    MOCK_METHOD(command::CommandResult, runAction,
                (const device::Device&, const std::string&,
                 command::ContainerAction),
                (override));
    MOCK_METHOD(command::SyncResult, sync,
                (const device::Device&, const std::string&,
                 const device::Device&, const std::string&,
                 const command::SyncOptions&),
                (override));
    MOCK_METHOD(command::CommandResult, wakeOnLan,
                (const std::string&, const std::string&), (override));
    MOCK_METHOD(command::CommandResult, shutdown, (const device::Device&),
                (override));
};

}  // namespace deq::test

#endif  // DEQ_TESTS_MOCK_COMMAND_EXECUTOR_HPP
