/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-02-15

Description: Task Exception Types

**************************************************/

#ifndef DEQ_TASK_EXCEPTION_HPP
#define DEQ_TASK_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace deq::task {

/**
 * @brief Base exception for task errors
 */
class TaskException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

/**
 * @brief A schedule whose time, weekday or day of month cannot be used
 */
class InvalidScheduleException : public TaskException {
    using TaskException::TaskException;
};

#define THROW_INVALID_SCHEDULE_EXCEPTION(...)        \
    throw deq::task::InvalidScheduleException( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace deq::task

#endif  // DEQ_TASK_EXCEPTION_HPP
