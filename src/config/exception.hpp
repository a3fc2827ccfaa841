/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-02-15

Description: Configuration Exception Types

**************************************************/

#ifndef DEQ_CONFIG_EXCEPTION_HPP
#define DEQ_CONFIG_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace deq::config {

/**
 * @brief Base exception for configuration errors
 */
class BadConfigException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_BAD_CONFIG_EXCEPTION(...)                                    \
    throw deq::config::BadConfigException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                          ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Exception for configuration file I/O errors
 */
class ConfigIOException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_CONFIG_IO_EXCEPTION(...)                                    \
    throw deq::config::ConfigIOException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                         ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace deq::config

#endif  // DEQ_CONFIG_EXCEPTION_HPP
