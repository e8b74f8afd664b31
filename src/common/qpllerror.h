// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QPLLERROR_H
#define QPLLERROR_H

#include <QString>

#include <cstdint>

/**
 * @brief Reason a PLL plan operation failed
 */
enum class QPllError : std::uint8_t {
    None,                 /**< No error */
    RangeError,           /**< Frequency outside its physical operating range */
    CapacityError,        /**< More outputs than the primitive provides */
    NoConfigurationFound, /**< Divider search exhausted without a valid set */
    InvalidState,         /**< Operation called out of order */
    ConfigError           /**< Plan configuration missing or malformed */
};

/**
 * @brief Get a printable name for an error
 * @param error Error value
 * @return Error name, e.g. "RangeError"
 */
inline QString qPllErrorName(QPllError error)
{
    switch (error) {
    case QPllError::None:
        return "None";
    case QPllError::RangeError:
        return "RangeError";
    case QPllError::CapacityError:
        return "CapacityError";
    case QPllError::NoConfigurationFound:
        return "NoConfigurationFound";
    case QPllError::InvalidState:
        return "InvalidState";
    case QPllError::ConfigError:
        return "ConfigError";
    }
    return "Unknown";
}

#endif // QPLLERROR_H
