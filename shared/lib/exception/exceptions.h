/**
 * @file exceptions.h
 * @brief Standard Exception Hierarchy
 *
 * Fatal errors only. Recoverable outcomes (unknown format, checksum
 * mismatch, unsatisfiable constraints) are reported through typed results.
 *
 * @author SmartCore Inc.
 * @date 2026-02-04
 */

#pragma once

#include <stdexcept>
#include <string>

namespace common {

/**
 * @brief Base exception for all idforge exceptions
 */
class IdforgeException : public std::runtime_error {
public:
    explicit IdforgeException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Inconsistent format or checksum definitions
 */
class RegistryException : public IdforgeException {
public:
    explicit RegistryException(const std::string& message)
        : IdforgeException("Registry error: " + message) {}
};

/**
 * @brief Lookup of an unregistered (category, code) pair
 */
class UnknownFormatException : public IdforgeException {
public:
    explicit UnknownFormatException(const std::string& key)
        : IdforgeException("Unknown format: " + key) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public IdforgeException {
public:
    explicit ConfigException(const std::string& message)
        : IdforgeException("Configuration error: " + message) {}
};

/**
 * @brief Entropy source failure
 */
class EntropyException : public IdforgeException {
public:
    explicit EntropyException(const std::string& message)
        : IdforgeException("Entropy error: " + message) {}
};

} // namespace common
