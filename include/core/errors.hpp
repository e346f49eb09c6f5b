#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Audio input unavailable or failing. Aborts the current session.
class DeviceError : public std::runtime_error {
public:
    explicit DeviceError(const std::string& msg) : std::runtime_error(msg) {}
};

// Temp file or transcript file could not be written or read.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& msg) : std::runtime_error(msg) {}
};

// The speech model failed on a given input.
class ModelError : public std::runtime_error {
public:
    explicit ModelError(const std::string& msg) : std::runtime_error(msg) {}
};

#endif
