#pragma once

#include <stdexcept>
#include <string>

namespace auditstore {

// Raised when an event or request argument falls outside its vocabulary.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string &what) : std::invalid_argument(what) {}
};

// Raised by host stores when persisting or loading fails.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string &what) : std::runtime_error(what) {}
};

} // namespace auditstore
