// File: src/core/errors.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace stocklens {

/// Referenced item or category does not exist
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& what) : std::runtime_error(what) {}
};

/// Invalid numeric operation (negative square root, division by zero)
class ArithmeticError : public std::domain_error {
public:
    explicit ArithmeticError(const std::string& what) : std::domain_error(what) {}
};

/// Storage backend could not be opened or initialized
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

/// One failed element of a batch or all-pairs sweep
struct BatchFailure {
    /// Offending item id, or "<id>-<id>" for an item pair
    std::string id;
    std::string message;
};

} // namespace stocklens
