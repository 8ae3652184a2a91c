#pragma once

#include <stdexcept>
#include <string>

namespace reportd::utils {

// Report store directory missing/unreadable, or a write failed.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& msg) : std::runtime_error(msg) {}
};

// A report definition that cannot be decoded or fails validation.
class DefinitionError : public std::runtime_error {
public:
    explicit DefinitionError(const std::string& msg) : std::runtime_error(msg) {}
};

// Export job creation, status check or download failed.
class RemoteJobError : public std::runtime_error {
public:
    explicit RemoteJobError(const std::string& msg) : std::runtime_error(msg) {}
};

class ExtractionError : public std::runtime_error {
public:
    explicit ExtractionError(const std::string& msg) : std::runtime_error(msg) {}
};

class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& msg) : std::runtime_error(msg) {}
};

// Named storage configuration is unknown or incomplete.
class StorageConfigError : public StorageError {
public:
    explicit StorageConfigError(const std::string& msg) : StorageError(msg) {}
};

// Upload, link generation or authentication against the storage endpoint failed.
class StorageTransportError : public StorageError {
public:
    explicit StorageTransportError(const std::string& msg) : StorageError(msg) {}
};

}  // namespace reportd::utils
