#pragma once

#include <stdexcept>
#include <string>

namespace mailkeep::utils {

// Persisted data exists but fails structural validation on load.
// Never auto-repaired: resetting a store is an operator decision.
class CorruptStoreError : public std::runtime_error {
public:
    CorruptStoreError(const std::string& path, const std::string& reason)
        : std::runtime_error("corrupt store " + path + ": " + reason)
        , path_(path)
        , reason_(reason) {}

    const std::string& Path() const { return path_; }
    const std::string& Reason() const { return reason_; }

private:
    std::string path_;
    std::string reason_;
};

// Writing the collection to durable storage failed; the mutation was not applied.
class StoreIOError : public std::runtime_error {
public:
    explicit StoreIOError(const std::string& msg) : std::runtime_error(msg) {}
};

class InvalidTransitionError : public std::runtime_error {
public:
    explicit InvalidTransitionError(const std::string& msg) : std::runtime_error(msg) {}
};

class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& msg) : std::runtime_error(msg) {}
};

class InvalidRecordError : public std::runtime_error {
public:
    explicit InvalidRecordError(const std::string& msg) : std::runtime_error(msg) {}
};

// One file failed during a sweep. Carried as a value in SweepReport, not thrown.
struct ArtifactIOError {
    std::string path;
    std::string reason;
};

}  // namespace mailkeep::utils
