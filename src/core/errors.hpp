#pragma once

#include <stdexcept>
#include <string>

namespace verirag {

// Base class of every failure the pipeline reports to its callers.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Infrastructure failures. These are surfaced as request failures, never
// folded into a refusal.
class EmbeddingUnavailable : public Error {
public:
    using Error::Error;
};

class GenerationUnavailable : public Error {
public:
    using Error::Error;
};

class IndexUnavailable : public Error {
public:
    using Error::Error;
};

class RegistryUnavailable : public Error {
public:
    using Error::Error;
};

class StorageUnavailable : public Error {
public:
    using Error::Error;
};

// Caller mistakes.
class InvalidVersionFilter : public Error {
public:
    using Error::Error;
};

class InvalidRequest : public Error {
public:
    using Error::Error;
};

inline bool is_infrastructure_error(const std::exception& ex) {
    return dynamic_cast<const EmbeddingUnavailable*>(&ex) != nullptr ||
           dynamic_cast<const GenerationUnavailable*>(&ex) != nullptr ||
           dynamic_cast<const IndexUnavailable*>(&ex) != nullptr ||
           dynamic_cast<const RegistryUnavailable*>(&ex) != nullptr ||
           dynamic_cast<const StorageUnavailable*>(&ex) != nullptr;
}

}  // namespace verirag
