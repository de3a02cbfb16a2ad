#pragma once
// Error taxonomy
//
// Every failure the engine surfaces is a ResonanceError. Nothing degrades
// silently: a failed embedding aborts the entity, a wrong-sized vector aborts
// the operation.

#include <cstddef>
#include <stdexcept>
#include <string>

namespace resonance {

class ResonanceError : public std::runtime_error {
public:
    explicit ResonanceError(const std::string& what) : std::runtime_error(what) {}
};

// Embedding provider failed, timed out or was cancelled
class EncodingUnavailable : public ResonanceError {
public:
    explicit EncodingUnavailable(const std::string& what)
        : ResonanceError("encoding unavailable: " + what) {}
};

// Bit length or dense length disagrees with the configured dimension
class DimensionMismatch : public ResonanceError {
public:
    explicit DimensionMismatch(const std::string& what)
        : ResonanceError("dimension mismatch: " + what) {}

    DimensionMismatch(const std::string& what, size_t expected, size_t actual)
        : ResonanceError("dimension mismatch: " + what + " (expected " +
                         std::to_string(expected) + ", got " +
                         std::to_string(actual) + ")") {}
};

// Same bit length, different projection seed: the bits mean different things
class ProjectionMismatch : public DimensionMismatch {
public:
    explicit ProjectionMismatch(const std::string& what)
        : DimensionMismatch("projection " + what) {}
};

class EmptyBundleInput : public ResonanceError {
public:
    EmptyBundleInput() : ResonanceError("bundle requires at least one hypervector") {}
};

// Writer lock not obtained in time. Retry the write, not the pipeline.
class IndexWriteConflict : public ResonanceError {
public:
    explicit IndexWriteConflict(const std::string& what)
        : ResonanceError("index write conflict: " + what) {}
};

class EntityNotFound : public ResonanceError {
public:
    explicit EntityNotFound(const std::string& entity_id)
        : ResonanceError("entity not found: " + entity_id), entity_id_(entity_id) {}

    const std::string& entity_id() const { return entity_id_; }

private:
    std::string entity_id_;
};

class DuplicateEntity : public ResonanceError {
public:
    explicit DuplicateEntity(const std::string& entity_id)
        : ResonanceError("entity already indexed: " + entity_id), entity_id_(entity_id) {}

    const std::string& entity_id() const { return entity_id_; }

private:
    std::string entity_id_;
};

class ConfigError : public ResonanceError {
public:
    explicit ConfigError(const std::string& what)
        : ResonanceError("config: " + what) {}
};

class SnapshotFormatError : public ResonanceError {
public:
    explicit SnapshotFormatError(const std::string& what)
        : ResonanceError("snapshot: " + what) {}
};

} // namespace resonance
