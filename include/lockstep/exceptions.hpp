#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>

namespace lockstep {

// Base exception for all engine errors
class lockstep_exception : public std::runtime_error {
public:
    explicit lockstep_exception(const std::string& message)
        : std::runtime_error(message) {}
};

// A system failure payload the error normalizer cannot map.
// Always fatal for the run: the normalizer is out of date with the system's
// error encoding and any coercion would hide real divergences.
class normalization_exception : public lockstep_exception {
public:
    explicit normalization_exception(const std::string& message)
        : lockstep_exception("Unexpected failure: " + message) {}
};

// A collaborator broke the premises of the run (missing entity, bad handle,
// generator error). Raised before any comparison of the affected step.
class collaborator_exception : public lockstep_exception {
public:
    explicit collaborator_exception(const std::string& message)
        : lockstep_exception(message) {}
};

class missing_entity_exception : public collaborator_exception {
public:
    missing_entity_exception(const std::string& side, const std::string& handle)
        : collaborator_exception(side + " does not track auxiliary entity " + handle)
        , _side(side)
        , _handle(handle) {}

    auto get_side() const -> const std::string& { return _side; }
    auto get_handle() const -> const std::string& { return _handle; }

private:
    std::string _side;
    std::string _handle;
};

class generator_exception : public collaborator_exception {
public:
    generator_exception(std::uint64_t seed, const std::string& reason)
        : collaborator_exception("Sequence generation failed for seed " + std::to_string(seed) + ": " + reason)
        , _seed(seed) {}

    auto get_seed() const -> std::uint64_t { return _seed; }

private:
    std::uint64_t _seed;
};

// Custom entrypoint sub-variant without a dispatch while the run is configured
// to reject unsupported sub-variants
class unsupported_operation_exception : public collaborator_exception {
public:
    explicit unsupported_operation_exception(const std::string& operation)
        : collaborator_exception("No custom entrypoint dispatch for " + operation) {}
};

// Wire value that does not decode to the expected domain type
class serialization_exception : public lockstep_exception {
public:
    explicit serialization_exception(const std::string& message)
        : lockstep_exception(message) {}
};

// Exception for invalid engine, generator or run configuration
class configuration_exception : public lockstep_exception {
public:
    explicit configuration_exception(const std::string& message)
        : lockstep_exception("Invalid configuration: " + message) {}
};

} // namespace lockstep
