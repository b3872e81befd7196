#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace swath_sampler {

class SwathSamplerError : public std::runtime_error {
public:
    explicit SwathSamplerError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public SwathSamplerError {
public:
    explicit ConfigError(const std::string& message)
        : SwathSamplerError("Config error: " + message) {}
};

class ValidationError : public SwathSamplerError {
public:
    explicit ValidationError(const std::string& message)
        : SwathSamplerError("Validation error: " + message) {}
};

// Swath does not have the shape required for label-bearing extraction.
class ShapeError : public ValidationError {
public:
    explicit ShapeError(const std::string& message)
        : ValidationError("Shape mismatch: " + message) {}
};

class InsufficientCandidatesError : public SwathSamplerError {
public:
    InsufficientCandidatesError(size_t requested, size_t available)
        : SwathSamplerError("Insufficient cloudy candidates: requested " +
                            std::to_string(requested) + ", available " +
                            std::to_string(available)),
          requested_(requested), available_(available) {}

    size_t requested() const { return requested_; }
    size_t available() const { return available_; }

private:
    size_t requested_;
    size_t available_;
};

class IOError : public SwathSamplerError {
public:
    explicit IOError(const std::string& message)
        : SwathSamplerError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

} // namespace swath_sampler
