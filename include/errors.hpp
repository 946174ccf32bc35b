#pragma once

#include <stdexcept>
#include <string>

namespace vid2slides {

class Vid2SlidesError : public std::runtime_error {
public:
    explicit Vid2SlidesError(const std::string& message)
        : std::runtime_error(message) {}
};

// Bad locator, crop, time window, threshold or config file.
class ConfigError : public Vid2SlidesError {
public:
    explicit ConfigError(const std::string& message)
        : Vid2SlidesError("Config error: " + message) {}
};

// Video could not be fetched or opened.
class AcquisitionError : public Vid2SlidesError {
public:
    explicit AcquisitionError(const std::string& message)
        : Vid2SlidesError("Acquisition error: " + message) {}
};

// Decoder fault in the middle of a stream. The selector absorbs it.
class DecodeError : public Vid2SlidesError {
public:
    explicit DecodeError(const std::string& message)
        : Vid2SlidesError("Decode error: " + message) {}
};

class ArtifactError : public Vid2SlidesError {
public:
    explicit ArtifactError(const std::string& message)
        : Vid2SlidesError("Artifact error: " + message) {}
};

} // namespace vid2slides
