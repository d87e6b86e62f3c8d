#pragma once

#include <stdexcept>
#include <string>

namespace nrt_predict {

class NrtError : public std::runtime_error {
public:
    explicit NrtError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public NrtError {
public:
    explicit ConfigError(const std::string& message)
        : NrtError("Config error: " + message) {}
};

class ValidationError : public NrtError {
public:
    explicit ValidationError(const std::string& message)
        : NrtError("Validation error: " + message) {}
};

class IOError : public NrtError {
public:
    explicit IOError(const std::string& message)
        : NrtError("I/O error: " + message) {}
};

class RasterError : public IOError {
public:
    explicit RasterError(const std::string& message)
        : IOError("Raster error: " + message) {}
};

class GeometryError : public NrtError {
public:
    explicit GeometryError(const std::string& message)
        : NrtError("Geometry error: " + message) {}
};

class ObservationError : public NrtError {
public:
    explicit ObservationError(const std::string& message)
        : NrtError("Observation error: " + message) {}
};

class UrlFormatError : public NrtError {
public:
    explicit UrlFormatError(const std::string& url)
        : NrtError("incorrect URL given: '" + url + "'") {}
};

// Raised if the SHA256 checksum of a model does not match the expected one.
class IntegrityError : public NrtError {
public:
    IntegrityError(const std::string& expected, const std::string& actual)
        : NrtError("Integrity error: expected SHA256 " + expected + ", got " + actual),
          expected_(expected), actual_(actual) {}

    const std::string& expected() const { return expected_; }
    const std::string& actual() const { return actual_; }

private:
    std::string expected_;
    std::string actual_;
};

class ModelLookupError : public NrtError {
public:
    explicit ModelLookupError(const std::string& name)
        : NrtError("Model lookup error: " + name) {}
};

class ModelError : public NrtError {
public:
    explicit ModelError(const std::string& message)
        : NrtError("Model error: " + message) {}
};

class StopRequested : public NrtError {
public:
    StopRequested() : NrtError("Stop requested by user") {}
};

} // namespace nrt_predict
