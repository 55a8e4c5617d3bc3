#pragma once

#include <stdexcept>
#include <string>

namespace normxcorr {

class NormXCorrError : public std::runtime_error {
public:
    explicit NormXCorrError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public NormXCorrError {
public:
    explicit ConfigError(const std::string& message)
        : NormXCorrError("Config error: " + message) {}
};

class ValidationError : public NormXCorrError {
public:
    explicit ValidationError(const std::string& message)
        : NormXCorrError("Validation error: " + message) {}
};

class IOError : public NormXCorrError {
public:
    explicit IOError(const std::string& message)
        : NormXCorrError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

// Template does not fit inside the search raster.
class DimensionError : public NormXCorrError {
public:
    explicit DimensionError(const std::string& message)
        : NormXCorrError("Dimension error: " + message) {}
};

// Zero-area raster or surface.
class EmptyInputError : public NormXCorrError {
public:
    explicit EmptyInputError(const std::string& message)
        : NormXCorrError("Empty input: " + message) {}
};

class TransformError : public NormXCorrError {
public:
    explicit TransformError(const std::string& message)
        : NormXCorrError("Transform error: " + message) {}
};

} // namespace normxcorr
