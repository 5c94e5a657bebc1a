#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace cvpress {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Registry miss. Fatal to the render call.
class UnknownFormatError : public Error {
public:
    UnknownFormatError(const std::string& format, const std::vector<std::string>& available);

    const std::string& format() const { return format_; }

private:
    std::string format_;
};

// Only raised when RenderingConfig::strict_theme is set.
class UnknownThemeError : public Error {
public:
    UnknownThemeError(const std::string& theme, const std::vector<std::string>& available);

    const std::string& theme() const { return theme_; }

private:
    std::string theme_;
};

// A converter was present and ran, but the conversion failed.
class BackendFailureError : public Error {
public:
    using Error::Error;
};

// A format that has no fallback was requested without its toolchain.
class BackendUnavailableError : public Error {
public:
    using Error::Error;
};

class DestinationWriteError : public Error {
public:
    using Error::Error;
};

// Resume, config or template input could not be read.
class InputError : public Error {
public:
    using Error::Error;
};

std::string join_names(const std::vector<std::string>& names);

}  // namespace cvpress
