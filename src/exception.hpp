#pragma once

#include <stdexcept>
#include <string>

class NudlException : public std::runtime_error {
public:
    explicit NudlException(const std::string& message)
        : std::runtime_error(message) {}
};

// The requested version string could not be parsed.
class InvalidVersionError : public NudlException {
public:
    using NudlException::NudlException;
};

// No candidate matched the requested id, version or range.
class PackageNotFoundError : public NudlException {
public:
    using NudlException::NudlException;
};

// Network or file I/O failure while streaming a download.
class TransportError : public NudlException {
public:
    using NudlException::NudlException;
};
