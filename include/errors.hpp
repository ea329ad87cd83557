#pragma once

#include <stdexcept>
#include <string>

// Device, file or URL could not be acquired. Fatal; surfaced at open().
class SourceUnavailable : public std::runtime_error {
public:
    explicit SourceUnavailable(const std::string& what) : std::runtime_error(what) {}
};

// A network source dropped mid-stream. Absorbed by ReconnectingStreamReader.
class ConnectionLost : public std::runtime_error {
public:
    explicit ConnectionLost(const std::string& what) : std::runtime_error(what) {}
};

// Malformed descriptor or unresolvable reference. Fatal at construction.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// A finite source was read after it reported its end.
class EndOfStream : public std::runtime_error {
public:
    explicit EndOfStream(const std::string& what) : std::runtime_error(what) {}
};
