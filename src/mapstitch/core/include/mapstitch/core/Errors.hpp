#pragma once

#include <stdexcept>
#include <string>

namespace mapstitch {

/// Root of everything the combiner throws on purpose.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/* Bad input that can be rejected before any expensive work:
   missing directories, invalid zoom, unknown world, malformed options. */
class ConfigError : public Error {
public:
    using Error::Error;
};

/* The input was well-formed but the data does not allow a map to be built,
   e.g. no tiles for the world/zoom, or a tile file that cannot be decoded. */
class CombineError : public Error {
public:
    using Error::Error;
};

/// A state the combiner should never reach. Not the user's fault.
class InternalError : public Error {
public:
    explicit InternalError(const std::string& what)
        : Error(what + " This is likely a bug; please report it together with the log above.") {}
};

} // namespace mapstitch
