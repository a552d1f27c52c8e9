#ifndef GCU_ERRORS_HPP
#define GCU_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace gcu {

/*
 * ============================================================================
 * ERROR TAXONOMY
 * ============================================================================
 *
 *   Error
 *    ├── ConfigError      missing/invalid configuration, raised at construction
 *    ├── TransientError   recoverable; workers log it and keep polling
 *    │    ├── TransportError   serial/socket/file I/O failed
 *    │    │    └── TimeoutError    no response within the transport timeout
 *    │    └── ProtocolError    bad checksum, malformed frame or response
 *    └── FatalError       ends the worker loop / triggers controlled shutdown
 *
 * Workers only swallow TransientError (and log anything else they did not
 * expect). ConfigError and FatalError always reach a caller.
 * ============================================================================
 */

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& what) : Error(what) {}
};

class TransientError : public Error {
public:
    explicit TransientError(const std::string& what) : Error(what) {}
};

class TransportError : public TransientError {
public:
    explicit TransportError(const std::string& what) : TransientError(what) {}
};

class TimeoutError : public TransportError {
public:
    explicit TimeoutError(const std::string& what) : TransportError(what) {}
};

class ProtocolError : public TransientError {
public:
    explicit ProtocolError(const std::string& what) : TransientError(what) {}
};

class FatalError : public Error {
public:
    explicit FatalError(const std::string& what) : Error(what) {}
};

} // namespace gcu

#endif // GCU_ERRORS_HPP
