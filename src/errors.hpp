#pragma once
#include <exception>
#include <stdexcept>
#include <string>

namespace middleman {

// The store operation itself failed (I/O, network, closed database).
class StoreIOError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The store answered with something that is not a cache entry.
class StoreProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A cached response could not be rebuilt from a stored value.
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Misuse at the call site: write after close, missing callbacks, bad config.
class UsageError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Human-readable text for a carried error ("" for a null pointer).
std::string error_message(const std::exception_ptr& error);

} // namespace middleman
